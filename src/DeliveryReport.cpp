/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "bluesky_kafka/DeliveryReport.hpp"

namespace bluesky_kafka {

DeliveryCallback loggingDeliveryReport(Logger logger) {
    return [logger=std::move(logger)](const std::optional<BrokerError>& error,
                                      const MessageMetadata& message) {
        if(error) {
            logger->error("[bluesky_kafka:producer] Message delivery to topic {} failed: {}",
                          message.topic, error->reason);
        } else {
            logger->debug("[bluesky_kafka:producer] Message delivered to topic {} [partition {}]",
                          message.topic, message.partition);
        }
    };
}

}
