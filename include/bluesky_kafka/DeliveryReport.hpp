/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_DELIVERY_REPORT_HPP
#define BLUESKY_KAFKA_DELIVERY_REPORT_HPP

#include <bluesky_kafka/ForwardDcl.hpp>
#include <bluesky_kafka/Message.hpp>
#include <bluesky_kafka/Logging.hpp>

#include <functional>
#include <optional>

namespace bluesky_kafka {

/**
 * @brief Called once for each produced message, when the message
 * has been delivered or when its delivery failed permanently.
 * It is invoked from within ProducerClientInterface::poll() or
 * ProducerClientInterface::flush(), never from produce().
 */
using DeliveryCallback = std::function<void(const std::optional<BrokerError>& error,
                                            const MessageMetadata& message)>;

/**
 * @brief Delivery callback logging failures as errors and
 * successful deliveries as debug messages, to the given logger.
 */
DeliveryCallback loggingDeliveryReport(Logger logger);

}

#endif
