/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_KAFKA_PRODUCER_CLIENT_IMPL_H
#define BLUESKY_KAFKA_KAFKA_PRODUCER_CLIENT_IMPL_H

#include "bluesky_kafka/BrokerClient.hpp"
#include "bluesky_kafka/Config.hpp"
#include "bluesky_kafka/Logging.hpp"

#include <librdkafka/rdkafka.h>
#include <memory>
#include <string>

namespace bluesky_kafka {

class KafkaProducerClient : public ProducerClientInterface {

    public:

    Logger                      m_logger;
    std::shared_ptr<rd_kafka_t> m_kafka_producer;

    KafkaProducerClient(const Config& config, Logger logger);

    ~KafkaProducerClient();

    void produce(const std::string& topic,
                 const std::optional<std::string>& key,
                 std::vector<char> value,
                 DeliveryCallback on_delivery) override;

    int poll(std::chrono::milliseconds timeout) override;

    bool flush(std::chrono::milliseconds timeout) override;

    ClusterMetadata clusterMetadata(const std::string& topic,
                                    std::chrono::milliseconds timeout) override;
};

}

#endif
