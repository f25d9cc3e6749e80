/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_KAFKA_CONSUMER_CLIENT_IMPL_H
#define BLUESKY_KAFKA_KAFKA_CONSUMER_CLIENT_IMPL_H

#include "bluesky_kafka/BrokerClient.hpp"
#include "bluesky_kafka/Config.hpp"
#include "bluesky_kafka/Logging.hpp"

#include <librdkafka/rdkafka.h>
#include <memory>
#include <string>
#include <vector>

namespace bluesky_kafka {

class KafkaConsumerClient : public ConsumerClientInterface {

    public:

    Logger                      m_logger;
    std::shared_ptr<rd_kafka_t> m_kafka_consumer;
    bool                        m_closed = false;

    KafkaConsumerClient(const Config& config, Logger logger);

    ~KafkaConsumerClient();

    void subscribe(const std::vector<std::string>& topics) override;

    std::optional<Message> poll(std::chrono::milliseconds timeout) override;

    void close() override;
};

}

#endif
