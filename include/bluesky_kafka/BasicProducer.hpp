/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_BASIC_PRODUCER_HPP
#define BLUESKY_KAFKA_BASIC_PRODUCER_HPP

#include <bluesky_kafka/ForwardDcl.hpp>
#include <bluesky_kafka/BrokerClient.hpp>
#include <bluesky_kafka/ClusterMetadata.hpp>
#include <bluesky_kafka/Codec.hpp>
#include <bluesky_kafka/Config.hpp>
#include <bluesky_kafka/DeliveryReport.hpp>
#include <bluesky_kafka/Exception.hpp>
#include <bluesky_kafka/Json.hpp>
#include <bluesky_kafka/Logging.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bluesky_kafka {

/**
 * @brief Function used by producers to create their broker client
 * from their effective configuration.
 */
using ProducerClientFactory = std::function<
    std::shared_ptr<ProducerClientInterface>(const Config&, Logger)>;

/**
 * @brief A BasicProducer sends arbitrary JSON-like messages to a
 * single topic, encoding them with a Codec (MessagePack by default).
 *
 * There is no default configuration. A reasonable production
 * configuration is Kafka's idempotent producer ("enable.idempotence"
 * set to "true"), which means that acknowledgements are only sent once
 * all replicas have the message, that delivery is retried indefinitely,
 * and that message order is kept across retries.
 */
class BasicProducer {

    public:

    /**
     * @brief Constructor.
     *
     * @param topic Topic to which all messages will be published.
     * @param bootstrap_servers Kafka broker addresses (e.g. "127.0.0.1:9092").
     * If producer_config also contains "bootstrap.servers", both lists
     * are combined, these ones first.
     * @param key Key attached to every message. Messages sharing a key keep
     * their relative order; std::nullopt imposes no ordering.
     * @param producer_config librdkafka properties for the underlying producer.
     * @param on_delivery Function called once per message with its delivery
     * outcome. Defaults to logging the outcome.
     * @param codec Codec used to encode messages.
     * @param logger Logger used by this producer.
     * @param client_factory Function creating the broker client.
     */
    BasicProducer(std::string topic,
                  std::vector<std::string> bootstrap_servers,
                  std::optional<std::string> key = std::nullopt,
                  Config producer_config = Config{},
                  DeliveryCallback on_delivery = DeliveryCallback{},
                  Codec codec = Codec{},
                  Logger logger = defaultLogger(),
                  ProducerClientFactory client_factory = makeKafkaProducerClient);

    BasicProducer(const BasicProducer&) = delete;
    BasicProducer& operator=(const BasicProducer&) = delete;

    virtual ~BasicProducer() = default;

    const std::string& topic() const {
        return m_topic;
    }

    const std::optional<std::string>& key() const {
        return m_key;
    }

    const std::vector<std::string>& bootstrapServers() const {
        return m_bootstrap_servers;
    }

    /**
     * @brief Effective configuration of the underlying producer,
     * credentials included. Use toString() for display purposes.
     */
    const Config& config() const {
        return m_config;
    }

    const Codec& codec() const {
        return m_codec;
    }

    /**
     * @brief Encode the message and enqueue it for delivery to the
     * producer's topic. This does not wait for the acknowledgement;
     * delivery callbacks of previously sent messages are served.
     *
     * @param message Message to send.
     */
    void produce(const nlohmann::json& message);

    /**
     * @brief Block until all the enqueued messages have been delivered
     * or have failed, serving their delivery callbacks.
     *
     * @param timeout Maximum time to wait. Throws an Exception if
     * messages are still outstanding when it expires.
     */
    void flush(std::chrono::milliseconds timeout = InfiniteTimeout);

    /**
     * @brief Return information about the Kafka cluster and this
     * producer's topic.
     *
     * @param timeout Maximum time to wait for the brokers to answer.
     */
    ClusterMetadata clusterMetadata(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Human-readable description of the producer,
     * with credentials masked.
     */
    virtual std::string toString() const;

    protected:

    void produceBytes(std::vector<char> bytes, const std::optional<std::string>& key);

    std::string describe(const char* type) const;

    const Logger& logger() const {
        return m_logger;
    }

    private:

    std::string                              m_topic;
    std::vector<std::string>                 m_bootstrap_servers;
    std::optional<std::string>               m_key;
    Config                                   m_config;
    DeliveryCallback                         m_on_delivery;
    Codec                                    m_codec;
    Logger                                   m_logger;
    std::shared_ptr<ProducerClientInterface> m_client;
};

}

#endif
