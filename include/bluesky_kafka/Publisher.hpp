/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_PUBLISHER_HPP
#define BLUESKY_KAFKA_PUBLISHER_HPP

#include <bluesky_kafka/ForwardDcl.hpp>
#include <bluesky_kafka/BasicProducer.hpp>

#include <optional>
#include <string>

namespace bluesky_kafka {

/**
 * @brief A Publisher is a callback that publishes (name, document)
 * pairs emitted by a run engine to a Kafka topic. Each pair is encoded
 * as the two-element array [name, document].
 *
 * Unless the provided configuration says otherwise, the underlying
 * producer is idempotent ("enable.idempotence" is "true").
 *
 * Example:
 *
 * @code
 * bluesky_kafka::Publisher publisher{"my.topic", "localhost:9092", "my-key"};
 * publisher("start", {{"uid", "abc"}});
 * publisher.flush();
 * @endcode
 */
class Publisher : public BasicProducer {

    public:

    /**
     * @brief Constructor.
     *
     * @param topic Topic to which all documents will be published.
     * @param bootstrap_servers Comma-separated list of broker addresses.
     * @param key Default key of the published messages.
     * @param producer_config librdkafka properties.
     * @param on_delivery Delivery report callback.
     * @param flush_on_stop_doc Whether to flush after publishing a "stop" document.
     * @param codec Codec used to encode documents.
     * @param logger Logger used by this publisher.
     * @param client_factory Function creating the broker client.
     */
    Publisher(std::string topic,
              const std::string& bootstrap_servers,
              std::optional<std::string> key = std::nullopt,
              Config producer_config = Config{},
              DeliveryCallback on_delivery = DeliveryCallback{},
              bool flush_on_stop_doc = false,
              Codec codec = Codec{},
              Logger logger = defaultLogger(),
              ProducerClientFactory client_factory = makeKafkaProducerClient);

    /**
     * @brief Publish a document with the Publisher's default key.
     */
    void publish(const std::string& name, const nlohmann::json& document);

    /**
     * @brief Publish a document with the given key, which replaces
     * the Publisher's default key for this document only.
     */
    void publish(const std::string& name, const nlohmann::json& document,
                 const std::optional<std::string>& key);

    void operator()(const std::string& name, const nlohmann::json& document) {
        publish(name, document);
    }

    void operator()(const std::string& name, const nlohmann::json& document,
                    const std::optional<std::string>& key) {
        publish(name, document, key);
    }

    bool flushOnStopDoc() const {
        return m_flush_on_stop_doc;
    }

    std::string toString() const override;

    private:

    bool m_flush_on_stop_doc;
};

}

#endif
