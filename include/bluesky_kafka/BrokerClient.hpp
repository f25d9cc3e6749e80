/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_BROKER_CLIENT_HPP
#define BLUESKY_KAFKA_BROKER_CLIENT_HPP

#include <bluesky_kafka/ForwardDcl.hpp>
#include <bluesky_kafka/ClusterMetadata.hpp>
#include <bluesky_kafka/Config.hpp>
#include <bluesky_kafka/DeliveryReport.hpp>
#include <bluesky_kafka/Logging.hpp>
#include <bluesky_kafka/Message.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bluesky_kafka {

/**
 * @brief Timeout value meaning "wait forever".
 */
inline constexpr std::chrono::milliseconds InfiniteTimeout{-1};

/**
 * @brief Interface for the producing side of a broker client.
 * Each instance owns its connection to the brokers.
 */
class ProducerClientInterface {

    public:

    /**
     * @brief Destructor.
     */
    virtual ~ProducerClientInterface() = default;

    /**
     * @brief Enqueue a message for asynchronous delivery.
     * This function does not wait for the message to be acknowledged.
     *
     * @param topic Topic to send the message to.
     * @param key Optional key (messages with the same key keep their order).
     * @param value Payload of the message.
     * @param on_delivery Function called with the outcome of the delivery.
     */
    virtual void produce(const std::string& topic,
                         const std::optional<std::string>& key,
                         std::vector<char> value,
                         DeliveryCallback on_delivery) = 0;

    /**
     * @brief Serve pending delivery callbacks.
     *
     * @param timeout Maximum time to wait for an event.
     *
     * @return the number of events served.
     */
    virtual int poll(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Wait until all enqueued messages have been delivered
     * (or have failed), serving their delivery callbacks.
     *
     * @param timeout Maximum time to wait.
     *
     * @return false if the timeout expired with messages outstanding.
     */
    virtual bool flush(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Retrieve metadata about the cluster and the given topic.
     */
    virtual ClusterMetadata clusterMetadata(const std::string& topic,
                                            std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Interface for the consuming side of a broker client.
 * Each instance owns its connection to the brokers.
 */
class ConsumerClientInterface {

    public:

    /**
     * @brief Destructor.
     */
    virtual ~ConsumerClientInterface() = default;

    /**
     * @brief Subscribe to the given topics.
     */
    virtual void subscribe(const std::vector<std::string>& topics) = 0;

    /**
     * @brief Wait up to timeout for a message.
     *
     * @return the message, or std::nullopt if none arrived in time.
     * A returned message may carry an error instead of a payload.
     */
    virtual std::optional<Message> poll(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Leave the consumer group and release the connection.
     */
    virtual void close() = 0;
};

/**
 * @brief Create a ProducerClientInterface backed by librdkafka.
 *
 * @param config librdkafka properties ("bootstrap.servers" is required).
 * @param logger Logger receiving librdkafka's own log messages.
 */
std::shared_ptr<ProducerClientInterface> makeKafkaProducerClient(
        const Config& config, Logger logger = defaultLogger());

/**
 * @brief Create a ConsumerClientInterface backed by librdkafka.
 *
 * @param config librdkafka properties ("bootstrap.servers" and
 * "group.id" are required).
 * @param logger Logger receiving librdkafka's own log messages.
 */
std::shared_ptr<ConsumerClientInterface> makeKafkaConsumerClient(
        const Config& config, Logger logger = defaultLogger());

}

#endif
