/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_REMOTE_DISPATCHER_HPP
#define BLUESKY_KAFKA_REMOTE_DISPATCHER_HPP

#include <bluesky_kafka/ForwardDcl.hpp>
#include <bluesky_kafka/DocumentConsumer.hpp>
#include <bluesky_kafka/DocumentName.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>

namespace bluesky_kafka {

/**
 * @brief A RemoteDispatcher dispatches documents received from Kafka
 * to any number of subscribed callbacks, in the order of subscription.
 * Documents whose name is not a known DocumentName end the polling
 * loop with a DecodeError.
 *
 * Example:
 *
 * @code
 * bluesky_kafka::RemoteDispatcher dispatcher{{"my.topic"}, {"localhost:9092"}, "my-group"};
 * dispatcher.subscribe([](bluesky_kafka::DocumentName name, const nlohmann::json& doc) {
 *     std::cout << name << " " << doc << std::endl;
 * });
 * dispatcher.start(); // runs until stopped or interrupted by an error
 * @endcode
 */
class RemoteDispatcher : public DocumentConsumer {

    public:

    using Callback = std::function<void(DocumentName name, const nlohmann::json& document)>;
    using Token = std::size_t;

    /**
     * @brief Constructor.
     *
     * @see BasicConsumer::BasicConsumer
     */
    RemoteDispatcher(std::vector<std::string> topics,
                     std::vector<std::string> bootstrap_servers,
                     std::optional<std::string> group_id = std::nullopt,
                     Config consumer_config = Config{},
                     std::chrono::milliseconds polling_duration = DefaultPollingDuration,
                     Codec codec = Codec{},
                     Logger logger = defaultLogger(),
                     ConsumerClientFactory client_factory = makeKafkaConsumerClient);

    /**
     * @brief Register a callback.
     *
     * @param callback Function to call with documents.
     * @param name If provided, only documents with this name are passed
     * to the callback.
     *
     * @return a token to pass to unsubscribe().
     */
    Token subscribe(Callback callback, std::optional<DocumentName> name = std::nullopt);

    /**
     * @brief Remove a callback. Unknown tokens are ignored.
     */
    void unsubscribe(Token token);

    std::size_t numSubscribers() const {
        return m_callbacks.size();
    }

    std::string toString() const override;

    protected:

    void processDocument(const std::string& topic,
                         const std::string& name,
                         const nlohmann::json& document) override;

    private:

    struct Subscription {
        Callback                    callback;
        std::optional<DocumentName> name;
    };

    std::map<Token, Subscription> m_callbacks;
    Token                         m_next_token = 0;
};

}

#endif
