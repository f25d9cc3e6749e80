/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "bluesky_kafka/BasicConsumer.hpp"
#include "bluesky_kafka/Exception.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <limits>

namespace bluesky_kafka {

/* Stops the consumer when the polling loop is left by an exception.
 * On a normal exit, the guard is dismissed and the consumer is
 * stopped explicitly so that errors from closing can propagate. */
class StopOnExit {

    public:

    explicit StopOnExit(BasicConsumer& consumer, const Logger& logger)
    : m_consumer(consumer)
    , m_logger(logger) {}

    StopOnExit(const StopOnExit&) = delete;
    StopOnExit& operator=(const StopOnExit&) = delete;

    ~StopOnExit() {
        if(m_dismissed) return;
        try {
            m_consumer.stop();
        } catch(const std::exception& ex) {
            m_logger->error(
                "[bluesky_kafka:consumer] Error while stopping consumer after a failure: {}",
                ex.what());
        }
    }

    void dismiss() {
        m_dismissed = true;
    }

    private:

    BasicConsumer& m_consumer;
    const Logger&  m_logger;
    bool           m_dismissed = false;
};

BasicConsumer::BasicConsumer(
        std::vector<std::string> topics,
        std::vector<std::string> bootstrap_servers,
        std::optional<std::string> group_id,
        Config consumer_config,
        MessageHandler process_message,
        std::chrono::milliseconds polling_duration,
        Codec codec,
        Logger logger,
        ConsumerClientFactory client_factory)
: m_topics(std::move(topics))
, m_config(std::move(consumer_config))
, m_process_message(std::move(process_message))
, m_polling_duration(polling_duration)
, m_codec(std::move(codec))
, m_logger(logger ? std::move(logger) : defaultLogger())
{
    if(m_topics.empty())
        throw Exception{"Consumer should subscribe to at least one topic"};
    if(!m_codec)
        throw Exception{"Invalid Codec passed to consumer"};
    if(m_polling_duration.count() < 0)
        throw Exception{"Consumer polling duration should not be negative"};
    if(m_polling_duration.count() > std::numeric_limits<int>::max())
        throw Exception{fmt::format(
            "Consumer polling duration should not exceed {} ms",
            std::numeric_limits<int>::max())};

    m_config.set("bootstrap.servers",
                 Config::MergeBootstrapServers(bootstrap_servers, m_config));
    m_config.setDefault("auto.offset.reset", "latest");
    if(group_id)
        m_config.set("group.id", *group_id);

    m_logger->info("[bluesky_kafka:consumer] Starting consumer with Kafka configuration: {}",
                   m_config.toString());
    m_logger->info("[bluesky_kafka:consumer] Subscribing to Kafka topic(s): {}",
                   fmt::join(m_topics, ", "));

    m_client = client_factory(m_config, m_logger);
    if(!m_client)
        throw Exception{"Consumer client factory returned a null client"};
    m_client->subscribe(m_topics);
}

BasicConsumer::~BasicConsumer() {
    if(m_state == State::Stopped) return;
    try {
        stop();
    } catch(const std::exception& ex) {
        m_logger->error("[bluesky_kafka:consumer] Error while stopping consumer: {}", ex.what());
    }
}

void BasicConsumer::start(ContinuePolling continue_polling) {
    if(m_state == State::Stopped) {
        throw AlreadyStoppedError{fmt::format(
            "This consumer has already been started and stopped. "
            "Create a fresh instance of {}", toString())};
    }
    if(m_state == State::Running) {
        throw Exception{"This consumer's polling loop is already running"};
    }
    m_state = State::Running;
    StopOnExit guard{*this, m_logger};
    pollLoop(continue_polling);
    guard.dismiss();
    stop();
}

void BasicConsumer::pollLoop(const ContinuePolling& continue_polling) {
    while(m_state == State::Running) {
        auto msg = m_client->poll(m_polling_duration);
        if(!msg) {
            // no message, the predicate is only evaluated after handled messages
            continue;
        }
        if(msg->error) {
            m_logger->error("[bluesky_kafka:consumer] Kafka consumer error: {}",
                            msg->error->reason);
            continue;
        }
        auto message = m_codec.decode(msg->value);
        m_logger->debug("[bluesky_kafka:consumer] Decoded message from topic {} [partition {}, offset {}]",
                        msg->topic, msg->partition, msg->offset);
        processMessage(msg->topic, message);
        if(m_state != State::Running) break;
        if(continue_polling && !continue_polling()) break;
    }
}

void BasicConsumer::processMessage(const std::string& topic, const nlohmann::json& message) {
    if(m_process_message)
        m_process_message(*this, topic, message);
}

void BasicConsumer::stop() {
    if(m_state == State::Stopped) return;
    m_state = State::Stopped;
    m_logger->debug("[bluesky_kafka:consumer] Closing consumer of topic(s) {}",
                    fmt::join(m_topics, ", "));
    m_client->close();
}

std::string BasicConsumer::describe(const char* type) const {
    return fmt::format(
        "{}(topics=[{}], state={}, consumer_config='{}')",
        type, fmt::join(m_topics, ", "), to_string(m_state), m_config.toString());
}

std::string BasicConsumer::toString() const {
    return describe("BasicConsumer");
}

std::string to_string(BasicConsumer::State state) {
    switch(state) {
        case BasicConsumer::State::Created: return "Created";
        case BasicConsumer::State::Running: return "Running";
        case BasicConsumer::State::Stopped: return "Stopped";
    }
    return "Unknown";
}

}
