/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_TESTS_FAKE_CLIENTS_HPP
#define BLUESKY_KAFKA_TESTS_FAKE_CLIENTS_HPP

#include <bluesky_kafka/BasicConsumer.hpp>
#include <bluesky_kafka/BasicProducer.hpp>
#include <bluesky_kafka/BrokerClient.hpp>
#include <bluesky_kafka/Codec.hpp>
#include <bluesky_kafka/Exception.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Thrown by FakeConsumerClient::poll when the scripted results run out,
 * so that a test with a wrong predicate fails instead of hanging.
 */
struct ScriptExhausted : public std::runtime_error {
    ScriptExhausted()
    : std::runtime_error("FakeConsumerClient ran out of scripted poll results") {}
};

struct FakeConsumerClient : public bluesky_kafka::ConsumerClientInterface {

    std::deque<std::optional<bluesky_kafka::Message>> m_script;
    std::vector<std::string>                          m_subscribed;
    std::vector<std::chrono::milliseconds>            m_poll_timeouts;
    size_t                                            m_num_polls = 0;
    size_t                                            m_num_closes = 0;
    size_t                                            m_polls_after_close = 0;

    void subscribe(const std::vector<std::string>& topics) override {
        m_subscribed = topics;
    }

    std::optional<bluesky_kafka::Message> poll(std::chrono::milliseconds timeout) override {
        m_num_polls += 1;
        m_poll_timeouts.push_back(timeout);
        if(m_num_closes) m_polls_after_close += 1;
        if(m_script.empty()) throw ScriptExhausted{};
        auto result = std::move(m_script.front());
        m_script.pop_front();
        return result;
    }

    void close() override {
        m_num_closes += 1;
    }

    void pushNothing(size_t count = 1) {
        for(size_t i = 0; i < count; ++i)
            m_script.push_back(std::nullopt);
    }

    void pushValue(const std::string& topic, const nlohmann::json& value,
                   const bluesky_kafka::Codec& codec = bluesky_kafka::Codec{}) {
        pushBytes(topic, codec.encode(value));
    }

    void pushBytes(const std::string& topic, std::vector<char> bytes) {
        bluesky_kafka::Message msg;
        msg.topic     = topic;
        msg.partition = 0;
        msg.offset    = static_cast<int64_t>(m_script.size());
        msg.value     = std::move(bytes);
        m_script.push_back(std::move(msg));
    }

    void pushError(const std::string& topic, const std::string& reason,
                   std::vector<char> bytes = {}) {
        bluesky_kafka::Message msg;
        msg.topic = topic;
        msg.value = std::move(bytes);
        msg.error = bluesky_kafka::BrokerError{-191, reason};
        m_script.push_back(std::move(msg));
    }

    bluesky_kafka::ConsumerClientFactory factory() {
        return factory(m_last_config);
    }

    bluesky_kafka::ConsumerClientFactory factory(bluesky_kafka::Config& captured_config) {
        auto self = std::shared_ptr<FakeConsumerClient>{this, [](FakeConsumerClient*){}};
        return [self, &captured_config](const bluesky_kafka::Config& config, bluesky_kafka::Logger) {
            captured_config = config;
            return std::static_pointer_cast<bluesky_kafka::ConsumerClientInterface>(self);
        };
    }

    bluesky_kafka::Config m_last_config;
};

struct FakeProducerClient : public bluesky_kafka::ProducerClientInterface {

    struct Produced {
        std::string                     topic;
        std::optional<std::string>      key;
        std::vector<char>               value;
        bluesky_kafka::DeliveryCallback on_delivery;
    };

    std::vector<Produced>                    m_produced;
    size_t                                   m_num_delivered = 0;
    size_t                                   m_num_polls = 0;
    size_t                                   m_num_flushes = 0;
    bool                                     m_flush_result = true;
    std::optional<bluesky_kafka::BrokerError> m_delivery_error;
    std::string                              m_metadata_topic;

    void produce(const std::string& topic,
                 const std::optional<std::string>& key,
                 std::vector<char> value,
                 bluesky_kafka::DeliveryCallback on_delivery) override {
        m_produced.push_back(Produced{topic, key, std::move(value), std::move(on_delivery)});
    }

    int poll(std::chrono::milliseconds timeout) override {
        (void)timeout;
        m_num_polls += 1;
        return deliver();
    }

    bool flush(std::chrono::milliseconds timeout) override {
        (void)timeout;
        m_num_flushes += 1;
        if(!m_flush_result) return false;
        deliver();
        return true;
    }

    bluesky_kafka::ClusterMetadata clusterMetadata(const std::string& topic,
                                                   std::chrono::milliseconds timeout) override {
        (void)timeout;
        m_metadata_topic = topic;
        bluesky_kafka::ClusterMetadata metadata;
        metadata.brokers.push_back(bluesky_kafka::BrokerMetadata{1, "localhost", 9092});
        bluesky_kafka::TopicMetadata t;
        t.name = topic;
        t.partitions.push_back(bluesky_kafka::PartitionMetadata{0, 1, {1}, {1}, std::nullopt});
        metadata.topics.push_back(t);
        return metadata;
    }

    int deliver() {
        int count = 0;
        for(; m_num_delivered < m_produced.size(); ++m_num_delivered, ++count) {
            auto& p = m_produced[m_num_delivered];
            bluesky_kafka::MessageMetadata metadata;
            metadata.topic     = p.topic;
            metadata.partition = 0;
            metadata.offset    = static_cast<int64_t>(m_num_delivered);
            metadata.key       = p.key;
            if(p.on_delivery) p.on_delivery(m_delivery_error, metadata);
        }
        return count;
    }

    bluesky_kafka::ProducerClientFactory factory() {
        return factory(m_last_config);
    }

    bluesky_kafka::ProducerClientFactory factory(bluesky_kafka::Config& captured_config) {
        auto self = std::shared_ptr<FakeProducerClient>{this, [](FakeProducerClient*){}};
        return [self, &captured_config](const bluesky_kafka::Config& config, bluesky_kafka::Logger) {
            captured_config = config;
            return std::static_pointer_cast<bluesky_kafka::ProducerClientInterface>(self);
        };
    }

    bluesky_kafka::Config m_last_config;
};

/**
 * Logger keeping its last messages in memory.
 */
struct CapturingLogger {

    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> m_sink;
    std::shared_ptr<spdlog::logger>                    m_logger;

    CapturingLogger()
    : m_sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256))
    , m_logger(std::make_shared<spdlog::logger>("capture", m_sink)) {
        m_logger->set_level(spdlog::level::trace);
        m_logger->set_pattern("%l %v");
    }

    bool contains(const std::string& text) const {
        for(auto& line : m_sink->last_formatted()) {
            if(line.find(text) != std::string::npos) return true;
        }
        return false;
    }
};

#endif
