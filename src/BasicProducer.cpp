/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "bluesky_kafka/BasicProducer.hpp"
#include "bluesky_kafka/Exception.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace bluesky_kafka {

BasicProducer::BasicProducer(
        std::string topic,
        std::vector<std::string> bootstrap_servers,
        std::optional<std::string> key,
        Config producer_config,
        DeliveryCallback on_delivery,
        Codec codec,
        Logger logger,
        ProducerClientFactory client_factory)
: m_topic(std::move(topic))
, m_bootstrap_servers(std::move(bootstrap_servers))
, m_key(std::move(key))
, m_config(std::move(producer_config))
, m_on_delivery(std::move(on_delivery))
, m_codec(std::move(codec))
, m_logger(logger ? std::move(logger) : defaultLogger())
{
    if(m_topic.empty())
        throw Exception{"Producer topic should not be empty"};
    if(!m_codec)
        throw Exception{"Invalid Codec passed to producer"};

    m_config.set("bootstrap.servers",
                 Config::MergeBootstrapServers(m_bootstrap_servers, m_config));
    if(!m_on_delivery)
        m_on_delivery = loggingDeliveryReport(m_logger);

    m_logger->debug("[bluesky_kafka:producer] Producer configuration: {}", m_config.toString());

    m_client = client_factory(m_config, m_logger);
    if(!m_client)
        throw Exception{"Producer client factory returned a null client"};
}

void BasicProducer::produce(const nlohmann::json& message) {
    if(m_logger->should_log(spdlog::level::debug)) {
        m_logger->debug(
            "[bluesky_kafka:producer] Producing message to topic '{}' with key '{}': {}",
            m_topic, m_key.value_or(""), toDisplayString(message));
    }
    produceBytes(m_codec.encode(message), m_key);
}

void BasicProducer::produceBytes(std::vector<char> bytes, const std::optional<std::string>& key) {
    m_client->produce(m_topic, key, std::move(bytes), m_on_delivery);
    // serve delivery reports of earlier messages
    m_client->poll(std::chrono::milliseconds{0});
}

void BasicProducer::flush(std::chrono::milliseconds timeout) {
    m_logger->debug("[bluesky_kafka:producer] Flushing producer for topic '{}' and key '{}'",
                    m_topic, m_key.value_or(""));
    if(!m_client->flush(timeout)) {
        throw Exception{fmt::format(
            "Timed out after {} ms while flushing messages to topic \"{}\"",
            timeout.count(), m_topic)};
    }
}

ClusterMetadata BasicProducer::clusterMetadata(std::chrono::milliseconds timeout) {
    return m_client->clusterMetadata(m_topic, timeout);
}

std::string BasicProducer::describe(const char* type) const {
    return fmt::format(
        "{}(topic='{}', key='{}', bootstrap_servers='{}', producer_config='{}')",
        type, m_topic, m_key.value_or("None"),
        fmt::join(m_bootstrap_servers, ","), m_config.toString());
}

std::string BasicProducer::toString() const {
    return describe("BasicProducer");
}

}
