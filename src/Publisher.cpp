/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "bluesky_kafka/Publisher.hpp"
#include "bluesky_kafka/Exception.hpp"

namespace bluesky_kafka {

static Config withPublisherDefaults(Config config) {
    config.setDefault("enable.idempotence", "true");
    return config;
}

Publisher::Publisher(
        std::string topic,
        const std::string& bootstrap_servers,
        std::optional<std::string> key,
        Config producer_config,
        DeliveryCallback on_delivery,
        bool flush_on_stop_doc,
        Codec codec,
        Logger logger,
        ProducerClientFactory client_factory)
: BasicProducer(std::move(topic),
                Config::SplitList(bootstrap_servers),
                std::move(key),
                withPublisherDefaults(std::move(producer_config)),
                std::move(on_delivery),
                std::move(codec),
                std::move(logger),
                std::move(client_factory))
, m_flush_on_stop_doc(flush_on_stop_doc)
{}

void Publisher::publish(const std::string& name, const nlohmann::json& document) {
    publish(name, document, this->key());
}

void Publisher::publish(const std::string& name, const nlohmann::json& document,
                        const std::optional<std::string>& key) {
    if(logger()->should_log(spdlog::level::debug)) {
        logger()->debug(
            "[bluesky_kafka:publisher] Publishing to topic '{}' with key '{}': name={} doc={}",
            topic(), key.value_or(""), name, toDisplayString(document));
    }
    produceBytes(codec().encode(nlohmann::json::array({name, document})), key);
    if(m_flush_on_stop_doc && name == "stop")
        flush();
}

std::string Publisher::toString() const {
    return describe("Publisher");
}

}
