/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "bluesky_kafka/DocumentConsumer.hpp"
#include "bluesky_kafka/Exception.hpp"

#include <fmt/format.h>

namespace bluesky_kafka {

DocumentConsumer::DocumentConsumer(
        std::vector<std::string> topics,
        std::vector<std::string> bootstrap_servers,
        std::optional<std::string> group_id,
        Config consumer_config,
        DocumentHandler process_document,
        std::chrono::milliseconds polling_duration,
        Codec codec,
        Logger logger,
        ConsumerClientFactory client_factory)
: BasicConsumer(std::move(topics),
                std::move(bootstrap_servers),
                std::move(group_id),
                std::move(consumer_config),
                MessageHandler{},
                polling_duration,
                std::move(codec),
                std::move(logger),
                std::move(client_factory))
, m_process_document(std::move(process_document))
{}

void DocumentConsumer::processMessage(const std::string& topic, const nlohmann::json& message) {
    if(!message.is_array() || message.size() != 2 || !message[0].is_string()) {
        throw DecodeError{fmt::format(
            "Message from topic \"{}\" is not a [name, document] pair", topic)};
    }
    const auto& name = message[0].get_ref<const std::string&>();
    const auto& document = message[1];
    if(logger()->should_log(spdlog::level::debug)) {
        logger()->debug(
            "[bluesky_kafka:consumer] Decoded document from topic {}: name={} doc={}",
            topic, name, toDisplayString(document));
    }
    processDocument(topic, name, document);
}

void DocumentConsumer::processDocument(const std::string& topic,
                                       const std::string& name,
                                       const nlohmann::json& document) {
    if(m_process_document)
        m_process_document(*this, topic, name, document);
}

std::string DocumentConsumer::toString() const {
    return describe("DocumentConsumer");
}

}
