/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "bluesky_kafka/RemoteDispatcher.hpp"
#include "bluesky_kafka/Exception.hpp"

#include <fmt/format.h>
#include <utility>
#include <vector>

namespace bluesky_kafka {

RemoteDispatcher::RemoteDispatcher(
        std::vector<std::string> topics,
        std::vector<std::string> bootstrap_servers,
        std::optional<std::string> group_id,
        Config consumer_config,
        std::chrono::milliseconds polling_duration,
        Codec codec,
        Logger logger,
        ConsumerClientFactory client_factory)
: DocumentConsumer(std::move(topics),
                   std::move(bootstrap_servers),
                   std::move(group_id),
                   std::move(consumer_config),
                   DocumentHandler{},
                   polling_duration,
                   std::move(codec),
                   std::move(logger),
                   std::move(client_factory))
{}

RemoteDispatcher::Token RemoteDispatcher::subscribe(Callback callback, std::optional<DocumentName> name) {
    if(!callback)
        throw Exception{"Cannot subscribe an empty callback to a RemoteDispatcher"};
    auto token = m_next_token++;
    m_callbacks.emplace(token, Subscription{std::move(callback), name});
    return token;
}

void RemoteDispatcher::unsubscribe(Token token) {
    m_callbacks.erase(token);
}

void RemoteDispatcher::processDocument(const std::string& topic,
                                       const std::string& name,
                                       const nlohmann::json& document) {
    auto document_name = parseDocumentName(name);
    if(!document_name) {
        throw DecodeError{fmt::format(
            "Unknown document name \"{}\" in message from topic \"{}\"", name, topic)};
    }
    /* callbacks may subscribe or unsubscribe while being called;
     * tokens are never reused, so a removed one is skipped */
    std::vector<std::pair<Token, Callback>> targets;
    for(auto& p : m_callbacks) {
        if(!p.second.name || *p.second.name == *document_name)
            targets.emplace_back(p.first, p.second.callback);
    }
    for(auto& target : targets) {
        if(m_callbacks.count(target.first) == 0) continue;
        target.second(*document_name, document);
    }
}

std::string RemoteDispatcher::toString() const {
    return describe("RemoteDispatcher");
}

}
