/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_JSON_HPP
#define BLUESKY_KAFKA_JSON_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace bluesky_kafka {

/**
 * @brief Compact rendering of a document for logs and terminals.
 * Strings that are not valid UTF-8 are rendered with replacement
 * characters instead of throwing.
 */
inline std::string toDisplayString(const nlohmann::json& document) {
    return document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}

#endif
