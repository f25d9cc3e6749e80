/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_MESSAGE_HPP
#define BLUESKY_KAFKA_MESSAGE_HPP

#include <bluesky_kafka/ForwardDcl.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bluesky_kafka {

/**
 * @brief Error reported by the broker client, either attached
 * to a polled message or to a delivery report.
 */
struct BrokerError {
    int         code = 0;
    std::string reason;
};

/**
 * @brief Where a produced message ended up (or was supposed to).
 */
struct MessageMetadata {
    std::string                topic;
    int32_t                    partition = -1;
    int64_t                    offset = -1;
    std::optional<std::string> key;
};

/**
 * @brief A message as returned by a consumer client's poll().
 * If error is set, the other fields may not be meaningful
 * and value must not be decoded.
 */
struct Message {
    std::string                topic;
    int32_t                    partition = -1;
    int64_t                    offset = -1;
    std::optional<std::string> key;
    std::vector<char>          value;
    std::optional<BrokerError> error;
};

}

#endif
