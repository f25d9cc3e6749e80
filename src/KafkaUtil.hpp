/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_KAFKA_UTIL_H
#define BLUESKY_KAFKA_KAFKA_UTIL_H

#include "bluesky_kafka/Config.hpp"
#include "bluesky_kafka/Exception.hpp"
#include "bluesky_kafka/Message.hpp"
#include "Logging.hpp"

#include <librdkafka/rdkafka.h>
#include <chrono>
#include <limits>
#include <memory>
#include <string>

namespace bluesky_kafka {

/**
 * @brief Create a librdkafka configuration logging to the given
 * logger and holding all the properties of config. The caller owns
 * the returned object (until it is passed to rd_kafka_new).
 */
static inline rd_kafka_conf_t* makeKafkaConf(const Config& config, spdlog::logger* logger) {
    auto kconf = rd_kafka_conf_new();
    setupLogging(kconf, logger);
    char errstr[512];
    for(auto& p : config) {
        auto ret = rd_kafka_conf_set(kconf,
                p.first.c_str(), p.second.c_str(),
                errstr, sizeof(errstr));
        if (ret != RD_KAFKA_CONF_OK) {
            rd_kafka_conf_destroy(kconf);
            throw Exception{"Could not set option \"" + p.first + "\": " + errstr};
        }
    }
    return kconf;
}

/**
 * @brief Create an rd_kafka_t from the configuration, taking
 * ownership of kconf.
 */
static inline std::shared_ptr<rd_kafka_t> makeKafkaHandle(rd_kafka_type_t type, rd_kafka_conf_t* kconf) {
    char errstr[512];
    auto rk = rd_kafka_new(type, kconf, errstr, sizeof(errstr));
    if (!rk) {
        rd_kafka_conf_destroy(kconf);
        throw Exception{std::string{"Could not create Kafka "}
                        + (type == RD_KAFKA_PRODUCER ? "producer" : "consumer")
                        + ": " + errstr};
    }
    return std::shared_ptr<rd_kafka_t>{rk, rd_kafka_destroy};
}

/**
 * @brief Convert a timeout into librdkafka's int milliseconds. Negative
 * values mean "wait forever" (-1); larger values saturate at INT_MAX.
 */
static inline int toKafkaTimeout(std::chrono::milliseconds timeout) {
    if(timeout.count() < 0) return -1;
    if(timeout.count() > std::numeric_limits<int>::max())
        return std::numeric_limits<int>::max();
    return static_cast<int>(timeout.count());
}

static inline BrokerError makeBrokerError(rd_kafka_resp_err_t err) {
    return BrokerError{static_cast<int>(err), rd_kafka_err2str(err)};
}

static inline std::string topicNameOf(const rd_kafka_message_t* msg) {
    if(!msg->rkt) return std::string{};
    return std::string{rd_kafka_topic_name(msg->rkt)};
}

static inline std::optional<std::string> keyOf(const rd_kafka_message_t* msg) {
    if(!msg->key) return std::nullopt;
    return std::string{static_cast<const char*>(msg->key), msg->key_len};
}

}

#endif
