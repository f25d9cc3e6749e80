/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "Logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace bluesky_kafka {

Logger defaultLogger() {
    static Logger logger = [](){
        auto existing = spdlog::get("bluesky_kafka");
        if(existing) return existing;
        auto created = spdlog::stderr_color_mt("bluesky_kafka");
        created->set_level(spdlog::get_level());
        return created;
    }();
    return logger;
}

spdlog::logger* loggerOf(const rd_kafka_t* rk) {
    auto logger = static_cast<spdlog::logger*>(rd_kafka_opaque(rk));
    if(!logger) return defaultLogger().get();
    return logger;
}

/* librdkafka uses syslog(3) levels */
static void rdkafka_log(const rd_kafka_t* rk, int level, const char* fac, const char* buf) {
    auto logger = loggerOf(rk);
    switch(level) {
        case 0: case 1: case 2:
            logger->critical("[bluesky_kafka:rdkafka] {}: {}", fac, buf); break;
        case 3:
            logger->error("[bluesky_kafka:rdkafka] {}: {}", fac, buf); break;
        case 4:
            logger->warn("[bluesky_kafka:rdkafka] {}: {}", fac, buf); break;
        case 5: case 6:
            logger->info("[bluesky_kafka:rdkafka] {}: {}", fac, buf); break;
        default:
            logger->debug("[bluesky_kafka:rdkafka] {}: {}", fac, buf); break;
    }
}

void setupLogging(rd_kafka_conf_t* conf, spdlog::logger* logger) {

    rd_kafka_conf_set_opaque(conf, logger);
    rd_kafka_conf_set_log_cb(conf, rdkafka_log);

    const char* log_level = "2";
    switch(logger ? logger->level() : spdlog::get_level()) {
        case spdlog::level::trace:    log_level = "7"; break;
        case spdlog::level::debug:    log_level = "7"; break;
        case spdlog::level::info:     log_level = "6"; break;
        case spdlog::level::warn:     log_level = "4"; break;
        case spdlog::level::err:      log_level = "3"; break;
        case spdlog::level::critical: log_level = "2"; break;
        default:                      log_level = "0"; break;
    }
    rd_kafka_conf_set(conf, "log_level", log_level, nullptr, 0);
}

} // namespace bluesky_kafka
