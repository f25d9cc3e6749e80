/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef __BLUESKY_KAFKA_LOGGING_H
#define __BLUESKY_KAFKA_LOGGING_H

#include "bluesky_kafka/Logging.hpp"
#include <librdkafka/rdkafka.h>

namespace bluesky_kafka {

/**
 * @brief Route librdkafka's log messages to the given spdlog logger.
 * The logger is installed as the opaque pointer of the configuration,
 * so it must outlive any rd_kafka_t created from it. The "log_level"
 * property is set from the logger's current level (it can still be
 * overridden afterwards).
 */
void setupLogging(rd_kafka_conf_t* conf, spdlog::logger* logger);

/**
 * @brief Returns the logger installed by setupLogging on the
 * configuration used to create rk (never null).
 */
spdlog::logger* loggerOf(const rd_kafka_t* rk);

} // namespace bluesky_kafka

#endif
