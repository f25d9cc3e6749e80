/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_LOGGING_HPP
#define BLUESKY_KAFKA_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <memory>

namespace bluesky_kafka {

using Logger = std::shared_ptr<spdlog::logger>;

/**
 * @brief Returns the process-wide "bluesky_kafka" logger, creating
 * and registering it with spdlog on first use. Producers and consumers
 * use it when they are not given a logger explicitly.
 */
Logger defaultLogger();

}

#endif
