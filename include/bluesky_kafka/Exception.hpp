/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_EXCEPTION_HPP
#define BLUESKY_KAFKA_EXCEPTION_HPP

#include <bluesky_kafka/ForwardDcl.hpp>

#include <exception>
#include <stdexcept>
#include <string>

namespace bluesky_kafka {

class Exception : public std::logic_error {

    public:

    Exception(const Exception&) = default;

    Exception(Exception&&) = default;

    Exception& operator=(const Exception&) = default;

    Exception& operator=(Exception&&) = default;

    Exception(const char* w)
    : std::logic_error(w) {}

    Exception(const std::string& w)
    : std::logic_error(w) {}
};

/**
 * @brief Thrown when a message payload cannot be turned back
 * into a document by a Codec. A consumer receiving such a payload
 * stops and lets this exception escape from its start() function.
 */
class DecodeError : public Exception {

    public:

    DecodeError(const char* w)
    : Exception(w) {}

    DecodeError(const std::string& w)
    : Exception(w) {}
};

/**
 * @brief Thrown by start() when called on a consumer that
 * has already been stopped. Consumers are single-use.
 */
class AlreadyStoppedError : public Exception {

    public:

    AlreadyStoppedError(const char* w)
    : Exception(w) {}

    AlreadyStoppedError(const std::string& w)
    : Exception(w) {}
};

}

#endif
