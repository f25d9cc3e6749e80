/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_DOCUMENT_NAME_HPP
#define BLUESKY_KAFKA_DOCUMENT_NAME_HPP

#include <bluesky_kafka/ForwardDcl.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace bluesky_kafka {

/**
 * @brief Names of the documents emitted by a run engine.
 */
enum class DocumentName {
    Start,
    Descriptor,
    Event,
    Stop,
    Resource,
    Datum,
    EventPage,
    DatumPage
};

/**
 * @brief Name of the document as it appears in messages ("start", "event_page", ...).
 */
std::string to_string(DocumentName name);

/**
 * @brief Parse a document name, returning std::nullopt if it is unknown.
 */
std::optional<DocumentName> parseDocumentName(std::string_view name);

/**
 * @brief Parse a document name, throwing an Exception if it is unknown.
 */
DocumentName documentNameFromString(std::string_view name);

inline std::ostream& operator<<(std::ostream& os, DocumentName name) {
    return os << to_string(name);
}

}

#endif
