/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "bluesky_kafka/DocumentName.hpp"
#include "bluesky_kafka/Exception.hpp"

#include <array>
#include <utility>

namespace bluesky_kafka {

static const std::array<std::pair<DocumentName, std::string_view>, 8> documentNames = {{
    {DocumentName::Start,      "start"},
    {DocumentName::Descriptor, "descriptor"},
    {DocumentName::Event,      "event"},
    {DocumentName::Stop,       "stop"},
    {DocumentName::Resource,   "resource"},
    {DocumentName::Datum,      "datum"},
    {DocumentName::EventPage,  "event_page"},
    {DocumentName::DatumPage,  "datum_page"}
}};

std::string to_string(DocumentName name) {
    for(auto& p : documentNames) {
        if(p.first == name) return std::string{p.second};
    }
    return "unknown";
}

std::optional<DocumentName> parseDocumentName(std::string_view name) {
    for(auto& p : documentNames) {
        if(p.second == name) return p.first;
    }
    return std::nullopt;
}

DocumentName documentNameFromString(std::string_view name) {
    auto result = parseDocumentName(name);
    if(!result)
        throw Exception{"Unknown document name \"" + std::string{name} + "\""};
    return *result;
}

}
