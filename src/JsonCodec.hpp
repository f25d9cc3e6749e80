/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_JSON_CODEC_H
#define BLUESKY_KAFKA_JSON_CODEC_H

#include "bluesky_kafka/Codec.hpp"
#include "bluesky_kafka/Json.hpp"
#include <fmt/format.h>

namespace bluesky_kafka {

class JsonCodec : public CodecInterface {

    public:

    std::string name() const override {
        return "json";
    }

    std::vector<char> encode(const nlohmann::json& document) const override {
        std::string str;
        try {
            str = document.dump();
        } catch(const nlohmann::json::exception& ex) {
            throw Exception{fmt::format("Could not encode document as JSON: {}", ex.what())};
        }
        return std::vector<char>{str.begin(), str.end()};
    }

    nlohmann::json decode(std::string_view bytes) const override {
        try {
            return nlohmann::json::parse(bytes.begin(), bytes.end());
        } catch(const nlohmann::json::exception& ex) {
            throw DecodeError{fmt::format("Could not decode JSON payload: {}", ex.what())};
        }
    }

    static std::unique_ptr<CodecInterface> create() {
        return std::make_unique<JsonCodec>();
    }
};

}

#endif
