/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_CBOR_CODEC_H
#define BLUESKY_KAFKA_CBOR_CODEC_H

#include "bluesky_kafka/Codec.hpp"
#include "bluesky_kafka/Json.hpp"
#include <fmt/format.h>

namespace bluesky_kafka {

class CborCodec : public CodecInterface {

    public:

    std::string name() const override {
        return "cbor";
    }

    std::vector<char> encode(const nlohmann::json& document) const override {
        std::vector<char> bytes;
        nlohmann::json::to_cbor(document, bytes);
        return bytes;
    }

    nlohmann::json decode(std::string_view bytes) const override {
        try {
            return nlohmann::json::from_cbor(bytes.begin(), bytes.end());
        } catch(const nlohmann::json::exception& ex) {
            throw DecodeError{fmt::format("Could not decode CBOR payload: {}", ex.what())};
        }
    }

    static std::unique_ptr<CodecInterface> create() {
        return std::make_unique<CborCodec>();
    }
};

}

#endif
