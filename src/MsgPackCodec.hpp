/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_MSGPACK_CODEC_H
#define BLUESKY_KAFKA_MSGPACK_CODEC_H

#include "bluesky_kafka/Codec.hpp"
#include "bluesky_kafka/Json.hpp"
#include <fmt/format.h>

namespace bluesky_kafka {

class MsgPackCodec : public CodecInterface {

    public:

    std::string name() const override {
        return "msgpack";
    }

    std::vector<char> encode(const nlohmann::json& document) const override {
        std::vector<char> bytes;
        nlohmann::json::to_msgpack(document, bytes);
        return bytes;
    }

    nlohmann::json decode(std::string_view bytes) const override {
        try {
            return nlohmann::json::from_msgpack(bytes.begin(), bytes.end());
        } catch(const nlohmann::json::exception& ex) {
            throw DecodeError{fmt::format("Could not decode MessagePack payload: {}", ex.what())};
        }
    }

    static std::unique_ptr<CodecInterface> create() {
        return std::make_unique<MsgPackCodec>();
    }
};

}

#endif
