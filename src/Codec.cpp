/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "bluesky_kafka/Exception.hpp"
#include "bluesky_kafka/Codec.hpp"
#include "MsgPackCodec.hpp"
#include "JsonCodec.hpp"
#include "CborCodec.hpp"
#include <fmt/format.h>

namespace bluesky_kafka {

Codec::Codec()
: self(std::make_shared<MsgPackCodec>()) {}

Codec::Codec(const std::shared_ptr<CodecInterface>& impl)
: self(impl) {}

Codec::Codec(const Codec&) = default;
Codec::Codec(Codec&&) = default;
Codec& Codec::operator=(const Codec&) = default;
Codec& Codec::operator=(Codec&&) = default;
Codec::~Codec() = default;

Codec::operator bool() const {
    return static_cast<bool>(self);
}

std::string Codec::name() const {
    return self->name();
}

std::vector<char> Codec::encode(const nlohmann::json& document) const {
    return self->encode(document);
}

nlohmann::json Codec::decode(std::string_view bytes) const {
    try {
        return self->decode(bytes);
    } catch(const DecodeError&) {
        throw;
    } catch(const std::exception& ex) {
        throw DecodeError{fmt::format(
            "Codec \"{}\" could not decode payload: {}", self->name(), ex.what())};
    }
}

BLUESKY_KAFKA_REGISTER_CODEC(msgpack, MsgPackCodec);
BLUESKY_KAFKA_REGISTER_CODEC(json, JsonCodec);
BLUESKY_KAFKA_REGISTER_CODEC(cbor, CborCodec);

Codec Codec::FromName(const std::string& type) {
    if(type.empty()) return Codec{};
    std::shared_ptr<CodecInterface> c = CodecFactory::create(type);
    return Codec(std::move(c));
}

}
