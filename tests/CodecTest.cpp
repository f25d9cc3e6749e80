/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_all.hpp>
#include <bluesky_kafka/Codec.hpp>
#include <bluesky_kafka/Exception.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace {

class ThrowingCodec : public bluesky_kafka::CodecInterface {

    public:

    std::string name() const override {
        return "throwing";
    }

    std::vector<char> encode(const nlohmann::json& document) const override {
        auto str = document.dump();
        return {str.begin(), str.end()};
    }

    nlohmann::json decode(std::string_view bytes) const override {
        (void)bytes;
        throw std::runtime_error("not today");
    }
};

}

TEST_CASE("Codec test", "[codec]") {

    spdlog::set_level(spdlog::level::from_str("error"));

    auto document = nlohmann::json{
        {"uid", "6c1e7a0e-5e3f-4a1c-9a5e-3b2a3c1d0e9f"},
        {"time", 1617125612.5},
        {"scan_id", 42},
        {"detectors", {"det1", "det2"}},
        {"hints", {{"dimensions", nlohmann::json::array({
            nlohmann::json::array({nlohmann::json::array({"motor"}), "primary"})})}}},
        {"sample", nullptr},
        {"simulated", true}
    };

    SECTION("Default codec is MessagePack") {
        bluesky_kafka::Codec codec;
        REQUIRE(static_cast<bool>(codec));
        REQUIRE(codec.name() == "msgpack");
    }

    SECTION("Built-in codecs round-trip a document") {
        for(auto type : {"msgpack", "json", "cbor"}) {
            INFO("codec: " << type);
            bluesky_kafka::Codec codec;
            REQUIRE_NOTHROW(codec = bluesky_kafka::Codec::FromName(type));
            REQUIRE(codec.name() == type);
            auto bytes = codec.encode(document);
            REQUIRE(!bytes.empty());
            REQUIRE(codec.decode(bytes) == document);
        }
    }

    SECTION("Truncated payloads raise DecodeError") {
        for(auto type : {"msgpack", "json", "cbor"}) {
            INFO("codec: " << type);
            auto codec = bluesky_kafka::Codec::FromName(type);
            auto bytes = codec.encode(document);
            bytes.resize(bytes.size() - 2);
            REQUIRE_THROWS_AS(codec.decode(bytes), bluesky_kafka::DecodeError);
        }
    }

    SECTION("MessagePack codec reads (name, document) tuples packed by other clients") {
        // msgpack.packb(("start", {"uid": "abc"}))
        const std::vector<char> packed = {
            '\x92', '\xa5', 's', 't', 'a', 'r', 't',
            '\x81', '\xa3', 'u', 'i', 'd', '\xa3', 'a', 'b', 'c'
        };
        bluesky_kafka::Codec codec;
        auto decoded = codec.decode(packed);
        REQUIRE(decoded.is_array());
        REQUIRE(decoded.size() == 2);
        REQUIRE(decoded[0] == "start");
        REQUIRE(decoded[1]["uid"] == "abc");
        REQUIRE(codec.encode(decoded) == packed);
    }

    SECTION("Strings that are not valid UTF-8") {
        auto odd = nlohmann::json{{"s", std::string{"\xff"}}};
        bluesky_kafka::Codec msgpack;
        REQUIRE(msgpack.decode(msgpack.encode(odd)) == odd);
        REQUIRE(bluesky_kafka::toDisplayString(odd).find("\"s\"") != std::string::npos);
        // JSON text cannot carry them
        auto json = bluesky_kafka::Codec::FromName("json");
        REQUIRE_THROWS_AS(json.encode(odd), bluesky_kafka::Exception);
    }

    SECTION("Exceptions from custom codecs become DecodeError") {
        bluesky_kafka::Codec codec{std::make_shared<ThrowingCodec>()};
        auto bytes = codec.encode(document);
        REQUIRE_THROWS_AS(codec.decode(bytes), bluesky_kafka::DecodeError);
    }

    SECTION("Built-in codecs are registered") {
        auto names = bluesky_kafka::CodecFactory::names();
        for(auto type : {"msgpack", "json", "cbor"}) {
            INFO("codec: " << type);
            REQUIRE(std::find(names.begin(), names.end(), type) != names.end());
            REQUIRE(bluesky_kafka::CodecFactory::contains(type));
        }
        REQUIRE(!bluesky_kafka::CodecFactory::contains("pickle"));
    }

    SECTION("Unknown codec names are rejected") {
        REQUIRE_THROWS_AS(bluesky_kafka::Codec::FromName("pickle"), bluesky_kafka::Exception);
    }
}
