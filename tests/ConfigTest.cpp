/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_all.hpp>
#include <bluesky_kafka/Config.hpp>
#include <bluesky_kafka/Exception.hpp>
#include <cstdio>
#include <fstream>

namespace {

/* Config file written for the duration of a test. */
struct ScratchFile {

    std::string path;

    ScratchFile(std::string p, const std::string& content)
    : path(std::move(p)) {
        std::ofstream{path} << content;
    }

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    ~ScratchFile() {
        std::remove(path.c_str());
    }
};

}

TEST_CASE("Config test", "[config]") {

    SECTION("Build a Config from JSON") {
        auto json = nlohmann::json{
            {"bootstrap.servers", "localhost:9092"},
            {"enable.idempotence", false},
            {"acks", 1},
            {"request.timeout.ms", 5000}
        };
        bluesky_kafka::Config config(json);
        REQUIRE(config.size() == 4);
        REQUIRE(config.get("bootstrap.servers") == "localhost:9092");
        REQUIRE(config.get("enable.idempotence") == "false");
        REQUIRE(config.get("acks") == "1");
        REQUIRE(config.get("request.timeout.ms") == "5000");
        REQUIRE(!config.get("group.id").has_value());
        REQUIRE(config.json()["acks"] == "1");

        REQUIRE_THROWS_AS(bluesky_kafka::Config(nlohmann::json::array()), bluesky_kafka::Exception);
        REQUIRE_THROWS_AS(bluesky_kafka::Config(nlohmann::json{{"acks", {1, 2}}}),
                          bluesky_kafka::Exception);
    }

    SECTION("setDefault does not overwrite") {
        bluesky_kafka::Config config{{"auto.offset.reset", "earliest"}};
        config.setDefault("auto.offset.reset", "latest");
        config.setDefault("group.id", "g");
        REQUIRE(config.get("auto.offset.reset") == "earliest");
        REQUIRE(config.get("group.id") == "g");
    }

    SECTION("Bootstrap servers are combined, explicit servers first") {
        bluesky_kafka::Config config{{"bootstrap.servers", "5.6.7.8:9092"}};
        REQUIRE(bluesky_kafka::Config::MergeBootstrapServers({"1.2.3.4:9092"}, config)
                == "1.2.3.4:9092,5.6.7.8:9092");
        REQUIRE(bluesky_kafka::Config::MergeBootstrapServers({"a:1", "b:2"}, bluesky_kafka::Config{})
                == "a:1,b:2");
        REQUIRE(bluesky_kafka::Config::MergeBootstrapServers({}, config) == "5.6.7.8:9092");
        REQUIRE(bluesky_kafka::Config::SplitList("a:1,,b:2,") == std::vector<std::string>{"a:1", "b:2"});
    }

    SECTION("Credentials are masked") {
        bluesky_kafka::Config config{
            {"security.protocol", "SASL_PLAINTEXT"},
            {"sasl.mechanisms", "PLAIN"},
            {"sasl.username", "user"},
            {"sasl.password", "PASSWORD"},
            {"ssl.key.password", "KEYPASSWORD"},
            {"bootstrap.servers", "localhost:9092"}
        };
        auto str = config.toString();
        REQUIRE(str.find("PASSWORD") == std::string::npos);
        REQUIRE(str.find("sasl.password") != std::string::npos);
        REQUIRE(str.find("ssl.key.password") != std::string::npos);
        REQUIRE(str.find("****") != std::string::npos);
        REQUIRE(str.find("PLAIN") != std::string::npos);
        REQUIRE(str.find("localhost:9092") != std::string::npos);

        auto redacted = config.redacted();
        REQUIRE(redacted.get("sasl.username") == bluesky_kafka::Config::RedactedValue);
        REQUIRE(redacted.get("sasl.mechanisms") == "PLAIN");
        // the original is left untouched
        REQUIRE(config.get("sasl.password") == "PASSWORD");
    }

    SECTION("Read a Config from a file") {
        ScratchFile file{"bluesky-kafka-config.json",
            R"({"bootstrap.servers": "localhost:9092", "acks": 1, "enable.idempotence": true})"};
        bluesky_kafka::Config config;
        REQUIRE_NOTHROW(config = bluesky_kafka::Config::FromFile(file.path));
        REQUIRE(config.get("bootstrap.servers") == "localhost:9092");
        REQUIRE(config.get("acks") == "1");
        REQUIRE(config.get("enable.idempotence") == "true");
    }

    SECTION("Invalid config files are rejected") {
        ScratchFile file{"bluesky-kafka-bad-config.json",
            R"({"bootstrap.servers": {"host": "localhost"}})"};
        REQUIRE_THROWS_AS(bluesky_kafka::Config::FromFile(file.path),
                          bluesky_kafka::Exception);
        REQUIRE_THROWS_AS(bluesky_kafka::Config::FromFile("does-not-exist.json"),
                          bluesky_kafka::Exception);
    }
}
