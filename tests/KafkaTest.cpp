/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_all.hpp>
#include <bluesky_kafka/Publisher.hpp>
#include <bluesky_kafka/DocumentConsumer.hpp>
#include <chrono>
#include <cstdlib>

/* These tests need a running Kafka broker. They are hidden and must be
 * selected explicitly, e.g. "BlueskyKafkaTest [.kafka]". The broker is
 * taken from BLUESKY_KAFKA_BOOTSTRAP_SERVERS (default "localhost:9092"). */

static std::string bootstrapServers() {
    auto env = std::getenv("BLUESKY_KAFKA_BOOTSTRAP_SERVERS");
    return env ? env : "localhost:9092";
}

static std::string uniqueName(const char* prefix) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return prefix + std::to_string(
        std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

TEST_CASE("Kafka round trip", "[.kafka]") {

    spdlog::set_level(spdlog::level::from_str("error"));

    auto topic = uniqueName("bluesky-kafka-test-");
    bluesky_kafka::Config config{
        {"allow.auto.create.topics", "true"}
    };

    SECTION("Publish a run and consume it back") {
        std::vector<std::pair<std::string, nlohmann::json>> published = {
            {"start",      {{"uid", "abc"}, {"time", 0.0}}},
            {"descriptor", {{"uid", "d1"}, {"run_start", "abc"}}},
            {"event",      {{"uid", "e1"}, {"descriptor", "d1"}, {"seq_num", 1}}},
            {"stop",       {{"uid", "s1"}, {"run_start", "abc"}}}
        };

        size_t delivered = 0;
        bluesky_kafka::Publisher publisher{
            topic, bootstrapServers(), "run-abc", {},
            [&delivered](const std::optional<bluesky_kafka::BrokerError>& error,
                         const bluesky_kafka::MessageMetadata&) {
                if(!error) delivered += 1;
            }, true};

        auto metadata = publisher.clusterMetadata();
        REQUIRE(!metadata.brokers.empty());

        for(auto& p : published)
            publisher(p.first, p.second);
        // flushed by the stop document
        REQUIRE(delivered == published.size());

        std::vector<std::pair<std::string, nlohmann::json>> received;
        bluesky_kafka::DocumentConsumer consumer{
            {topic}, {bootstrapServers()}, uniqueName("bluesky-kafka-test-group-"),
            bluesky_kafka::Config{{"auto.offset.reset", "earliest"}},
            [&received](bluesky_kafka::DocumentConsumer&, const std::string&,
                        const std::string& name, const nlohmann::json& document) {
                received.emplace_back(name, document);
            }};
        consumer.start([&received]() { return received.back().first != "stop"; });

        REQUIRE(received == published);
        REQUIRE(consumer.closed());
    }
}
