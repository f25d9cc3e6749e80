/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_all.hpp>
#include <bluesky_kafka/RemoteDispatcher.hpp>
#include "FakeClients.hpp"

using namespace std::chrono_literals;
using bluesky_kafka::DocumentName;

TEST_CASE("DocumentName test", "[dispatcher]") {
    REQUIRE(bluesky_kafka::parseDocumentName("start") == DocumentName::Start);
    REQUIRE(bluesky_kafka::parseDocumentName("event_page") == DocumentName::EventPage);
    REQUIRE(bluesky_kafka::parseDocumentName("datum_page") == DocumentName::DatumPage);
    REQUIRE(!bluesky_kafka::parseDocumentName("Start").has_value());
    REQUIRE(!bluesky_kafka::parseDocumentName("bulk_events").has_value());
    REQUIRE(bluesky_kafka::to_string(DocumentName::Descriptor) == "descriptor");
    REQUIRE(bluesky_kafka::documentNameFromString("resource") == DocumentName::Resource);
    REQUIRE_THROWS_AS(bluesky_kafka::documentNameFromString("nope"), bluesky_kafka::Exception);
}

TEST_CASE("RemoteDispatcher test", "[dispatcher]") {

    spdlog::set_level(spdlog::level::from_str("error"));

    FakeConsumerClient client;
    CapturingLogger capture;

    SECTION("Documents are dispatched to matching subscribers") {
        client.pushValue("topic.a", nlohmann::json::array({"start", {{"uid", "abc"}}}));
        client.pushValue("topic.a", nlohmann::json::array({"event", {{"seq_num", 1}}}));
        client.pushValue("topic.a", nlohmann::json::array({"stop", {{"run_start", "abc"}}}));

        bluesky_kafka::RemoteDispatcher dispatcher{
            {"topic.a"}, {"localhost:9092"}, "g", {},
            10ms, {}, capture.m_logger, client.factory()};

        std::vector<DocumentName> all;
        std::vector<nlohmann::json> events;
        dispatcher.subscribe([&all](DocumentName name, const nlohmann::json&) {
            all.push_back(name);
        });
        auto token = dispatcher.subscribe([&events](DocumentName, const nlohmann::json& doc) {
            events.push_back(doc);
        }, DocumentName::Event);
        REQUIRE(dispatcher.numSubscribers() == 2);

        dispatcher.start([&all]() { return all.back() != DocumentName::Stop; });

        REQUIRE(all == std::vector<DocumentName>{
            DocumentName::Start, DocumentName::Event, DocumentName::Stop});
        REQUIRE(events.size() == 1);
        REQUIRE(events[0]["seq_num"] == 1);

        dispatcher.unsubscribe(token);
        dispatcher.unsubscribe(token);
        REQUIRE(dispatcher.numSubscribers() == 1);
    }

    SECTION("A subscriber may unsubscribe itself") {
        client.pushValue("topic.a", nlohmann::json::array({"start", {{"uid", "abc"}}}));
        client.pushValue("topic.a", nlohmann::json::array({"stop", {{"run_start", "abc"}}}));

        bluesky_kafka::RemoteDispatcher dispatcher{
            {"topic.a"}, {"localhost:9092"}, "g", {},
            10ms, {}, capture.m_logger, client.factory()};

        size_t calls = 0;
        bluesky_kafka::RemoteDispatcher::Token token = 0;
        token = dispatcher.subscribe([&](DocumentName, const nlohmann::json&) {
            calls += 1;
            dispatcher.unsubscribe(token);
        });
        std::vector<DocumentName> names;
        dispatcher.subscribe([&names](DocumentName name, const nlohmann::json&) {
            names.push_back(name);
        });

        dispatcher.start([&names]() { return names.size() < 2; });
        REQUIRE(calls == 1);
        REQUIRE(names.size() == 2);
    }

    SECTION("A callback removed by an earlier callback is not called") {
        client.pushValue("topic.a", nlohmann::json::array({"start", {{"uid", "abc"}}}));

        bluesky_kafka::RemoteDispatcher dispatcher{
            {"topic.a"}, {"localhost:9092"}, "g", {},
            10ms, {}, capture.m_logger, client.factory()};

        bluesky_kafka::RemoteDispatcher::Token second = 0;
        size_t first_calls = 0;
        size_t second_calls = 0;
        dispatcher.subscribe([&](DocumentName, const nlohmann::json&) {
            first_calls += 1;
            dispatcher.unsubscribe(second);
        });
        second = dispatcher.subscribe([&second_calls](DocumentName, const nlohmann::json&) {
            second_calls += 1;
        });

        dispatcher.start([]() { return false; });
        REQUIRE(first_calls == 1);
        REQUIRE(second_calls == 0);
        REQUIRE(dispatcher.numSubscribers() == 1);
    }

    SECTION("Unknown document names are rejected") {
        client.pushValue("topic.a", nlohmann::json::array({"bulk_events", nlohmann::json::object()}));
        bluesky_kafka::RemoteDispatcher dispatcher{
            {"topic.a"}, {"localhost:9092"}, "g", {},
            10ms, {}, capture.m_logger, client.factory()};
        REQUIRE_THROWS_AS(dispatcher.start(), bluesky_kafka::DecodeError);
        REQUIRE(dispatcher.closed());
    }

    SECTION("Empty callbacks are rejected") {
        bluesky_kafka::RemoteDispatcher dispatcher{
            {"topic.a"}, {"localhost:9092"}, "g", {},
            10ms, {}, capture.m_logger, client.factory()};
        REQUIRE_THROWS_AS(dispatcher.subscribe(bluesky_kafka::RemoteDispatcher::Callback{}),
                          bluesky_kafka::Exception);
        REQUIRE(dispatcher.toString().find("RemoteDispatcher(") == 0);
    }
}
