/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <bluesky_kafka/DocumentConsumer.hpp>
#include <spdlog/spdlog.h>
#include <tclap/CmdLine.h>
#include <iostream>

static std::string                g_config_file;
static std::string                g_bootstrap_servers;
static std::vector<std::string>   g_topics;
static std::optional<std::string> g_group_id;
static std::string                g_offset_reset;
static std::string                g_codec;
static size_t                     g_count;
static std::string                g_log_level = "info";

static void parse_command_line(int argc, char** argv);

int main(int argc, char** argv) {
    parse_command_line(argc, argv);
    spdlog::set_level(spdlog::level::from_str(g_log_level));

    try {

        bluesky_kafka::Config config;
        if(!g_config_file.empty())
            config = bluesky_kafka::Config::FromFile(g_config_file);
        if(!g_offset_reset.empty())
            config.set("auto.offset.reset", g_offset_reset);

        size_t received = 0;
        bool stop_seen = false;
        auto print_document = [&](bluesky_kafka::DocumentConsumer&,
                                  const std::string& topic,
                                  const std::string& name,
                                  const nlohmann::json& document) {
            std::cout << topic << " " << name << " " << bluesky_kafka::toDisplayString(document) << std::endl;
            received += 1;
            stop_seen = (name == "stop");
        };

        bluesky_kafka::DocumentConsumer consumer{
            g_topics, bluesky_kafka::Config::SplitList(g_bootstrap_servers), g_group_id,
            config, print_document, bluesky_kafka::BasicConsumer::DefaultPollingDuration,
            bluesky_kafka::Codec::FromName(g_codec)};

        consumer.start([&]() {
            if(g_count) return received < g_count;
            return !stop_seen;
        });

    } catch(const bluesky_kafka::Exception& ex) {
        std::cerr << ex.what() << std::endl;
        exit(-1);
    }

    return 0;
}

void parse_command_line(int argc, char** argv) {
    try {
        TCLAP::CmdLine cmd("Print bluesky documents consumed from Kafka", ' ', "0.1");
        TCLAP::ValueArg<std::string> configArg(
            "c", "config", "JSON file with librdkafka consumer properties", false, "", "string");
        TCLAP::ValueArg<std::string> serversArg(
            "b", "bootstrap-servers", "Comma-separated list of brokers", false, "localhost:9092", "string");
        TCLAP::MultiArg<std::string> topicArg(
            "t", "topic", "Topic to subscribe to", true, "string");
        TCLAP::ValueArg<std::string> groupArg(
            "g", "group-id", "Consumer group", false, "", "string");
        TCLAP::ValueArg<std::string> offsetArg(
            "o", "offset-reset", "Where to start without a committed offset (earliest, latest)",
            false, "", "string");
        TCLAP::ValueArg<std::string> codecArg(
            "e", "codec", "Codec (msgpack, json, cbor)", false, "msgpack", "string");
        TCLAP::ValueArg<size_t> countArg(
            "n", "count", "Number of documents to print (default: until a stop document)",
            false, 0, "int");
        TCLAP::ValueArg<std::string> logLevel(
            "v", "verbose", "Log level (trace, debug, info, warning, error, critical, off)", false, "info", "string");
        cmd.add(configArg);
        cmd.add(serversArg);
        cmd.add(topicArg);
        cmd.add(groupArg);
        cmd.add(offsetArg);
        cmd.add(codecArg);
        cmd.add(countArg);
        cmd.add(logLevel);
        cmd.parse(argc, argv);
        g_config_file = configArg.getValue();
        g_bootstrap_servers = serversArg.getValue();
        g_topics = topicArg.getValue();
        if(groupArg.isSet()) g_group_id = groupArg.getValue();
        g_offset_reset = offsetArg.getValue();
        g_codec = codecArg.getValue();
        g_count = countArg.getValue();
        g_log_level = logLevel.getValue();
    } catch(TCLAP::ArgException &e) {
        std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
        exit(-1);
    }
}
