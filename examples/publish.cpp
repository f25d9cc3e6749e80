/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <bluesky_kafka/Publisher.hpp>
#include <spdlog/spdlog.h>
#include <tclap/CmdLine.h>
#include <fstream>
#include <iostream>

static std::string              g_config_file;
static std::string              g_bootstrap_servers;
static std::string              g_topic;
static std::optional<std::string> g_key;
static std::string              g_codec;
static std::string              g_input;
static bool                     g_flush_on_stop;
static std::string              g_log_level = "info";

static void parse_command_line(int argc, char** argv);
static size_t publish_lines(bluesky_kafka::Publisher& publisher, std::istream& input);

int main(int argc, char** argv) {
    parse_command_line(argc, argv);
    spdlog::set_level(spdlog::level::from_str(g_log_level));

    try {

        bluesky_kafka::Config config;
        if(!g_config_file.empty())
            config = bluesky_kafka::Config::FromFile(g_config_file);

        bluesky_kafka::Publisher publisher{
            g_topic, g_bootstrap_servers, g_key, config,
            bluesky_kafka::DeliveryCallback{}, g_flush_on_stop,
            bluesky_kafka::Codec::FromName(g_codec)};

        size_t count = 0;
        if(g_input.empty() || g_input == "-") {
            count = publish_lines(publisher, std::cin);
        } else {
            std::ifstream input{g_input};
            if(!input.good()) {
                std::cerr << "Could not open " << g_input << std::endl;
                exit(-1);
            }
            count = publish_lines(publisher, input);
        }

        publisher.flush();
        spdlog::info("Published {} document(s) to topic {}", count, g_topic);

    } catch(const bluesky_kafka::Exception& ex) {
        std::cerr << ex.what() << std::endl;
        exit(-1);
    }

    return 0;
}

size_t publish_lines(bluesky_kafka::Publisher& publisher, std::istream& input) {
    size_t count = 0;
    size_t line_number = 0;
    std::string line;
    while(std::getline(input, line)) {
        line_number += 1;
        if(line.find_first_not_of(" \t\r") == std::string::npos) continue;
        nlohmann::json entry;
        try {
            entry = nlohmann::json::parse(line);
        } catch(const nlohmann::json::exception& ex) {
            throw bluesky_kafka::Exception{
                "Line " + std::to_string(line_number) + " is not valid JSON: " + ex.what()};
        }
        if(!entry.is_array() || entry.size() != 2 || !entry[0].is_string()) {
            throw bluesky_kafka::Exception{
                "Line " + std::to_string(line_number) + " is not a [name, document] pair"};
        }
        publisher(entry[0].get<std::string>(), entry[1]);
        count += 1;
    }
    return count;
}

void parse_command_line(int argc, char** argv) {
    try {
        TCLAP::CmdLine cmd("Publish bluesky documents to Kafka", ' ', "0.1");
        TCLAP::ValueArg<std::string> configArg(
            "c", "config", "JSON file with librdkafka producer properties", false, "", "string");
        TCLAP::ValueArg<std::string> serversArg(
            "b", "bootstrap-servers", "Comma-separated list of brokers", false, "localhost:9092", "string");
        TCLAP::ValueArg<std::string> topicArg(
            "t", "topic", "Topic to publish to", true, "", "string");
        TCLAP::ValueArg<std::string> keyArg(
            "k", "key", "Key of the published messages", false, "", "string");
        TCLAP::ValueArg<std::string> codecArg(
            "e", "codec", "Codec (msgpack, json, cbor)", false, "msgpack", "string");
        TCLAP::ValueArg<std::string> inputArg(
            "i", "input", "File of [name, document] JSON lines (default: stdin)", false, "-", "string");
        TCLAP::SwitchArg flushArg(
            "f", "flush-on-stop", "Flush the producer after each stop document");
        TCLAP::ValueArg<std::string> logLevel(
            "v", "verbose", "Log level (trace, debug, info, warning, error, critical, off)", false, "info", "string");
        cmd.add(configArg);
        cmd.add(serversArg);
        cmd.add(topicArg);
        cmd.add(keyArg);
        cmd.add(codecArg);
        cmd.add(inputArg);
        cmd.add(flushArg);
        cmd.add(logLevel);
        cmd.parse(argc, argv);
        g_config_file = configArg.getValue();
        g_bootstrap_servers = serversArg.getValue();
        g_topic = topicArg.getValue();
        if(keyArg.isSet()) g_key = keyArg.getValue();
        g_codec = codecArg.getValue();
        g_input = inputArg.getValue();
        g_flush_on_stop = flushArg.getValue();
        g_log_level = logLevel.getValue();
    } catch(TCLAP::ArgException &e) {
        std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
        exit(-1);
    }
}
