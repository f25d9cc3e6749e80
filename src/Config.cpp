/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "bluesky_kafka/Config.hpp"
#include "bluesky_kafka/Exception.hpp"
#include "SchemaUtil.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fstream>

namespace bluesky_kafka {

static constexpr const char* configSchema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "additionalProperties": {
        "type": ["string", "number", "boolean"]
    }
}
)";

static std::string toPropertyValue(const std::string& key, const nlohmann::json& value) {
    if(value.is_string())
        return value.get<std::string>();
    if(value.is_boolean())
        return value.get<bool>() ? "true" : "false";
    if(value.is_number())
        return value.dump();
    throw Exception{fmt::format(
        "Invalid value for property \"{}\": expected string, number, or boolean, got {}",
        key, value.type_name())};
}

Config::Config(const nlohmann::json& json) {
    if(!json.is_object())
        throw Exception{"Kafka configuration should be a JSON object"};
    for(auto& p : json.items()) {
        m_values[p.key()] = toPropertyValue(p.key(), p.value());
    }
}

Config Config::FromFile(const std::string& filename) {
    std::ifstream inputFile(filename);
    if(!inputFile.is_open()) {
        throw Exception{fmt::format("Could not open config file \"{}\"", filename)};
    }
    nlohmann::json config;
    try {
        inputFile >> config;
    } catch(const nlohmann::json::exception& ex) {
        throw Exception{fmt::format(
            "Could not parse config file \"{}\": {}", filename, ex.what())};
    }
    static const SchemaChecker checker{nlohmann::json::parse(configSchema)};
    auto errors = checker.check(config);
    if(!errors.empty()) {
        throw Exception{fmt::format(
            "Error(s) while validating config file \"{}\": {}",
            filename, fmt::join(errors, "; "))};
    }
    return Config(config);
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = m_values.find(key);
    if(it == m_values.end()) return std::nullopt;
    return it->second;
}

nlohmann::json Config::json() const {
    auto result = nlohmann::json::object();
    for(auto& p : m_values)
        result[p.first] = p.second;
    return result;
}

bool Config::IsCredential(const std::string& key) {
    if(key.find("password") != std::string::npos) return true;
    if(key.find("secret") != std::string::npos) return true;
    if(key.rfind("sasl.", 0) == 0)
        return key != "sasl.mechanism" && key != "sasl.mechanisms";
    return false;
}

Config Config::redacted() const {
    Config result{*this};
    for(auto& p : result.m_values) {
        if(IsCredential(p.first))
            p.second = RedactedValue;
    }
    return result;
}

std::string Config::toString() const {
    return toDisplayString(redacted().json());
}

std::vector<std::string> Config::SplitList(const std::string& list) {
    std::vector<std::string> result;
    size_t start = 0;
    while(start <= list.size()) {
        auto end = list.find(',', start);
        if(end == std::string::npos) end = list.size();
        auto item = list.substr(start, end - start);
        if(!item.empty()) result.push_back(std::move(item));
        start = end + 1;
    }
    return result;
}

std::string Config::MergeBootstrapServers(
        const std::vector<std::string>& servers,
        const Config& config) {
    std::vector<std::string> all = servers;
    auto configured = config.get("bootstrap.servers");
    if(configured) {
        auto extra = SplitList(*configured);
        all.insert(all.end(), extra.begin(), extra.end());
    }
    return fmt::format("{}", fmt::join(all, ","));
}

}
