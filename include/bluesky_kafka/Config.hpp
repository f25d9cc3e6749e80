/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_CONFIG_HPP
#define BLUESKY_KAFKA_CONFIG_HPP

#include <bluesky_kafka/ForwardDcl.hpp>
#include <bluesky_kafka/Exception.hpp>
#include <bluesky_kafka/Json.hpp>

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bluesky_kafka {

/**
 * @brief A Config is a set of librdkafka properties (e.g.
 * "bootstrap.servers", "group.id", "sasl.password"). Values are
 * stored the way librdkafka expects them, as strings. The Config is
 * passed to the underlying Kafka client verbatim.
 */
class Config {

    public:

    using const_iterator = std::map<std::string, std::string>::const_iterator;

    /**
     * @brief Placeholder shown instead of credentials.
     */
    static constexpr const char* RedactedValue = "****";

    Config() = default;

    Config(std::initializer_list<std::pair<const std::string, std::string>> values)
    : m_values(values) {}

    /**
     * @brief Build a Config from a JSON object. String values are
     * taken as-is, booleans become "true"/"false" and numbers are
     * printed in decimal. Any other type of value throws an Exception.
     *
     * @param json JSON object.
     */
    explicit Config(const nlohmann::json& json);

    Config(const Config&) = default;
    Config(Config&&) = default;
    Config& operator=(const Config&) = default;
    Config& operator=(Config&&) = default;
    ~Config() = default;

    /**
     * @brief Read a Config from a JSON file. The file must contain
     * a JSON object whose values are strings, numbers, or booleans.
     *
     * @param filename Path to the file.
     */
    static Config FromFile(const std::string& filename);

    bool contains(const std::string& key) const {
        return m_values.count(key) != 0;
    }

    std::optional<std::string> get(const std::string& key) const;

    void set(const std::string& key, std::string value) {
        m_values[key] = std::move(value);
    }

    void set(const std::string& key, const char* value) {
        m_values[key] = value;
    }

    void set(const std::string& key, bool value) {
        m_values[key] = value ? "true" : "false";
    }

    /**
     * @brief Set the key only if it is not already present.
     */
    void setDefault(const std::string& key, std::string value) {
        m_values.emplace(key, std::move(value));
    }

    void erase(const std::string& key) {
        m_values.erase(key);
    }

    size_t size() const {
        return m_values.size();
    }

    bool empty() const {
        return m_values.empty();
    }

    const_iterator begin() const {
        return m_values.begin();
    }

    const_iterator end() const {
        return m_values.end();
    }

    /**
     * @brief Returns the Config as a JSON object of strings,
     * credentials included.
     */
    nlohmann::json json() const;

    /**
     * @brief Returns a copy of the Config in which the value of every
     * credential (see IsCredential) is replaced with RedactedValue.
     */
    Config redacted() const;

    /**
     * @brief Human-readable rendering of the redacted Config.
     */
    std::string toString() const;

    /**
     * @brief Whether the property holds a secret: any "sasl.*" property
     * other than "sasl.mechanism(s)", and any property whose name
     * contains "password" or "secret".
     */
    static bool IsCredential(const std::string& key);

    /**
     * @brief Compute the effective "bootstrap.servers" value: the
     * provided servers first, followed by the comma-separated servers
     * already present in config (if any), joined with commas.
     *
     * @param servers Servers provided explicitly.
     * @param config Config that may contain "bootstrap.servers".
     *
     * @return the combined comma-separated server list.
     */
    static std::string MergeBootstrapServers(
            const std::vector<std::string>& servers,
            const Config& config);

    /**
     * @brief Split a comma-separated list, dropping empty entries.
     */
    static std::vector<std::string> SplitList(const std::string& list);

    bool operator==(const Config& other) const {
        return m_values == other.m_values;
    }

    bool operator!=(const Config& other) const {
        return m_values != other.m_values;
    }

    private:

    std::map<std::string, std::string> m_values;
};

}

#endif
