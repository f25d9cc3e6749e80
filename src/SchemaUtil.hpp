/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_SCHEMA_UTIL_H
#define BLUESKY_KAFKA_SCHEMA_UTIL_H

#include <nlohmann/json.hpp>
#include <nlohmann/json-schema.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace bluesky_kafka {

/* Checks JSON documents against a JSON schema, collecting
 * every violation instead of stopping at the first one. */
class SchemaChecker {

    public:

    explicit SchemaChecker(const nlohmann::json& schema) {
        m_validator.set_root_schema(schema);
    }

    std::vector<std::string> check(const nlohmann::json& instance) const {
        Collector collector;
        m_validator.validate(instance, collector);
        return std::move(collector.violations);
    }

    private:

    struct Collector : public nlohmann::json_schema::basic_error_handler {

        std::vector<std::string> violations;

        void error(const nlohmann::json::json_pointer& where,
                   const nlohmann::json& value,
                   const std::string& message) override {
            nlohmann::json_schema::basic_error_handler::error(where, value, message);
            std::ostringstream out;
            out << "at '" << where.to_string() << "' (" << value.dump() << "): " << message;
            violations.push_back(out.str());
        }
    };

    nlohmann::json_schema::json_validator m_validator;
};

}

#endif
