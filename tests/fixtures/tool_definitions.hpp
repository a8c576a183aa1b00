#pragma once

#include "turnkey/types.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace turnkey {
namespace testing {
namespace tools {

// Simple tool functions for template registration

inline int add(int a, int b) {
    return a + b;
}

inline double multiply(double a, double b) {
    return a * b;
}

inline std::string greet(std::string name) {
    return "Hello, " + name + "!";
}

inline bool is_positive(int n) {
    return n > 0;
}

inline std::string get_time() {
    return "2024-01-01T00:00:00Z";
}

// Handler-style tools for manual registration

inline Expected<nlohmann::json> lookup_city(const nlohmann::json& args) {
    return nlohmann::json{{"City", args.at("city").get<std::string>()}, {"Found", true}};
}

inline Expected<nlohmann::json> always_errors(const nlohmann::json&) {
    return tl::unexpected(Error{ErrorCode::ToolExecutionFailed, "backend offline"});
}

inline Expected<nlohmann::json> always_throws(const nlohmann::json&) {
    throw std::runtime_error("handler exploded");
}

inline nlohmann::json city_schema() {
    return nlohmann::json{
        {"type", "object"},
        {"properties", {
            {"city", {{"type", "string"}, {"description", "City name"}}}
        }},
        {"required", nlohmann::json::array({"city"})}
    };
}

} // namespace tools
} // namespace testing
} // namespace turnkey
