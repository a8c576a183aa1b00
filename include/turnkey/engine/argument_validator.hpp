#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace turnkey {
namespace engine {

/**
 * @brief Validates tool call arguments against a declared parameter schema.
 *
 * Checks the subset of JSON Schema that tool declarations use: an object with
 * "properties" (each carrying a primitive "type") and a "required" list.
 * Properties without type information are not checked.
 */
class ArgumentValidator {
public:
    /**
     * @brief Validate arguments against a parameters schema.
     *
     * @param arguments The argument document supplied by the service
     * @param parameters The schema registered for the tool
     * @return Empty string if valid, error message describing the violation otherwise
     */
    static std::string validate(const nlohmann::json& arguments, const nlohmann::json& parameters) {
        if (!arguments.is_object()) {
            return std::string("Arguments must be a JSON object, got ") + json_type_name(arguments);
        }
        if (!parameters.is_object()) {
            return "";
        }

        auto required_it = parameters.find("required");
        if (required_it != parameters.end() && required_it->is_array()) {
            for (const auto& req : *required_it) {
                if (!req.is_string()) continue;
                const auto& field = req.get_ref<const std::string&>();
                if (!arguments.contains(field)) {
                    return "Missing required argument: " + field;
                }
            }
        }

        auto props_it = parameters.find("properties");
        if (props_it != parameters.end() && props_it->is_object()) {
            for (const auto& [key, prop] : props_it->items()) {
                auto arg_it = arguments.find(key);
                if (arg_it == arguments.end()) continue;

                auto type_it = prop.find("type");
                if (type_it == prop.end() || !type_it->is_string()) {
                    continue;
                }
                const auto& expected_type = type_it->get_ref<const std::string&>();

                if (!type_matches(*arg_it, expected_type)) {
                    return "Argument '" + key + "' has wrong type: expected " +
                           expected_type + ", got " + json_type_name(*arg_it);
                }
            }
        }

        return "";
    }

    /**
     * @brief Check if a JSON value matches the expected JSON Schema type.
     *
     * Unknown schema type names never match.
     */
    static bool type_matches(const nlohmann::json& val, std::string_view expected) {
        if (expected == "integer") return val.is_number_integer();
        if (expected == "number") return val.is_number();
        if (expected == "string") return val.is_string();
        if (expected == "boolean") return val.is_boolean();
        if (expected == "object") return val.is_object();
        if (expected == "array") return val.is_array();
        if (expected == "null") return val.is_null();
        return false;
    }

    /** @brief Human-readable type name for a JSON value. */
    static const char* json_type_name(const nlohmann::json& val) {
        if (val.is_null()) return "null";
        if (val.is_boolean()) return "boolean";
        if (val.is_number_integer()) return "integer";
        if (val.is_number_float()) return "number";
        if (val.is_string()) return "string";
        if (val.is_array()) return "array";
        if (val.is_object()) return "object";
        return "unknown";
    }
};

} // namespace engine
} // namespace turnkey
