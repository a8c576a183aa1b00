#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace turnkey {

// ============================================================================
// Service Configuration
// ============================================================================

/**
 * @brief Connection settings for the hosted agent service
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct ServiceConfig {
    std::string endpoint;                                        ///< Project endpoint URL (required)
    std::string api_version = "v1";                              ///< Sent as the api-version query parameter
    std::string access_token;                                    ///< Bearer token (empty = no Authorization header)
    std::chrono::seconds request_timeout = std::chrono::seconds(120); ///< Per-request transport timeout

    Expected<void> validate() const {
        if (endpoint.empty()) {
            return tl::unexpected(Error{ErrorCode::MissingEndpoint,
                "Missing 'AzureAI:ConnectionString'. Set it to your project endpoint."});
        }
        if (endpoint.rfind("http://", 0) != 0 && endpoint.rfind("https://", 0) != 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig,
                "Endpoint must start with http:// or https://", endpoint});
        }
        if (request_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "request_timeout must be positive"});
        }
        return {};
    }
};

// ============================================================================
// Turn Configuration
// ============================================================================

/**
 * @brief Polling and limit settings for one conversational turn
 */
struct TurnConfig {
    std::chrono::milliseconds poll_interval{500};      ///< Constant delay between status checks
    std::optional<std::chrono::seconds> run_timeout;   ///< Cancel and fail when exceeded (nullopt = wait forever)
    std::optional<int> max_tool_round_trips;           ///< Fail after this many submissions (nullopt = unbounded)

    Expected<void> validate() const {
        if (poll_interval.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "poll_interval cannot be negative"});
        }
        if (run_timeout && run_timeout->count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "run_timeout must be positive"});
        }
        if (max_tool_round_trips && *max_tool_round_trips <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_tool_round_trips must be positive"});
        }
        return {};
    }
};

// ============================================================================
// Retry Policy
// ============================================================================

/**
 * @brief Bounded retry with exponential backoff
 *
 * The delay before attempt n (n >= 2) is base_delay * 2^(n-2).
 */
struct RetryPolicy {
    int max_attempts = 3;                           ///< Total attempts including the first (> 0)
    std::chrono::milliseconds base_delay{1000};     ///< Delay before the second attempt

    std::chrono::milliseconds delay_before(int attempt) const {
        if (attempt < 2) {
            return std::chrono::milliseconds{0};
        }
        // Doubling saturates instead of overflowing for policies built without validate().
        using rep = std::chrono::milliseconds::rep;
        const int shift = attempt - 2 < 62 ? attempt - 2 : 62;
        const rep factor = rep{1} << shift;
        if (base_delay.count() > std::numeric_limits<rep>::max() / factor) {
            return std::chrono::milliseconds::max();
        }
        return base_delay * factor;
    }

    Expected<void> validate() const {
        if (max_attempts <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_attempts must be positive"});
        }
        if (max_attempts > 31) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_attempts must be at most 31"});
        }
        if (base_delay.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "base_delay cannot be negative"});
        }
        return {};
    }
};

// ============================================================================
// Application Settings
// ============================================================================

/**
 * @brief Everything the demo console reads from appsettings.json
 */
struct Settings {
    ServiceConfig service;
    std::string model = "gpt-4o";
    std::string search_connection_id;
    std::string search_index_name;
    TurnConfig turn;            ///< Used by resilient call sites; plain turns ignore timeout and cap
    RetryPolicy retry;
    std::string log_level = "info";

    Expected<void> validate() const {
        if (auto result = service.validate(); !result) return result;
        if (auto result = turn.validate(); !result) return result;
        if (auto result = retry.validate(); !result) return result;
        if (model.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Model deployment name cannot be empty"});
        }
        return {};
    }

    bool has_search() const {
        return !search_connection_id.empty() && !search_index_name.empty();
    }
};

namespace detail {

/// Keys read from the settings document, as "Section:Key".
inline const std::vector<std::string>& settings_keys() {
    static const std::vector<std::string> keys = {
        "AzureAI:ConnectionString",
        "AzureAI:ModelDeploymentName",
        "AzureAI:ApiVersion",
        "AzureAI:AccessToken",
        "AzureAISearch:ConnectionId",
        "AzureAISearch:IndexName",
        "Agent:PollIntervalMs",
        "Agent:RunTimeoutSeconds",
        "Agent:MaxToolRoundTrips",
        "Agent:MaxAttempts",
        "Agent:BaseDelayMs",
        "Agent:RequestTimeoutSeconds",
        "Logging:Level",
    };
    return keys;
}

inline std::pair<std::string, std::string> split_key(const std::string& key) {
    auto colon = key.find(':');
    return {key.substr(0, colon), key.substr(colon + 1)};
}

inline std::optional<std::string> lookup_string(const nlohmann::json& doc, const std::string& key) {
    auto [section, name] = split_key(key);
    auto section_it = doc.find(section);
    if (section_it == doc.end() || !section_it->is_object()) return std::nullopt;
    auto value_it = section_it->find(name);
    if (value_it == section_it->end() || value_it->is_null()) return std::nullopt;
    if (value_it->is_string()) return value_it->get<std::string>();
    return value_it->dump();
}

inline Expected<std::optional<long long>> lookup_integer(const nlohmann::json& doc, const std::string& key) {
    auto text = lookup_string(doc, key);
    if (!text) return std::optional<long long>{};
    try {
        size_t consumed = 0;
        long long value = std::stoll(*text, &consumed);
        if (consumed != text->size()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Expected an integer for '" + key + "'", *text});
        }
        return std::optional<long long>{value};
    } catch (const std::exception&) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Expected an integer for '" + key + "'", *text});
    }
}

inline Expected<std::optional<int>> lookup_int(const nlohmann::json& doc, const std::string& key) {
    auto value = lookup_integer(doc, key);
    if (!value) return tl::unexpected(value.error());
    if (!*value) return std::optional<int>{};
    if (**value < std::numeric_limits<int>::min() || **value > std::numeric_limits<int>::max()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Value out of range for '" + key + "'",
                                    std::to_string(**value)});
    }
    return std::optional<int>{static_cast<int>(**value)};
}

} // namespace detail

/// Reads an environment variable; returns nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Overlay environment variables onto a settings document
 *
 * "Section:Key" is overridden by the variable "Section__Key".
 */
inline void apply_environment(nlohmann::json& doc, const EnvLookup& getenv_fn) {
    if (!doc.is_object()) {
        doc = nlohmann::json::object();
    }
    for (const auto& key : detail::settings_keys()) {
        auto [section, name] = detail::split_key(key);
        const std::string variable = section + "__" + name;
        if (const char* value = getenv_fn(variable.c_str())) {
            if (!doc.contains(section) || !doc[section].is_object()) {
                doc[section] = nlohmann::json::object();
            }
            doc[section][name] = value;
        }
    }
}

/**
 * @brief Build Settings from a parsed settings document
 *
 * Missing keys keep their defaults. The result is validated.
 */
inline Expected<Settings> settings_from_json(const nlohmann::json& doc) {
    Settings settings;

    if (auto v = detail::lookup_string(doc, "AzureAI:ConnectionString")) settings.service.endpoint = *v;
    if (auto v = detail::lookup_string(doc, "AzureAI:ModelDeploymentName")) settings.model = *v;
    if (auto v = detail::lookup_string(doc, "AzureAI:ApiVersion")) settings.service.api_version = *v;
    if (auto v = detail::lookup_string(doc, "AzureAI:AccessToken")) settings.service.access_token = *v;
    if (auto v = detail::lookup_string(doc, "AzureAISearch:ConnectionId")) settings.search_connection_id = *v;
    if (auto v = detail::lookup_string(doc, "AzureAISearch:IndexName")) settings.search_index_name = *v;
    if (auto v = detail::lookup_string(doc, "Logging:Level")) settings.log_level = *v;

    // Resilient turns default to a 60s timeout and 5 tool round-trips.
    settings.turn.run_timeout = std::chrono::seconds(60);
    settings.turn.max_tool_round_trips = 5;

    auto poll = detail::lookup_integer(doc, "Agent:PollIntervalMs");
    if (!poll) return tl::unexpected(poll.error());
    if (*poll) settings.turn.poll_interval = std::chrono::milliseconds(**poll);

    auto timeout = detail::lookup_integer(doc, "Agent:RunTimeoutSeconds");
    if (!timeout) return tl::unexpected(timeout.error());
    if (*timeout) settings.turn.run_timeout = std::chrono::seconds(**timeout);

    auto round_trips = detail::lookup_int(doc, "Agent:MaxToolRoundTrips");
    if (!round_trips) return tl::unexpected(round_trips.error());
    if (*round_trips) settings.turn.max_tool_round_trips = **round_trips;

    auto attempts = detail::lookup_int(doc, "Agent:MaxAttempts");
    if (!attempts) return tl::unexpected(attempts.error());
    if (*attempts) settings.retry.max_attempts = **attempts;

    auto base_delay = detail::lookup_integer(doc, "Agent:BaseDelayMs");
    if (!base_delay) return tl::unexpected(base_delay.error());
    if (*base_delay) settings.retry.base_delay = std::chrono::milliseconds(**base_delay);

    auto request_timeout = detail::lookup_integer(doc, "Agent:RequestTimeoutSeconds");
    if (!request_timeout) return tl::unexpected(request_timeout.error());
    if (*request_timeout) settings.service.request_timeout = std::chrono::seconds(**request_timeout);

    if (auto result = settings.validate(); !result) {
        return tl::unexpected(result.error());
    }
    return settings;
}

/**
 * @brief Load settings from a JSON file, then apply environment overrides
 *
 * @param path Path to appsettings.json
 * @param getenv_fn Environment lookup (defaults to std::getenv)
 */
inline Expected<Settings> load_settings(const std::string& path,
                                        const EnvLookup& getenv_fn = [](const char* name) { return std::getenv(name); }) {
    std::ifstream in(path);
    if (!in) {
        return tl::unexpected(Error{ErrorCode::ConfigFileUnreadable, "Cannot open settings file", path});
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in, nullptr, true, /*ignore_comments=*/true);
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig,
            std::string("Settings file is not valid JSON: ") + e.what(), path});
    }

    apply_environment(doc, getenv_fn);
    return settings_from_json(doc);
}

} // namespace turnkey
