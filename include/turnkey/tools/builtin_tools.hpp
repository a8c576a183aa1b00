#pragma once

#include "../types.hpp"
#include "../engine/tool_dispatch_registry.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <utility>

namespace turnkey {
namespace tools {

// ============================================================================
// Helpers
// ============================================================================

namespace detail {

/// FNV-1a; stable across runs and platforms, unlike std::hash.
inline uint64_t stable_hash(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

inline double round_to(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

inline std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

inline std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

inline bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

inline nlohmann::json string_param(const std::string& description) {
    return nlohmann::json{{"type", "string"}, {"description", description}};
}

/**
 * @brief Recursive-descent evaluator for + - * / %, unary minus and parentheses.
 */
class ExpressionParser {
public:
    explicit ExpressionParser(const std::string& text) : text_(text) {}

    Expected<double> evaluate() {
        auto value = parse_sum();
        if (!value) return value;
        skip_spaces();
        if (pos_ != text_.size()) {
            return fail("Unexpected character '" + std::string(1, text_[pos_]) + "'");
        }
        return value;
    }

private:
    Expected<double> parse_sum() {
        auto lhs = parse_product();
        if (!lhs) return lhs;
        double value = *lhs;
        while (true) {
            skip_spaces();
            if (pos_ >= text_.size() || (text_[pos_] != '+' && text_[pos_] != '-')) break;
            const char op = text_[pos_++];
            auto rhs = parse_product();
            if (!rhs) return rhs;
            value = (op == '+') ? value + *rhs : value - *rhs;
        }
        return value;
    }

    Expected<double> parse_product() {
        auto lhs = parse_unary();
        if (!lhs) return lhs;
        double value = *lhs;
        while (true) {
            skip_spaces();
            if (pos_ >= text_.size() || (text_[pos_] != '*' && text_[pos_] != '/' && text_[pos_] != '%')) break;
            const char op = text_[pos_++];
            auto rhs = parse_unary();
            if (!rhs) return rhs;
            if ((op == '/' || op == '%') && *rhs == 0.0) {
                return fail("Attempted to divide by zero.");
            }
            if (op == '*') value *= *rhs;
            else if (op == '/') value /= *rhs;
            else value = std::fmod(value, *rhs);
        }
        return value;
    }

    Expected<double> parse_unary() {
        skip_spaces();
        if (pos_ < text_.size() && (text_[pos_] == '-' || text_[pos_] == '+')) {
            const char sign = text_[pos_++];
            auto operand = parse_unary();
            if (!operand) return operand;
            return sign == '-' ? -*operand : *operand;
        }
        return parse_primary();
    }

    Expected<double> parse_primary() {
        skip_spaces();
        if (pos_ >= text_.size()) {
            return fail("Unexpected end of expression");
        }
        if (text_[pos_] == '(') {
            ++pos_;
            auto inner = parse_sum();
            if (!inner) return inner;
            skip_spaces();
            if (pos_ >= text_.size() || text_[pos_] != ')') {
                return fail("Missing closing parenthesis");
            }
            ++pos_;
            return inner;
        }

        const size_t start = pos_;
        while (pos_ < text_.size() &&
               (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.')) {
            ++pos_;
        }
        if (start == pos_) {
            return fail("Unexpected character '" + std::string(1, text_[pos_]) + "'");
        }
        const std::string literal = text_.substr(start, pos_ - start);
        if (literal == "." || std::count(literal.begin(), literal.end(), '.') > 1) {
            return fail("Invalid number '" + literal + "'");
        }
        return std::stod(literal);
    }

    void skip_spaces() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    tl::unexpected<Error> fail(const std::string& message) const {
        return tl::unexpected(Error{ErrorCode::InvalidToolArguments, message,
                                    "position " + std::to_string(pos_)});
    }

    const std::string& text_;
    size_t pos_ = 0;
};

inline std::string format_number(double value) {
    if (std::fabs(value) < 1e15 && value == std::floor(value)) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream out;
    out.precision(15);
    out << value;
    return out.str();
}

} // namespace detail

// ============================================================================
// Handlers
// ============================================================================

/**
 * @brief Simulated weather reading derived deterministically from the city name.
 */
inline Expected<nlohmann::json> get_weather(const nlohmann::json& args) {
    const std::string city = args.value("city", std::string("Unknown"));

    static const char* const conditions[] = {"Sunny", "Cloudy", "Rainy", "Partly Cloudy", "Snowy"};
    std::mt19937 rng(static_cast<std::mt19937::result_type>(detail::stable_hash(city)));

    const double temperature = 5.0 + static_cast<double>(rng() % 351) / 10.0;
    const char* condition = conditions[rng() % 5];
    const int humidity = 30 + static_cast<int>(rng() % 60);
    const double wind = static_cast<double>(rng() % 301) / 10.0;

    return nlohmann::json{
        {"City", city},
        {"TemperatureCelsius", detail::round_to(temperature, 1)},
        {"Condition", condition},
        {"Humidity", humidity},
        {"WindSpeedKmh", detail::round_to(wind, 1)}
    };
}

/**
 * @brief Simulated stock quote; well-known symbols use fixed prices.
 */
inline nlohmann::json get_stock_price(const std::string& ticker) {
    const std::string symbol = detail::to_upper(ticker);

    static const std::map<std::string, double> prices = {
        {"MSFT", 425.52}, {"AAPL", 237.40}, {"GOOGL", 183.75},
        {"AMZN", 205.30}, {"TSLA", 248.15}, {"META", 595.50},
        {"NVDA", 135.60}
    };

    const uint64_t hash = detail::stable_hash(symbol);
    auto it = prices.find(symbol);
    const double price = (it != prices.end())
        ? it->second
        : 100.0 + static_cast<double>(hash % 20000) / 100.0;
    const double change = detail::round_to(static_cast<double>((hash >> 16) % 1001) / 100.0 - 5.0, 2);

    return nlohmann::json{
        {"Symbol", symbol},
        {"Price", detail::round_to(price, 2)},
        {"Change", change},
        {"ChangePercent", detail::round_to(change / price * 100.0, 2)}
    };
}

/**
 * @brief Case-insensitive substring search over a fixed company knowledge base.
 */
inline Expected<nlohmann::json> search_knowledge_base(const nlohmann::json& args) {
    const std::string query = args.value("query", std::string());

    static const std::map<std::string, std::string> knowledge_base = {
        {"refund policy", "Our refund policy allows returns within 30 days of purchase. Items must be in original condition. Digital products can be refunded within 14 days if unused. Contact support@company.com for refund requests."},
        {"shipping", "Standard shipping takes 5-7 business days. Express shipping is 2-3 business days. Free shipping on orders over $50. International shipping available to 40+ countries."},
        {"pricing plans", "We offer three plans: Basic ($9.99/mo) with 5 users, Professional ($29.99/mo) with 25 users and priority support, and Enterprise (custom pricing) with unlimited users, SSO, and dedicated account manager."},
        {"api limits", "Free tier: 1,000 requests/day. Pro tier: 50,000 requests/day. Enterprise: unlimited. Rate limiting applies at 100 requests/minute for all tiers."},
        {"security", "We use AES-256 encryption at rest and TLS 1.3 in transit. SOC 2 Type II certified. GDPR compliant. Two-factor authentication available. Regular penetration testing performed quarterly."},
        {"contact", "Support hours: Mon-Fri 9am-6pm EST. Email: support@company.com. Phone: 1-800-555-0199. Live chat available on our website during business hours."}
    };

    nlohmann::json results = nlohmann::json::array();
    for (const auto& [topic, content] : knowledge_base) {
        if (detail::contains_ignore_case(topic, query) || detail::contains_ignore_case(content, query)) {
            results.push_back(nlohmann::json{{"topic", topic}, {"content", content}});
        }
    }

    if (results.empty()) {
        return nlohmann::json{{"message", "No relevant information found."}, {"query", query}};
    }
    return nlohmann::json{{"results", std::move(results)}, {"query", query}};
}

/**
 * @brief Evaluate an arithmetic expression. Evaluation errors are part of the payload.
 */
inline nlohmann::json calculate(const std::string& expression) {
    detail::ExpressionParser parser(expression);
    auto value = parser.evaluate();
    if (!value) {
        return nlohmann::json{{"expression", expression}, {"error", value.error().message}};
    }
    return nlohmann::json{{"expression", expression}, {"result", detail::format_number(*value)}};
}

/**
 * @brief Simulated database lookup with two known records.
 */
inline Expected<nlohmann::json> get_database_record(const nlohmann::json& args) {
    const std::string record_id = args.value("recordId", std::string("unknown"));
    const std::string table = args.value("table", std::string("unknown"));

    const std::string table_key = detail::to_lower(table);
    const std::string record_key = detail::to_upper(record_id);

    if (table_key == "employees" && record_key == "EMP-001") {
        return nlohmann::json{
            {"recordId", record_id},
            {"table", table},
            {"data", {
                {"Name", "Alice Johnson"}, {"Department", "Engineering"},
                {"Role", "Senior Developer"}, {"StartDate", "2021-03-15"}
            }}
        };
    }
    if (table_key == "orders" && record_key == "ORD-555") {
        return nlohmann::json{
            {"recordId", record_id},
            {"table", table},
            {"data", {
                {"Product", "SmartWidget Pro (x10)"}, {"Total", "$2,990.00"},
                {"Status", "Shipped"}, {"Date", "2025-12-01"}
            }}
        };
    }
    return nlohmann::json{
        {"recordId", record_id},
        {"table", table},
        {"error", "Record '" + record_id + "' not found in table '" + table + "'"},
        {"suggestion", "Check the record ID and table name"}
    };
}

// ============================================================================
// Registration
// ============================================================================

inline void register_get_weather(engine::ToolDispatchRegistry& registry) {
    engine::ToolHandler handler = get_weather;
    registry.register_tool("get_weather", "Get the current weather for a given city.",
        nlohmann::json{
            {"type", "object"},
            {"properties", {{"city", detail::string_param("The city name, e.g., 'Seattle'")}}},
            {"required", nlohmann::json::array({"city"})}
        }, std::move(handler));
}

inline void register_get_stock_price(engine::ToolDispatchRegistry& registry) {
    registry.register_tool("get_stock_price", "Get the current stock price for a given ticker symbol.",
        {"symbol"}, get_stock_price, {"The stock ticker symbol, e.g., 'MSFT'"});
}

inline void register_search_knowledge_base(engine::ToolDispatchRegistry& registry) {
    engine::ToolHandler handler = search_knowledge_base;
    registry.register_tool("search_knowledge_base",
        "Search the company knowledge base for policies, pricing, and product information.",
        nlohmann::json{
            {"type", "object"},
            {"properties", {{"query", detail::string_param("The search query")}}},
            {"required", nlohmann::json::array({"query"})}
        }, std::move(handler));
}

inline void register_calculate(engine::ToolDispatchRegistry& registry) {
    registry.register_tool("calculate", "Evaluate a mathematical expression. Supports basic arithmetic.",
        {"expression"}, calculate, {"Math expression, e.g., '(100*1.08)-50'"});
}

inline void register_get_database_record(engine::ToolDispatchRegistry& registry) {
    engine::ToolHandler handler = get_database_record;
    registry.register_tool("get_database_record", "Retrieve a record from the database by ID.",
        nlohmann::json{
            {"type", "object"},
            {"properties", {
                {"recordId", detail::string_param("The record ID to look up")},
                {"table", detail::string_param("The database table name")}
            }},
            {"required", nlohmann::json::array({"recordId", "table"})}
        }, std::move(handler));
}

/** @brief Register every simulated tool. */
inline void register_builtin_tools(engine::ToolDispatchRegistry& registry) {
    register_get_weather(registry);
    register_get_stock_price(registry);
    register_search_knowledge_base(registry);
    register_calculate(registry);
    register_get_database_record(registry);
}

} // namespace tools
} // namespace turnkey
