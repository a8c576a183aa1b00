#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "argument_validator.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

namespace turnkey {
namespace engine {

// ============================================================================
// Tool Handler Type
// ============================================================================

/** @brief Callable type for tool execution; takes JSON arguments and returns a JSON payload or Error. */
using ToolHandler = std::function<Expected<nlohmann::json>(const nlohmann::json&)>;

// ============================================================================
// Type Traits for JSON Schema Generation
// ============================================================================

namespace detail {

template<typename T>
struct json_type_name;

template<> struct json_type_name<int> {
    static constexpr const char* type = "integer";
};

template<> struct json_type_name<float> {
    static constexpr const char* type = "number";
};

template<> struct json_type_name<double> {
    static constexpr const char* type = "number";
};

template<> struct json_type_name<bool> {
    static constexpr const char* type = "boolean";
};

template<> struct json_type_name<std::string> {
    static constexpr const char* type = "string";
};

template<typename T>
struct function_traits;

template<typename R, typename... Args>
struct function_traits<R(*)(Args...)> {
    using return_type = R;
    using args_tuple = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename C, typename R, typename... Args>
struct function_traits<R(C::*)(Args...) const> {
    using return_type = R;
    using args_tuple = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename C, typename R, typename... Args>
struct function_traits<R(C::*)(Args...)> {
    using return_type = R;
    using args_tuple = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

// Lambda / functor: delegate to operator()
template<typename T>
struct function_traits : function_traits<decltype(&T::operator())> {};

template<typename R, typename... Args>
struct function_traits<std::function<R(Args...)>> {
    using return_type = R;
    using args_tuple = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

inline nlohmann::json param_schema(const char* type, const std::vector<std::string>& descriptions, size_t index) {
    nlohmann::json schema{{"type", type}};
    if (index < descriptions.size() && !descriptions[index].empty()) {
        schema["description"] = descriptions[index];
    }
    return schema;
}

template<typename Tuple, size_t... Is>
nlohmann::json build_properties_impl(const std::vector<std::string>& param_names,
                                     const std::vector<std::string>& param_descriptions,
                                     std::index_sequence<Is...>) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    ((properties[param_names[Is]] = param_schema(
        json_type_name<std::tuple_element_t<Is, Tuple>>::type, param_descriptions, Is),
      required.push_back(param_names[Is])), ...);

    return nlohmann::json{
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

template<typename Tuple>
nlohmann::json build_properties(const std::vector<std::string>& param_names,
                                const std::vector<std::string>& param_descriptions) {
    constexpr size_t N = std::tuple_size_v<Tuple>;
    return build_properties_impl<Tuple>(param_names, param_descriptions, std::make_index_sequence<N>{});
}

template<typename T>
T extract_arg(const nlohmann::json& args, const std::string& name) {
    return args.at(name).get<T>();
}

template<typename Func, typename Tuple, size_t... Is>
auto invoke_with_json_impl(const Func& func, const nlohmann::json& args,
                           const std::vector<std::string>& param_names,
                           std::index_sequence<Is...>) {
    return func(extract_arg<std::tuple_element_t<Is, Tuple>>(args, param_names[Is])...);
}

template<typename Func, typename Tuple>
auto invoke_with_json(const Func& func, const nlohmann::json& args,
                      const std::vector<std::string>& param_names) {
    constexpr size_t N = std::tuple_size_v<Tuple>;
    return invoke_with_json_impl<Func, Tuple>(func, args, param_names, std::make_index_sequence<N>{});
}

// Objects pass through as the payload; anything else is wrapped as {"result": value}.
template<typename T>
nlohmann::json wrap_result(T&& value) {
    nlohmann::json j = std::forward<T>(value);
    if (j.is_object()) {
        return j;
    }
    return nlohmann::json{{"result", std::move(j)}};
}

} // namespace detail

// ============================================================================
// Tool Registration Entry
// ============================================================================

/** @brief Holds metadata and handler for a single registered tool. */
struct ToolEntry {
    std::string name;                    ///< Unique tool name used for dispatch
    std::string description;             ///< Human-readable description handed to the service
    nlohmann::json parameters_schema;    ///< JSON Schema describing expected parameters
    ToolHandler handler;                 ///< Callable that executes the tool logic
};

// ============================================================================
// ToolDispatchRegistry
// ============================================================================

/**
 * @brief Maps tool-call names to local handlers and executes them.
 *
 * dispatch() is total: every (name, arguments) pair yields a JSON payload,
 * either the handler's result or a structured error object. Exceptions from
 * handlers and argument parsing never cross the dispatch boundary.
 *
 * @threadsafety All public methods are thread-safe. Read operations use shared
 * locks; register_tool uses an exclusive lock.
 */
class ToolDispatchRegistry {
public:
    /**
     * Template-based registration: extracts parameter types and generates schema.
     *
     * @param name Tool name
     * @param description Tool description
     * @param param_names Parameter names (must match function arity)
     * @param func Callable to invoke
     * @param param_descriptions Optional per-parameter descriptions, parallel to param_names
     */
    template<typename Func>
    void register_tool(const std::string& name, const std::string& description,
                       const std::vector<std::string>& param_names, Func func,
                       const std::vector<std::string>& param_descriptions = {}) {
        using traits = detail::function_traits<Func>;
        using args_tuple = typename traits::args_tuple;

        if (param_names.size() != traits::arity) {
            throw std::invalid_argument(
                "Parameter name count (" + std::to_string(param_names.size()) +
                ") does not match function arity (" + std::to_string(traits::arity) + ")");
        }
        if (!param_descriptions.empty() && param_descriptions.size() != param_names.size()) {
            throw std::invalid_argument(
                "Parameter description count (" + std::to_string(param_descriptions.size()) +
                ") does not match parameter name count (" + std::to_string(param_names.size()) + ")");
        }

        nlohmann::json schema;
        if constexpr (traits::arity == 0) {
            schema = nlohmann::json{
                {"type", "object"},
                {"properties", nlohmann::json::object()},
                {"required", nlohmann::json::array()}
            };
        } else {
            schema = detail::build_properties<args_tuple>(param_names, param_descriptions);
        }

        ToolHandler handler = [f = std::move(func), names = param_names](
            const nlohmann::json& args) -> Expected<nlohmann::json> {
            if constexpr (traits::arity == 0) {
                return detail::wrap_result(f());
            } else {
                return detail::wrap_result(
                    detail::invoke_with_json<decltype(f), args_tuple>(f, args, names));
            }
        };

        register_tool(name, description, std::move(schema), std::move(handler));
    }

    /**
     * @brief Manual registration with an explicit JSON schema and handler.
     *
     * Re-registering a name replaces the previous entry.
     */
    void register_tool(const std::string& name, const std::string& description,
                       nlohmann::json schema, ToolHandler handler) {
        std::unique_lock lock(mutex_);
        tools_.insert_or_assign(name, ToolEntry{name, description, std::move(schema), std::move(handler)});
    }

    /** @brief Check whether a tool with the given name is registered. */
    bool has_tool(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return tools_.find(name) != tools_.end();
    }

    /**
     * @brief Execute a tool call and return its payload.
     *
     * Never throws. Failure payloads carry an "error" field:
     * - "Unknown function: <name>" for unregistered names
     * - "Invalid argument format" when argument text is not JSON
     * - "Invalid arguments" when arguments violate the declared schema
     * - "Tool execution failed" when the handler errors or throws
     *
     * @param name Function name requested by the service
     * @param arguments Argument object, or a JSON-encoded string of one
     */
    nlohmann::json dispatch(const std::string& name, const nlohmann::json& arguments) const noexcept {
        try {
            return dispatch_unchecked(name, arguments);
        } catch (const std::exception& e) {
            return error_payload("Tool execution failed", e.what());
        }
    }

    /** @brief dispatch() for a ToolCall, serialized for submission. */
    ToolOutput dispatch(const ToolCall& call) const noexcept {
        ToolOutput output;
        output.tool_call_id = call.id;
        try {
            output.output = dispatch(call.name, call.arguments).dump();
        } catch (const std::exception& e) {
            // dump() rejects invalid UTF-8 in handler output
            output.output = error_payload("Tool execution failed", e.what()).dump(
                -1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        return output;
    }

    /** @brief Get the service-facing declaration for one tool, or nullopt if not found. */
    std::optional<ToolDefinition> get_definition(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return std::nullopt;
        }
        return to_definition(it->second);
    }

    /** @brief Get declarations for every registered tool, ordered by name. */
    std::vector<ToolDefinition> get_definitions() const {
        std::shared_lock lock(mutex_);
        std::vector<ToolDefinition> definitions;
        definitions.reserve(tools_.size());
        for (const auto& [name, entry] : tools_) {
            definitions.push_back(to_definition(entry));
        }
        return definitions;
    }

    /** @brief Return a list of all registered tool names. */
    std::vector<std::string> get_tool_names() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(tools_.size());
        for (const auto& [name, _] : tools_) {
            names.push_back(name);
        }
        return names;
    }

    /** @brief Return the number of registered tools. */
    size_t size() const {
        std::shared_lock lock(mutex_);
        return tools_.size();
    }

    /** @brief Build the structured error payload returned for failed calls. */
    static nlohmann::json error_payload(const std::string& error, const std::string& details) {
        return nlohmann::json{{"error", error}, {"details", details}};
    }

private:
    nlohmann::json dispatch_unchecked(const std::string& name, const nlohmann::json& arguments) const {
        log::logger()->debug("  [Tool call]: {}({})", name, arguments.dump());

        ToolHandler handler;
        nlohmann::json schema;
        {
            std::shared_lock lock(mutex_);
            auto it = tools_.find(name);
            if (it == tools_.end()) {
                return nlohmann::json{{"error", "Unknown function: " + name}};
            }
            handler = it->second.handler;
            schema = it->second.parameters_schema;
        }

        nlohmann::json args = arguments;
        if (args.is_string()) {
            try {
                args = nlohmann::json::parse(arguments.get_ref<const std::string&>());
            } catch (const nlohmann::json::exception& e) {
                log::logger()->warn("  [Tool error]: Invalid JSON arguments for {}: {}", name, e.what());
                return error_payload("Invalid argument format", e.what());
            }
        } else if (args.is_null()) {
            args = nlohmann::json::object();
        }

        auto validation_error = ArgumentValidator::validate(args, schema);
        if (!validation_error.empty()) {
            log::logger()->warn("  [Tool error]: {}: {}", name, validation_error);
            return error_payload("Invalid arguments", validation_error);
        }

        Expected<nlohmann::json> result = [&]() -> Expected<nlohmann::json> {
            try {
                return handler(args);
            } catch (const nlohmann::json::exception& e) {
                return tl::unexpected(Error{ErrorCode::InvalidToolArguments,
                    std::string("JSON argument error: ") + e.what()});
            } catch (const std::exception& e) {
                return tl::unexpected(Error{ErrorCode::ToolExecutionFailed, e.what()});
            }
        }();

        if (!result) {
            log::logger()->warn("  [Tool error]: {}: {}", name, result.error().message);
            return error_payload("Tool execution failed", result.error().message);
        }
        return std::move(*result);
    }

    static ToolDefinition to_definition(const ToolEntry& entry) {
        return ToolDefinition::function(entry.name, entry.description, entry.parameters_schema);
    }

    std::map<std::string, ToolEntry> tools_;
    mutable std::shared_mutex mutex_;
};

} // namespace engine
} // namespace turnkey
