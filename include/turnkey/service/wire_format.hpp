#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace turnkey {
namespace service {
namespace wire {

// ============================================================================
// Encoding (client -> service)
// ============================================================================

inline nlohmann::json encode_tool(const ToolDefinition& tool) {
    switch (tool.kind) {
        case ToolKind::Function:
            return nlohmann::json{
                {"type", "function"},
                {"function", {
                    {"name", tool.name},
                    {"description", tool.description},
                    {"parameters", tool.parameters.is_null() ? nlohmann::json::object() : tool.parameters}
                }}
            };
        case ToolKind::CodeInterpreter:
            return nlohmann::json{{"type", "code_interpreter"}};
        case ToolKind::FileSearch:
            return nlohmann::json{{"type", "file_search"}};
        case ToolKind::AzureAISearch:
            return nlohmann::json{{"type", "azure_ai_search"}};
    }
    return nlohmann::json{{"type", "function"}};
}

inline nlohmann::json encode_agent(const AgentDefinition& definition) {
    nlohmann::json body{
        {"model", definition.model},
        {"name", definition.name},
        {"instructions", definition.instructions},
        {"tools", nlohmann::json::array()}
    };
    for (const auto& tool : definition.tools) {
        body["tools"].push_back(encode_tool(tool));
    }
    if (definition.tool_resources) {
        body["tool_resources"] = *definition.tool_resources;
    }
    if (definition.response_format) {
        body["response_format"] = *definition.response_format;
    }
    return body;
}

inline nlohmann::json encode_content(const std::vector<ContentBlock>& blocks) {
    nlohmann::json content = nlohmann::json::array();
    for (const auto& block : blocks) {
        if (const auto* text = std::get_if<TextBlock>(&block)) {
            content.push_back(nlohmann::json{{"type", "text"}, {"text", text->text}});
        } else if (const auto* image = std::get_if<ImageUrlBlock>(&block)) {
            content.push_back(nlohmann::json{{"type", "image_url"}, {"image_url", {{"url", image->url}}}});
        }
    }
    return content;
}

inline nlohmann::json encode_message(const Message& message) {
    return nlohmann::json{
        {"role", role_to_string(message.role)},
        {"content", encode_content(message.content)}
    };
}

inline nlohmann::json encode_tool_outputs(const std::vector<ToolOutput>& outputs) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& output : outputs) {
        list.push_back(nlohmann::json{{"tool_call_id", output.tool_call_id}, {"output", output.output}});
    }
    return nlohmann::json{{"tool_outputs", std::move(list)}};
}

// ============================================================================
// Decoding (service -> client)
// ============================================================================

namespace detail {

inline tl::unexpected<Error> protocol_error(const std::string& message, const nlohmann::json& body) {
    return tl::unexpected(Error{ErrorCode::ProtocolError, message,
        body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)});
}

inline Expected<std::string> require_id(const nlohmann::json& body) {
    auto it = body.find("id");
    if (it == body.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return protocol_error("Response is missing an 'id'", body);
    }
    return it->get<std::string>();
}

/** @brief String member of an object, or "" when absent, null or not a string. */
inline std::string string_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return std::string();
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
}

} // namespace detail

/**
 * @brief Map a wire status string to RunStatus.
 *
 * "cancelling" is reported as Cancelled because the client never re-polls a
 * run it cancelled; "expired" is handled by decode_run as a failure.
 */
inline Expected<RunStatus> decode_run_status(const std::string& status) {
    if (status == "queued") return RunStatus::Queued;
    if (status == "in_progress") return RunStatus::InProgress;
    if (status == "requires_action") return RunStatus::RequiresAction;
    if (status == "completed") return RunStatus::Completed;
    if (status == "failed" || status == "expired") return RunStatus::Failed;
    if (status == "cancelled" || status == "cancelling") return RunStatus::Cancelled;
    return tl::unexpected(Error{ErrorCode::ProtocolError, "Unrecognized run status: " + status});
}

inline Expected<ToolCall> decode_tool_call(const nlohmann::json& call) {
    auto id = detail::require_id(call);
    if (!id) return tl::unexpected(id.error());

    auto fn = call.find("function");
    if (fn == call.end() || !fn->is_object() || !fn->contains("name") || !(*fn)["name"].is_string()) {
        return detail::protocol_error("Tool call is missing a function name", call);
    }

    ToolCall tc;
    tc.id = *id;
    tc.name = (*fn)["name"].get<std::string>();

    // Arguments travel as a JSON-encoded string. Text that does not parse is
    // kept verbatim so the dispatcher can report it as an invalid format.
    auto args = fn->find("arguments");
    if (args == fn->end() || args->is_null()) {
        tc.arguments = nlohmann::json::object();
    } else if (args->is_string()) {
        const auto& text = args->get_ref<const std::string&>();
        tc.arguments = nlohmann::json::parse(text, nullptr, false);
        if (tc.arguments.is_discarded()) {
            tc.arguments = text;
        }
    } else {
        tc.arguments = *args;
    }
    return tc;
}

inline Expected<Run> decode_run(const nlohmann::json& body) {
    auto id = detail::require_id(body);
    if (!id) return tl::unexpected(id.error());

    auto status_it = body.find("status");
    if (status_it == body.end() || !status_it->is_string()) {
        return detail::protocol_error("Run is missing a 'status'", body);
    }
    const auto& status_text = status_it->get_ref<const std::string&>();
    auto status = decode_run_status(status_text);
    if (!status) return tl::unexpected(status.error());

    Run run;
    run.id = *id;
    run.conversation_id = detail::string_field(body, "thread_id");
    run.status = *status;

    if (run.status == RunStatus::RequiresAction) {
        const auto pointer = nlohmann::json::json_pointer("/required_action/submit_tool_outputs/tool_calls");
        if (body.contains(pointer) && body.at(pointer).is_array()) {
            for (const auto& call : body.at(pointer)) {
                auto tc = decode_tool_call(call);
                if (!tc) return tl::unexpected(tc.error());
                run.required_tool_calls.push_back(std::move(*tc));
            }
        }
    }

    auto error_it = body.find("last_error");
    if (error_it != body.end() && error_it->is_object()) {
        run.last_error = RunError{
            detail::string_field(*error_it, "code"),
            detail::string_field(*error_it, "message")
        };
    }
    if (status_text == "expired" && !run.last_error) {
        run.last_error = RunError{"expired", "Run expired"};
    }
    return run;
}

inline Expected<Message> decode_message(const nlohmann::json& body) {
    auto id = detail::require_id(body);
    if (!id) return tl::unexpected(id.error());

    Message message;
    message.id = *id;
    const std::string role = detail::string_field(body, "role");
    if (role == "user") {
        message.role = Role::User;
    } else if (role == "assistant" || role == "agent") {
        message.role = Role::Agent;
    } else {
        return detail::protocol_error("Unrecognized message role: " + role, body);
    }

    auto content = body.find("content");
    if (content != body.end() && content->is_array()) {
        for (const auto& item : *content) {
            if (!item.is_object()) {
                return detail::protocol_error("Message content item is not an object", body);
            }
            const std::string type = detail::string_field(item, "type");
            if (type == "text") {
                // Stored text is {"value": ..., "annotations": [...]}; input echoes may be a bare string.
                const auto& text = item.contains("text") ? item["text"] : nlohmann::json();
                if (text.is_object()) {
                    message.content.push_back(TextBlock{detail::string_field(text, "value")});
                } else if (text.is_string()) {
                    message.content.push_back(TextBlock{text.get<std::string>()});
                }
            } else if (type == "image_url") {
                const auto pointer = nlohmann::json::json_pointer("/image_url/url");
                if (item.contains(pointer) && item.at(pointer).is_string()) {
                    message.content.push_back(ImageUrlBlock{item.at(pointer).get<std::string>()});
                }
            }
            // Other block kinds (image_file, annotations-only) carry nothing this client renders.
        }
    } else if (content != body.end() && content->is_string()) {
        message.content.push_back(TextBlock{content->get<std::string>()});
    }
    return message;
}

inline Expected<std::vector<Message>> decode_message_list(const nlohmann::json& body) {
    auto data = body.find("data");
    if (data == body.end() || !data->is_array()) {
        return detail::protocol_error("Message list is missing 'data'", body);
    }
    std::vector<Message> messages;
    messages.reserve(data->size());
    for (const auto& item : *data) {
        auto message = decode_message(item);
        if (!message) return tl::unexpected(message.error());
        messages.push_back(std::move(*message));
    }
    return messages;
}

inline Expected<AgentConfig> decode_agent(const nlohmann::json& body) {
    auto id = detail::require_id(body);
    if (!id) return tl::unexpected(id.error());
    return AgentConfig{*id, detail::string_field(body, "name"), detail::string_field(body, "model")};
}

inline Expected<VectorStore> decode_vector_store(const nlohmann::json& body) {
    auto id = detail::require_id(body);
    if (!id) return tl::unexpected(id.error());
    VectorStore store;
    store.id = *id;
    store.name = detail::string_field(body, "name");
    store.status = detail::string_field(body, "status");
    const auto pointer = nlohmann::json::json_pointer("/file_counts/completed");
    if (body.contains(pointer) && body.at(pointer).is_number_integer()) {
        store.files_completed = body.at(pointer).get<int>();
    }
    return store;
}

/** @brief Extract the service's error message from an error response body. */
inline std::string decode_error_message(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        const auto pointer = nlohmann::json::json_pointer("/error/message");
        if (parsed.contains(pointer) && parsed.at(pointer).is_string()) {
            return parsed.at(pointer).get<std::string>();
        }
        if (parsed.contains("message") && parsed["message"].is_string()) {
            return parsed["message"].get<std::string>();
        }
    }
    return body;
}

} // namespace wire
} // namespace service
} // namespace turnkey
