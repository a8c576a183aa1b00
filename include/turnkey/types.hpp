#pragma once

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace turnkey {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * Error codes are grouped into ranges by category:
 * - 100-199: Configuration errors
 * - 200-299: Agent service errors (transport, HTTP status, wire format)
 * - 300-399: Run errors reported by the service or raised by the turn loop
 * - 400-499: Tool system errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    MissingEndpoint = 101,
    ConfigFileUnreadable = 102,

    // Service errors (200-299)
    ServiceTransportFailed = 200,
    ServiceRequestFailed = 201,
    ProtocolError = 202,
    ResourceNotFound = 203,

    // Run errors (300-399)
    RunFailed = 300,
    RunCancelled = 301,
    RunTimeout = 302,

    // Tool errors (400-499)
    ToolExecutionFailed = 401,
    InvalidToolArguments = 402,
    ToolLoopLimitReached = 403,

    // Unknown
    Unknown = 999
};

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (e.g., URLs, HTTP status)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Author of a conversation message
 */
enum class Role {
    User,   ///< Input from the end user
    Agent   ///< Produced by the remote agent
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Agent: return "assistant";
    }
    return "unknown";
}

/** @brief Plain text content block. */
struct TextBlock {
    std::string text;

    bool operator==(const TextBlock& other) const { return text == other.text; }
    bool operator!=(const TextBlock& other) const { return !(*this == other); }
};

/** @brief Image referenced by URL. */
struct ImageUrlBlock {
    std::string url;

    bool operator==(const ImageUrlBlock& other) const { return url == other.url; }
    bool operator!=(const ImageUrlBlock& other) const { return !(*this == other); }
};

/// Closed set of message content kinds.
using ContentBlock = std::variant<TextBlock, ImageUrlBlock>;

/**
 * @brief Single message in a conversation
 *
 * Value type holding the role and an ordered list of content blocks.
 * Messages are immutable once appended to a conversation.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Message {
    Role role = Role::User;             ///< Message author
    std::vector<ContentBlock> content;  ///< Ordered content blocks
    std::string id;                     ///< Service-assigned identifier (empty before append)

    // Factory methods
    static Message user(std::string text) {
        return Message{Role::User, {TextBlock{std::move(text)}}, {}};
    }

    static Message user(std::vector<ContentBlock> blocks) {
        return Message{Role::User, std::move(blocks), {}};
    }

    static Message agent(std::string text) {
        return Message{Role::Agent, {TextBlock{std::move(text)}}, {}};
    }

    /** @brief True if at least one block is a TextBlock. */
    bool has_text() const {
        for (const auto& block : content) {
            if (std::holds_alternative<TextBlock>(block)) return true;
        }
        return false;
    }

    /** @brief Text blocks joined by newlines; image blocks are skipped. */
    std::string text() const {
        std::string out;
        for (const auto& block : content) {
            if (const auto* t = std::get_if<TextBlock>(&block)) {
                if (!out.empty()) out += "\n";
                out += t->text;
            }
        }
        return out;
    }

    // Equality for testing
    bool operator==(const Message& other) const {
        return role == other.role && content == other.content && id == other.id;
    }

    bool operator!=(const Message& other) const {
        return !(*this == other);
    }
};

/** @brief Ordering for listing conversation messages. */
enum class SortOrder {
    Ascending,
    Descending
};

// ============================================================================
// Run Types
// ============================================================================

/**
 * @brief Status of a run on the remote service
 *
 * Queued -> InProgress -> {RequiresAction | Completed | Failed};
 * RequiresAction -> {Queued | InProgress} after tool outputs are submitted;
 * any non-terminal state -> Cancelled on client cancel.
 */
enum class RunStatus {
    Queued,
    InProgress,
    RequiresAction,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] inline const char* run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Queued: return "queued";
        case RunStatus::InProgress: return "in_progress";
        case RunStatus::RequiresAction: return "requires_action";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed: return "failed";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] inline bool is_terminal(RunStatus status) {
    return status == RunStatus::Completed ||
           status == RunStatus::Failed ||
           status == RunStatus::Cancelled;
}

/** @brief A function call requested by a paused run. */
struct ToolCall {
    std::string id;              ///< Opaque call identifier assigned by the service
    std::string name;            ///< Name of the function to invoke
    nlohmann::json arguments;    ///< Argument document (object, or raw text if the service sent invalid JSON)

    bool operator==(const ToolCall& other) const {
        return id == other.id && name == other.name && arguments == other.arguments;
    }
    bool operator!=(const ToolCall& other) const { return !(*this == other); }
};

/** @brief Result of a tool call, submitted back to resume the run. */
struct ToolOutput {
    std::string tool_call_id;  ///< Matches ToolCall::id
    std::string output;        ///< Serialized result payload

    bool operator==(const ToolOutput& other) const {
        return tool_call_id == other.tool_call_id && output == other.output;
    }
    bool operator!=(const ToolOutput& other) const { return !(*this == other); }
};

/** @brief Error payload carried by a failed run. */
struct RunError {
    std::string code;
    std::string message;
};

/**
 * @brief Snapshot of a run as last reported by the service
 */
struct Run {
    std::string id;
    std::string conversation_id;
    RunStatus status = RunStatus::Queued;
    std::vector<ToolCall> required_tool_calls;  ///< Non-empty only when RequiresAction
    std::optional<RunError> last_error;
};

// ============================================================================
// Agent Configuration Types
// ============================================================================

enum class ToolKind {
    Function,
    CodeInterpreter,
    FileSearch,
    AzureAISearch
};

/**
 * @brief Tool declaration handed to the service at agent creation
 *
 * Only Function tools carry a name, description and parameter schema.
 */
struct ToolDefinition {
    ToolKind kind = ToolKind::Function;
    std::string name;
    std::string description;
    nlohmann::json parameters;

    static ToolDefinition function(std::string name, std::string description, nlohmann::json parameters) {
        return ToolDefinition{ToolKind::Function, std::move(name), std::move(description), std::move(parameters)};
    }

    static ToolDefinition code_interpreter() {
        return ToolDefinition{ToolKind::CodeInterpreter, {}, {}, {}};
    }

    static ToolDefinition file_search() {
        return ToolDefinition{ToolKind::FileSearch, {}, {}, {}};
    }

    static ToolDefinition azure_ai_search() {
        return ToolDefinition{ToolKind::AzureAISearch, {}, {}, {}};
    }
};

/**
 * @brief Everything needed to create an agent configuration on the service
 */
struct AgentDefinition {
    std::string model;
    std::string name;
    std::string instructions;
    std::vector<ToolDefinition> tools;
    std::optional<nlohmann::json> tool_resources;   ///< e.g. vector store ids for file search
    std::optional<nlohmann::json> response_format;  ///< e.g. {"type": "json_object"}
};

/** @brief Agent configuration as created by the service. */
struct AgentConfig {
    std::string id;
    std::string name;
    std::string model;
};

/** @brief Uploaded file handle. */
struct FileHandle {
    std::string id;
    std::string filename;
};

/** @brief Vector store handle with indexing progress. */
struct VectorStore {
    std::string id;
    std::string name;
    std::string status;
    int files_completed = 0;
};

// ============================================================================
// Response Types
// ============================================================================

/// Returned as the text of a completed turn that produced no agent message.
inline constexpr const char* kNoResponseText = "[No response received]";

/**
 * @brief Result of one completed turn
 */
struct Response {
    std::string text;                         ///< Latest agent text (or kNoResponseText)
    std::string run_id;                       ///< Run that produced the text
    int tool_round_trips = 0;                 ///< Number of RequiresAction submissions
    std::vector<ToolOutput> tool_outputs;     ///< Every output submitted during the turn
    std::chrono::milliseconds latency{0};     ///< Message append to terminal status
};

} // namespace turnkey
