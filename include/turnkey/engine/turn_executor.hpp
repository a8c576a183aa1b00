#pragma once

#include "../types.hpp"
#include "../config.hpp"
#include "../log.hpp"
#include "../service/IAgentService.hpp"
#include "retry_executor.hpp"
#include "tool_dispatch_registry.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace turnkey {
namespace engine {

/// Returned by the resilient turn once every attempt has failed.
inline constexpr const char* kServiceUnavailableText =
    "[Service temporarily unavailable. Please try again later.]";

/// Monotonic time source; injectable so timeout tests do not wait in real time.
using Clock = std::function<std::chrono::steady_clock::time_point()>;

inline Clock default_clock() {
    return [] { return std::chrono::steady_clock::now(); };
}

/**
 * @brief Outcome of execute_turn()
 *
 * The conversation handle is reported even when the turn fails, so a caller
 * that let the executor create the conversation can still reuse or delete it.
 */
struct TurnResult {
    std::string conversation_id;     ///< Empty only if conversation creation failed
    Expected<Response> response;     ///< Agent text or the failure that ended the turn
};

/**
 * @brief Outcome of execute_turn_or_fallback()
 */
struct ResilientTurnResult {
    std::string conversation_id;
    std::string text;                ///< Agent text, or kServiceUnavailableText
    int attempts = 0;                ///< Turn attempts made
    bool fallback_used = false;
    std::optional<Error> last_error; ///< Error of the final failed attempt, if any
};

/**
 * @brief Drives one user turn to a terminal run state
 *
 * The TurnExecutor:
 * - Creates the conversation when none is supplied
 * - Appends the user message and starts a run
 * - Polls the run at a constant interval
 * - Dispatches every pending tool call through the registry and submits the
 *   outputs as one batch
 * - Reads the newest agent message once the run completes
 *
 * Optional limits (run timeout, tool round-trip cap) come from TurnConfig.
 * A run that outlives the timeout is cancelled on a best-effort basis.
 *
 * @threadsafety One executor may serve several conversations from different
 * threads; the clock and sleeper must not be replaced while turns are running.
 */
class TurnExecutor {
public:
    TurnExecutor(
        std::shared_ptr<service::IAgentService> service,
        std::shared_ptr<ToolDispatchRegistry> registry,
        TurnConfig config = {}
    )
        : service_(std::move(service))
        , registry_(std::move(registry))
        , config_(std::move(config))
        , clock_(default_clock())
        , sleeper_(default_sleeper())
    {}

    /** @brief Replace the time source used for timeouts and latency. */
    void set_clock(Clock clock) {
        clock_ = std::move(clock);
    }

    /** @brief Replace the function used to wait between polls and retries. */
    void set_sleeper(Sleeper sleeper) {
        sleeper_ = std::move(sleeper);
    }

    /** @brief Set the run timeout (nullopt waits indefinitely). */
    void set_run_timeout(std::optional<std::chrono::seconds> timeout) {
        config_.run_timeout = timeout;
    }

    /** @brief Set the tool round-trip cap (nullopt is unbounded). */
    void set_max_tool_round_trips(std::optional<int> max) {
        config_.max_tool_round_trips = max;
    }

    const TurnConfig& config() const { return config_; }

    /**
     * @brief Execute a single turn
     *
     * @param agent Agent configuration that runs the turn
     * @param conversation_id Existing conversation, or nullopt to create one
     * @param user_message User message to append (text and/or image blocks)
     */
    TurnResult execute_turn(
        const AgentConfig& agent,
        const std::optional<std::string>& conversation_id,
        const Message& user_message
    ) const {
        TurnResult result{conversation_id.value_or(std::string()), Response{}};

        if (!conversation_id) {
            auto created = service_->create_conversation();
            if (!created) {
                result.response = tl::unexpected(created.error());
                return result;
            }
            result.conversation_id = *created;
            log::logger()->debug("Created conversation {}", result.conversation_id);
        }

        result.response = run_turn(agent, result.conversation_id, user_message);
        return result;
    }

    /** @brief execute_turn() for a plain text message. */
    TurnResult execute_turn(
        const AgentConfig& agent,
        const std::optional<std::string>& conversation_id,
        const std::string& text
    ) const {
        return execute_turn(agent, conversation_id, Message::user(text));
    }

    /**
     * @brief Execute a turn with retries, falling back to a fixed text
     *
     * The conversation is created once and shared by every attempt; each
     * attempt appends the user message again. Run failures, timeouts and the
     * round-trip cap all count as failed attempts.
     */
    ResilientTurnResult execute_turn_or_fallback(
        const AgentConfig& agent,
        const std::optional<std::string>& conversation_id,
        const Message& user_message,
        const RetryPolicy& policy
    ) const {
        ResilientTurnResult out;
        out.conversation_id = conversation_id.value_or(std::string());

        RetryExecutor retry(policy, sleeper_);
        auto result = retry.run("Agent turn", [&]() -> Expected<Response> {
            ++out.attempts;
            if (out.conversation_id.empty()) {
                auto created = service_->create_conversation();
                if (!created) {
                    return tl::unexpected(created.error());
                }
                out.conversation_id = *created;
            }
            return run_turn(agent, out.conversation_id, user_message);
        });

        if (result) {
            out.text = std::move(result->text);
            return out;
        }

        out.text = kServiceUnavailableText;
        out.fallback_used = true;
        out.last_error = result.error();
        return out;
    }

    /** @brief execute_turn_or_fallback() for a plain text message. */
    ResilientTurnResult execute_turn_or_fallback(
        const AgentConfig& agent,
        const std::optional<std::string>& conversation_id,
        const std::string& text,
        const RetryPolicy& policy
    ) const {
        return execute_turn_or_fallback(agent, conversation_id, Message::user(text), policy);
    }

private:
    Expected<Response> run_turn(
        const AgentConfig& agent,
        const std::string& conversation_id,
        const Message& user_message
    ) const {
        const auto start_time = clock_();

        if (auto appended = service_->append_message(conversation_id, user_message); !appended) {
            return tl::unexpected(appended.error());
        }

        auto created = service_->create_run(conversation_id, agent);
        if (!created) {
            return tl::unexpected(created.error());
        }
        const std::string run_id = created->id;

        Response response;
        response.run_id = run_id;

        while (true) {
            sleeper_(config_.poll_interval);

            auto run = service_->get_run(conversation_id, run_id);
            if (!run) {
                return tl::unexpected(run.error());
            }
            log::logger()->debug("Run {} status: {}", run_id, run_status_to_string(run->status));

            if (!is_terminal(run->status) && timed_out(start_time)) {
                cancel_quietly(conversation_id, run_id);
                return tl::unexpected(Error{
                    ErrorCode::RunTimeout,
                    "Run timed out after " + std::to_string(config_.run_timeout->count()) + "s",
                    run_id
                });
            }

            switch (run->status) {
                case RunStatus::Queued:
                case RunStatus::InProgress:
                    continue;

                case RunStatus::RequiresAction: {
                    if (run->required_tool_calls.empty()) {
                        return tl::unexpected(Error{
                            ErrorCode::ProtocolError,
                            "Run requires action but lists no tool calls",
                            run_id
                        });
                    }

                    std::vector<ToolOutput> outputs;
                    outputs.reserve(run->required_tool_calls.size());
                    for (const auto& call : run->required_tool_calls) {
                        outputs.push_back(registry_->dispatch(call));
                        log::logger()->debug("  [Tool result]: {}", outputs.back().output);
                    }

                    auto submitted = service_->submit_tool_outputs(*run, outputs);
                    if (!submitted) {
                        return tl::unexpected(submitted.error());
                    }
                    ++response.tool_round_trips;
                    response.tool_outputs.insert(response.tool_outputs.end(), outputs.begin(), outputs.end());

                    if (config_.max_tool_round_trips &&
                        response.tool_round_trips >= *config_.max_tool_round_trips) {
                        log::logger()->warn("Run {} reached the tool round-trip limit ({})",
                                            run_id, *config_.max_tool_round_trips);
                        return tl::unexpected(Error{
                            ErrorCode::ToolLoopLimitReached,
                            "Tool round-trip limit reached (" +
                                std::to_string(*config_.max_tool_round_trips) + ")",
                            run_id
                        });
                    }
                    continue;
                }

                case RunStatus::Completed:
                    break;

                case RunStatus::Failed: {
                    std::string message = "Run failed";
                    std::optional<std::string> context = run_id;
                    if (run->last_error) {
                        if (!run->last_error->message.empty()) {
                            message = run->last_error->message;
                        }
                        if (!run->last_error->code.empty()) {
                            context = run->last_error->code;
                        }
                    }
                    log::logger()->error("Run {} failed: {}", run_id, message);
                    return tl::unexpected(Error{ErrorCode::RunFailed, message, context});
                }

                case RunStatus::Cancelled:
                    return tl::unexpected(Error{ErrorCode::RunCancelled, "Run was cancelled", run_id});
            }
            break;
        }

        response.latency = std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - start_time);
        log::logger()->info("Run {} completed in {}ms", run_id, response.latency.count());

        auto messages = service_->list_messages(conversation_id, SortOrder::Descending);
        if (!messages) {
            return tl::unexpected(messages.error());
        }

        response.text = kNoResponseText;
        for (const auto& message : *messages) {
            if (message.role == Role::Agent && message.has_text()) {
                response.text = message.text();
                break;
            }
        }
        return response;
    }

    bool timed_out(std::chrono::steady_clock::time_point start_time) const {
        return config_.run_timeout && (clock_() - start_time) > *config_.run_timeout;
    }

    void cancel_quietly(const std::string& conversation_id, const std::string& run_id) const {
        log::logger()->warn("Run {} exceeded {}s, cancelling", run_id, config_.run_timeout->count());
        if (auto cancelled = service_->cancel_run(conversation_id, run_id); !cancelled) {
            log::logger()->warn("Cancel of run {} failed: {}", run_id, cancelled.error().message);
        }
    }

    std::shared_ptr<service::IAgentService> service_;
    std::shared_ptr<ToolDispatchRegistry> registry_;
    TurnConfig config_;
    Clock clock_;
    Sleeper sleeper_;
};

/**
 * @brief Create an agent configuration, retrying transient failures
 *
 * Exhaustion propagates the final error to the caller.
 */
inline Expected<AgentConfig> create_agent_with_retry(
    service::IAgentService& service,
    const AgentDefinition& definition,
    const RetryExecutor& retry
) {
    auto created = retry.run("Agent creation", [&]() { return service.create_agent(definition); });
    if (created) {
        log::logger()->info("Created agent {} ({})", created->name, created->id);
    }
    return created;
}

} // namespace engine
} // namespace turnkey
