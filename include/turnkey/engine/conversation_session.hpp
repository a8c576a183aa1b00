#pragma once

#include "../types.hpp"
#include "../service/IAgentService.hpp"
#include "resource_scope.hpp"
#include "turn_executor.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace turnkey {
namespace engine {

/**
 * @brief Several turns with one agent over a single conversation
 *
 * The conversation is created by the first turn that manages to create it;
 * every later turn reuses it. A turn that fails before any conversation
 * exists leaves the session empty, and the next turn tries again.
 *
 * The conversation is deleted when the session is destroyed.
 *
 * @threadsafety Not thread-safe; drive one session from one thread.
 */
class ConversationSession {
public:
    ConversationSession(std::shared_ptr<service::IAgentService> service,
                        TurnExecutor executor,
                        AgentConfig agent)
        : service_(std::move(service))
        , executor_(std::move(executor))
        , agent_(std::move(agent))
    {}

    TurnResult send(const Message& message) {
        std::optional<std::string> existing;
        if (!conversation_id().empty()) {
            existing = conversation_id();
        }

        auto turn = executor_.execute_turn(agent_, existing, message);
        if (!existing && !turn.conversation_id.empty()) {
            scope_ = scoped_conversation(service_, turn.conversation_id);
        }
        return turn;
    }

    TurnResult send(const std::string& text) {
        return send(Message::user(text));
    }

    /** @brief Conversation in use, or empty if no turn has created one yet. */
    const std::string& conversation_id() const { return scope_.id(); }

    const AgentConfig& agent() const { return agent_; }

    TurnExecutor& executor() { return executor_; }

private:
    std::shared_ptr<service::IAgentService> service_;
    TurnExecutor executor_;
    AgentConfig agent_;
    ScopedResource scope_;
};

} // namespace engine
} // namespace turnkey
