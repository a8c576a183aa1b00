#pragma once

/**
 * @file turnkey.hpp
 * @brief Main convenience header for turnkey
 *
 * Include this single header to get access to all public turnkey APIs.
 *
 * turnkey drives conversational turns against a hosted agent service: it
 * creates agents and conversations, polls runs to completion, answers
 * tool-call requests with local handlers, and cleans up remote resources.
 *
 * Quick Start:
 * @code
 * #include <turnkey/turnkey.hpp>
 *
 * int main() {
 *     auto settings = turnkey::load_settings("appsettings.json");
 *     if (!settings) {
 *         std::cerr << "Error: " << settings.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto service = std::make_shared<turnkey::service::HttpAgentService>(settings->service);
 *     auto registry = std::make_shared<turnkey::engine::ToolDispatchRegistry>();
 *     turnkey::tools::register_builtin_tools(*registry);
 *
 *     turnkey::AgentDefinition definition{settings->model, "weather-bot",
 *                                         "You answer weather questions.",
 *                                         registry->get_definitions(), {}, {}};
 *     auto agent = service->create_agent(definition);
 *     if (!agent) {
 *         std::cerr << "Error: " << agent.error().to_string() << std::endl;
 *         return 1;
 *     }
 *     auto agent_scope = turnkey::engine::scoped_agent(service, agent->id);
 *
 *     turnkey::engine::TurnExecutor executor(service, registry);
 *     auto turn = executor.execute_turn(*agent, std::nullopt, "What's the weather in Seattle?");
 *     auto conversation_scope = turnkey::engine::scoped_conversation(service, turn.conversation_id);
 *
 *     if (turn.response) {
 *         std::cout << "Agent: " << turn.response->text << std::endl;
 *     } else {
 *         std::cerr << "Error: " << turn.response.error().to_string() << std::endl;
 *     }
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - turnkey::engine::TurnExecutor: Polls one turn to completion, dispatching tool calls
 * - turnkey::engine::ToolDispatchRegistry: Total, non-throwing tool dispatch
 * - turnkey::engine::RetryExecutor: Bounded exponential-backoff retry
 * - turnkey::engine::ScopedResource: RAII cleanup of remote resources
 * - turnkey::engine::ConversationSession: Multi-turn conversation deleted when the session ends
 * - turnkey::service::IAgentService: Injectable service interface
 * - turnkey::Error: Structured error handling
 */

// Core types
#include "types.hpp"
#include "config.hpp"
#include "log.hpp"

// Service layer
#include "service/IAgentService.hpp"
#include "service/wire_format.hpp"
#include "service/http_agent_service.hpp"

// Engine components
#include "engine/argument_validator.hpp"
#include "engine/tool_dispatch_registry.hpp"
#include "engine/retry_executor.hpp"
#include "engine/turn_executor.hpp"
#include "engine/resource_scope.hpp"
#include "engine/conversation_session.hpp"

// Simulated tools
#include "tools/builtin_tools.hpp"
