#pragma once

#include "../types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace turnkey {
namespace service {

/**
 * @brief Abstract interface to the remote agent service
 *
 * This interface abstracts the hosted agent REST API and enables dependency
 * injection for testing. Every call is remote and fallible; failures are
 * returned as Error values, never thrown.
 *
 * Design principles:
 * - Stateless-shared: implementations may be used from several conversations
 *   concurrently; the service orders operations within one conversation
 * - Synchronous: all operations block until the service answers
 */
class IAgentService {
public:
    virtual ~IAgentService() = default;

    /**
     * @brief Create an agent configuration (model, instructions, tools)
     *
     * @param definition Agent definition to register
     * @return Expected<AgentConfig> Created configuration or error
     */
    virtual Expected<AgentConfig> create_agent(const AgentDefinition& definition) = 0;

    /** @brief Delete an agent configuration. */
    virtual Expected<void> delete_agent(const std::string& agent_id) = 0;

    /**
     * @brief Create an empty conversation
     *
     * @return Expected<std::string> Conversation handle or error
     */
    virtual Expected<std::string> create_conversation() = 0;

    /** @brief Delete a conversation and every message in it. */
    virtual Expected<void> delete_conversation(const std::string& conversation_id) = 0;

    /**
     * @brief Append a message to a conversation
     *
     * @param conversation_id Target conversation
     * @param message Message to append (role and content blocks)
     * @return Expected<Message> The stored message (with service id) or error
     */
    virtual Expected<Message> append_message(const std::string& conversation_id, const Message& message) = 0;

    /**
     * @brief Start a run of the given agent over the conversation's current state
     */
    virtual Expected<Run> create_run(const std::string& conversation_id, const AgentConfig& agent) = 0;

    /** @brief Fetch the current state of a run. */
    virtual Expected<Run> get_run(const std::string& conversation_id, const std::string& run_id) = 0;

    /**
     * @brief Submit every output for a paused run in one batch
     *
     * @param run The run in RequiresAction state
     * @param outputs One output per pending tool call
     * @return Expected<Run> The run state returned by the service
     */
    virtual Expected<Run> submit_tool_outputs(const Run& run, const std::vector<ToolOutput>& outputs) = 0;

    /** @brief Request cancellation of a run. Advisory; the service owns the final state. */
    virtual Expected<void> cancel_run(const std::string& conversation_id, const std::string& run_id) = 0;

    /**
     * @brief List conversation messages
     *
     * @param conversation_id Conversation to read
     * @param order Descending returns the newest message first
     */
    virtual Expected<std::vector<Message>> list_messages(const std::string& conversation_id, SortOrder order) = 0;

    /** @brief Upload a document for use by file search. */
    virtual Expected<FileHandle> upload_file(const std::string& filename, const std::string& data) = 0;

    /** @brief Delete an uploaded file. */
    virtual Expected<void> delete_file(const std::string& file_id) = 0;

    /** @brief Create a vector store indexing the given files. */
    virtual Expected<VectorStore> create_vector_store(const std::string& name, const std::vector<std::string>& file_ids) = 0;

    /** @brief Fetch a vector store (indexing status and file counts). */
    virtual Expected<VectorStore> get_vector_store(const std::string& vector_store_id) = 0;

    /** @brief Delete a vector store. Files it indexes are not deleted. */
    virtual Expected<void> delete_vector_store(const std::string& vector_store_id) = 0;
};

} // namespace service
} // namespace turnkey
