#pragma once

#include "IAgentService.hpp"
#include "../config.hpp"
#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace turnkey {
namespace service {

/**
 * @brief IAgentService over the hosted agent REST API, using libcurl
 *
 * Each request uses its own easy handle, so one instance can be shared by
 * conversations running on different threads. libcurl's global state is
 * initialized once per process on first construction.
 *
 * Error mapping:
 * - transport failure (DNS, TLS, timeout) -> ServiceTransportFailed with the libcurl message
 * - HTTP 404 -> ResourceNotFound, other HTTP >= 400 -> ServiceRequestFailed,
 *   both carrying the service's error.message and the status as context
 * - a body that does not decode -> ProtocolError
 */
class HttpAgentService : public IAgentService {
public:
    explicit HttpAgentService(ServiceConfig config);
    ~HttpAgentService() override = default;

    HttpAgentService(const HttpAgentService&) = delete;
    HttpAgentService& operator=(const HttpAgentService&) = delete;

    /** @brief Process-wide libcurl initialization; safe to call repeatedly. */
    static void initialize_global();

    /**
     * @brief Build a request URL from the endpoint, a path and query parameters
     *
     * The api-version parameter is always appended last.
     */
    static std::string make_url(const std::string& endpoint,
                                const std::string& path,
                                const std::string& api_version,
                                const std::vector<std::pair<std::string, std::string>>& query = {});

    // IAgentService interface implementation
    Expected<AgentConfig> create_agent(const AgentDefinition& definition) override;
    Expected<void> delete_agent(const std::string& agent_id) override;
    Expected<std::string> create_conversation() override;
    Expected<void> delete_conversation(const std::string& conversation_id) override;
    Expected<Message> append_message(const std::string& conversation_id, const Message& message) override;
    Expected<Run> create_run(const std::string& conversation_id, const AgentConfig& agent) override;
    Expected<Run> get_run(const std::string& conversation_id, const std::string& run_id) override;
    Expected<Run> submit_tool_outputs(const Run& run, const std::vector<ToolOutput>& outputs) override;
    Expected<void> cancel_run(const std::string& conversation_id, const std::string& run_id) override;
    Expected<std::vector<Message>> list_messages(const std::string& conversation_id, SortOrder order) override;
    Expected<FileHandle> upload_file(const std::string& filename, const std::string& content) override;
    Expected<void> delete_file(const std::string& file_id) override;
    Expected<VectorStore> create_vector_store(const std::string& name,
                                              const std::vector<std::string>& file_ids) override;
    Expected<VectorStore> get_vector_store(const std::string& vector_store_id) override;
    Expected<void> delete_vector_store(const std::string& vector_store_id) override;

private:
    struct HttpReply {
        long status = 0;
        std::string body;
    };

    /**
     * @brief Send one JSON request and decode the JSON reply
     *
     * @param method "GET", "POST" or "DELETE"
     * @param path Path relative to the endpoint, starting with '/'
     * @param body Request body (POST only)
     * @param query Extra query parameters
     */
    Expected<nlohmann::json> request(const std::string& method,
                                     const std::string& path,
                                     const std::optional<nlohmann::json>& body = std::nullopt,
                                     const std::vector<std::pair<std::string, std::string>>& query = {});

    Expected<HttpReply> perform(const std::string& method,
                                const std::string& url,
                                const std::string* json_body,
                                const std::pair<std::string, std::string>* upload);

    Expected<nlohmann::json> decode_reply(const std::string& method, const std::string& path,
                                          const HttpReply& reply) const;

    ServiceConfig config_;
};

} // namespace service
} // namespace turnkey
