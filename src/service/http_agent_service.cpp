#include "turnkey/service/http_agent_service.hpp"
#include "turnkey/service/wire_format.hpp"
#include "turnkey/log.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace turnkey {
namespace service {

namespace {

std::once_flag g_curl_init_flag;

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct CurlMimeDeleter {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlList = std::unique_ptr<curl_slist, CurlListDeleter>;
using CurlMime = std::unique_ptr<curl_mime, CurlMimeDeleter>;

size_t write_callback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(data, size * nmemb);
    return size * nmemb;
}

// Appends a header, keeping ownership in the smart pointer.
bool append_header(CurlList& list, const std::string& header) {
    curl_slist* extended = curl_slist_append(list.get(), header.c_str());
    if (!extended) {
        return false;
    }
    list.release();
    list.reset(extended);
    return true;
}

} // namespace

HttpAgentService::HttpAgentService(ServiceConfig config)
    : config_(std::move(config)) {
    while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
        config_.endpoint.pop_back();
    }
    initialize_global();
}

void HttpAgentService::initialize_global() {
    std::call_once(g_curl_init_flag, []() {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
            log::logger()->error("libcurl global initialization failed");
        }
    });
}

std::string HttpAgentService::make_url(const std::string& endpoint,
                                       const std::string& path,
                                       const std::string& api_version,
                                       const std::vector<std::pair<std::string, std::string>>& query) {
    std::string url = endpoint;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += path;

    char separator = '?';
    for (const auto& [key, value] : query) {
        url += separator;
        url += key + "=" + value;
        separator = '&';
    }
    url += separator;
    url += "api-version=" + api_version;
    return url;
}

// ============================================================================
// Transport
// ============================================================================

Expected<HttpAgentService::HttpReply> HttpAgentService::perform(
    const std::string& method,
    const std::string& url,
    const std::string* json_body,
    const std::pair<std::string, std::string>* upload
) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return tl::unexpected(Error{ErrorCode::ServiceTransportFailed, "Failed to create libcurl handle"});
    }

    CurlList headers;
    bool headers_ok = append_header(headers, "Accept: application/json");
    if (json_body) {
        headers_ok = headers_ok && append_header(headers, "Content-Type: application/json");
    }
    if (!config_.access_token.empty()) {
        headers_ok = headers_ok && append_header(headers, "Authorization: Bearer " + config_.access_token);
    }
    if (!headers_ok) {
        return tl::unexpected(Error{ErrorCode::ServiceTransportFailed, "Failed to build request headers"});
    }

    HttpReply reply;
    CurlMime mime;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &reply.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(config_.request_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    if (upload) {
        mime.reset(curl_mime_init(curl.get()));
        curl_mimepart* purpose = curl_mime_addpart(mime.get());
        curl_mime_name(purpose, "purpose");
        curl_mime_data(purpose, "assistants", CURL_ZERO_TERMINATED);

        curl_mimepart* file = curl_mime_addpart(mime.get());
        curl_mime_name(file, "file");
        curl_mime_filename(file, upload->first.c_str());
        curl_mime_data(file, upload->second.data(), upload->second.size());

        curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    } else if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json_body ? json_body->c_str() : "{}");
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(json_body ? json_body->size() : 2));
    } else if (method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return tl::unexpected(Error{ErrorCode::ServiceTransportFailed,
            std::string("HTTP request failed: ") + curl_easy_strerror(res), method + " " + url});
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &reply.status);
    return reply;
}

Expected<nlohmann::json> HttpAgentService::decode_reply(const std::string& method,
                                                        const std::string& path,
                                                        const HttpReply& reply) const {
    const std::string context = method + " " + path + " -> HTTP " + std::to_string(reply.status);
    if (reply.status >= 400) {
        const auto code = reply.status == 404 ? ErrorCode::ResourceNotFound : ErrorCode::ServiceRequestFailed;
        return tl::unexpected(Error{code, wire::decode_error_message(reply.body), context});
    }
    if (reply.body.empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(reply.body, nullptr, false);
    if (parsed.is_discarded()) {
        return tl::unexpected(Error{ErrorCode::ProtocolError, "Response body is not valid JSON", context});
    }
    return parsed;
}

Expected<nlohmann::json> HttpAgentService::request(
    const std::string& method,
    const std::string& path,
    const std::optional<nlohmann::json>& body,
    const std::vector<std::pair<std::string, std::string>>& query
) {
    const std::string url = make_url(config_.endpoint, path, config_.api_version, query);
    log::logger()->debug("{} {}", method, path);

    std::string payload;
    if (body) {
        payload = body->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    auto reply = perform(method, url, body ? &payload : nullptr, nullptr);
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return decode_reply(method, path, *reply);
}

// ============================================================================
// Agents and conversations
// ============================================================================

Expected<AgentConfig> HttpAgentService::create_agent(const AgentDefinition& definition) {
    auto reply = request("POST", "/assistants", wire::encode_agent(definition));
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return wire::decode_agent(*reply);
}

Expected<void> HttpAgentService::delete_agent(const std::string& agent_id) {
    auto reply = request("DELETE", "/assistants/" + agent_id);
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return {};
}

Expected<std::string> HttpAgentService::create_conversation() {
    auto reply = request("POST", "/threads", nlohmann::json::object());
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return wire::detail::require_id(*reply);
}

Expected<void> HttpAgentService::delete_conversation(const std::string& conversation_id) {
    auto reply = request("DELETE", "/threads/" + conversation_id);
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return {};
}

Expected<Message> HttpAgentService::append_message(const std::string& conversation_id, const Message& message) {
    auto reply = request("POST", "/threads/" + conversation_id + "/messages", wire::encode_message(message));
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return wire::decode_message(*reply);
}

Expected<std::vector<Message>> HttpAgentService::list_messages(const std::string& conversation_id,
                                                               SortOrder order) {
    const std::string order_param = order == SortOrder::Descending ? "desc" : "asc";
    auto reply = request("GET", "/threads/" + conversation_id + "/messages", std::nullopt,
                         {{"order", order_param}});
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return wire::decode_message_list(*reply);
}

// ============================================================================
// Runs
// ============================================================================

Expected<Run> HttpAgentService::create_run(const std::string& conversation_id, const AgentConfig& agent) {
    auto reply = request("POST", "/threads/" + conversation_id + "/runs",
                         nlohmann::json{{"assistant_id", agent.id}});
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    auto run = wire::decode_run(*reply);
    if (run && run->conversation_id.empty()) {
        run->conversation_id = conversation_id;
    }
    return run;
}

Expected<Run> HttpAgentService::get_run(const std::string& conversation_id, const std::string& run_id) {
    auto reply = request("GET", "/threads/" + conversation_id + "/runs/" + run_id);
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    auto run = wire::decode_run(*reply);
    if (run && run->conversation_id.empty()) {
        run->conversation_id = conversation_id;
    }
    return run;
}

Expected<Run> HttpAgentService::submit_tool_outputs(const Run& run, const std::vector<ToolOutput>& outputs) {
    if (run.conversation_id.empty()) {
        return tl::unexpected(Error{ErrorCode::ProtocolError, "Run carries no conversation id", run.id});
    }
    auto reply = request("POST",
                         "/threads/" + run.conversation_id + "/runs/" + run.id + "/submit_tool_outputs",
                         wire::encode_tool_outputs(outputs));
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    auto updated = wire::decode_run(*reply);
    if (updated && updated->conversation_id.empty()) {
        updated->conversation_id = run.conversation_id;
    }
    return updated;
}

Expected<void> HttpAgentService::cancel_run(const std::string& conversation_id, const std::string& run_id) {
    auto reply = request("POST", "/threads/" + conversation_id + "/runs/" + run_id + "/cancel",
                         nlohmann::json::object());
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return {};
}

// ============================================================================
// Files and vector stores
// ============================================================================

Expected<FileHandle> HttpAgentService::upload_file(const std::string& filename, const std::string& content) {
    const std::string path = "/files";
    const std::string url = make_url(config_.endpoint, path, config_.api_version);
    log::logger()->debug("POST {} ({}, {} bytes)", path, filename, content.size());

    const std::pair<std::string, std::string> upload{filename, content};
    auto reply = perform("POST", url, nullptr, &upload);
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    auto body = decode_reply("POST", path, *reply);
    if (!body) {
        return tl::unexpected(body.error());
    }
    auto id = wire::detail::require_id(*body);
    if (!id) {
        return tl::unexpected(id.error());
    }
    return FileHandle{*id, body->value("filename", filename)};
}

Expected<void> HttpAgentService::delete_file(const std::string& file_id) {
    auto reply = request("DELETE", "/files/" + file_id);
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return {};
}

Expected<VectorStore> HttpAgentService::create_vector_store(const std::string& name,
                                                            const std::vector<std::string>& file_ids) {
    auto reply = request("POST", "/vector_stores", nlohmann::json{{"name", name}, {"file_ids", file_ids}});
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return wire::decode_vector_store(*reply);
}

Expected<VectorStore> HttpAgentService::get_vector_store(const std::string& vector_store_id) {
    auto reply = request("GET", "/vector_stores/" + vector_store_id);
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return wire::decode_vector_store(*reply);
}

Expected<void> HttpAgentService::delete_vector_store(const std::string& vector_store_id) {
    auto reply = request("DELETE", "/vector_stores/" + vector_store_id);
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    return {};
}

} // namespace service
} // namespace turnkey
