#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "../service/IAgentService.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace turnkey {
namespace engine {

/**
 * @brief Owns one remote resource and deletes it when the scope ends
 *
 * release() runs at most once per guard. A failed deletion is logged and
 * never re-thrown; the destructor calls release() on every exit path.
 */
class ScopedResource {
public:
    using Deleter = std::function<Expected<void>(const std::string&)>;

    ScopedResource() = default;

    ScopedResource(std::string kind, std::string id, Deleter deleter)
        : kind_(std::move(kind))
        , id_(std::move(id))
        , deleter_(std::move(deleter))
    {}

    ~ScopedResource() {
        release();
    }

    ScopedResource(const ScopedResource&) = delete;
    ScopedResource& operator=(const ScopedResource&) = delete;

    ScopedResource(ScopedResource&& other) noexcept
        : kind_(std::move(other.kind_))
        , id_(std::move(other.id_))
        , deleter_(std::move(other.deleter_))
    {
        other.id_.clear();
        other.deleter_ = nullptr;
    }

    ScopedResource& operator=(ScopedResource&& other) noexcept {
        if (this != &other) {
            release();
            kind_ = std::move(other.kind_);
            id_ = std::move(other.id_);
            deleter_ = std::move(other.deleter_);
            other.id_.clear();
            other.deleter_ = nullptr;
        }
        return *this;
    }

    const std::string& id() const { return id_; }
    const std::string& kind() const { return kind_; }

    /** @brief True while the guard still owns a resource. */
    bool active() const { return !id_.empty() && static_cast<bool>(deleter_); }

    /**
     * @brief Delete the resource now
     *
     * @return true if the deletion succeeded or there was nothing to delete
     */
    bool release() noexcept {
        if (!active()) {
            return true;
        }
        // Ownership is dropped before the call so a throwing or failing
        // deleter is never retried.
        auto deleter = std::move(deleter_);
        deleter_ = nullptr;
        const std::string id = std::move(id_);
        id_.clear();

        try {
            auto result = deleter(id);
            if (!result) {
                log::logger()->warn("Cleanup warning: could not delete {} {}: {}",
                                    kind_, id, result.error().message);
                return false;
            }
            log::logger()->debug("Deleted {} {}", kind_, id);
            return true;
        } catch (const std::exception& e) {
            log::logger()->warn("Cleanup warning: could not delete {} {}: {}", kind_, id, e.what());
            return false;
        }
    }

    /** @brief Give up ownership without deleting; returns the id. */
    std::string dismiss() {
        deleter_ = nullptr;
        std::string id = std::move(id_);
        id_.clear();
        return id;
    }

private:
    std::string kind_;
    std::string id_;
    Deleter deleter_;
};

// ============================================================================
// Typed scopes
// ============================================================================

inline ScopedResource scoped_agent(std::shared_ptr<service::IAgentService> service, std::string agent_id) {
    return ScopedResource("agent", std::move(agent_id), [svc = std::move(service)](const std::string& id) {
        return svc->delete_agent(id);
    });
}

inline ScopedResource scoped_conversation(std::shared_ptr<service::IAgentService> service,
                                          std::string conversation_id) {
    return ScopedResource("conversation", std::move(conversation_id),
        [svc = std::move(service)](const std::string& id) {
            return svc->delete_conversation(id);
        });
}

inline ScopedResource scoped_file(std::shared_ptr<service::IAgentService> service, std::string file_id) {
    return ScopedResource("file", std::move(file_id), [svc = std::move(service)](const std::string& id) {
        return svc->delete_file(id);
    });
}

inline ScopedResource scoped_vector_store(std::shared_ptr<service::IAgentService> service,
                                          std::string vector_store_id) {
    return ScopedResource("vector store", std::move(vector_store_id),
        [svc = std::move(service)](const std::string& id) {
            return svc->delete_vector_store(id);
        });
}

/**
 * @brief Delete a conversation (if any) and then the agent
 *
 * Failures are logged and swallowed, so calling it twice for the same
 * handles is harmless.
 */
inline void safe_cleanup(service::IAgentService& service,
                         const std::string& agent_id,
                         const std::optional<std::string>& conversation_id = std::nullopt) {
    if (conversation_id && !conversation_id->empty()) {
        if (auto result = service.delete_conversation(*conversation_id); !result) {
            log::logger()->warn("Cleanup warning: could not delete conversation {}: {}",
                                *conversation_id, result.error().message);
        }
    }
    if (!agent_id.empty()) {
        if (auto result = service.delete_agent(agent_id); !result) {
            log::logger()->warn("Cleanup warning: could not delete agent {}: {}",
                                agent_id, result.error().message);
        }
    }
}

} // namespace engine
} // namespace turnkey
