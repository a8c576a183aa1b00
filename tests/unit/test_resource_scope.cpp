#include <gtest/gtest.h>
#include "turnkey/engine/resource_scope.hpp"
#include "mocks/mock_agent_service.hpp"
#include <stdexcept>

using namespace turnkey;
using namespace turnkey::engine;
using namespace turnkey::testing;

class ResourceScopeTest : public ::testing::Test {
protected:
    std::shared_ptr<MockAgentService> service;

    void SetUp() override {
        service = std::make_shared<MockAgentService>();
    }

    std::string make_agent() {
        auto agent = service->create_agent(AgentDefinition{"gpt-4o", "Scoped", "", {}, {}, {}});
        EXPECT_TRUE(agent.has_value());
        return agent ? agent->id : std::string();
    }
};

// ============================================================================
// RS-001: Scope end deletes the resource
// ============================================================================

TEST_F(ResourceScopeTest, AgentDeletedAtScopeEnd) {
    std::string agent_id = make_agent();
    {
        auto scope = scoped_agent(service, agent_id);
        EXPECT_TRUE(scope.active());
        EXPECT_EQ(scope.id(), agent_id);
        EXPECT_EQ(service->agents.count(agent_id), 1u);
    }
    EXPECT_EQ(service->agents.count(agent_id), 0u);
    ASSERT_EQ(service->deletion_log.size(), 1u);
    EXPECT_EQ(service->deletion_log[0], "agent:" + agent_id);
}

TEST_F(ResourceScopeTest, ConversationDeletedOnEarlyReturn) {
    auto conversation = service->create_conversation();
    ASSERT_TRUE(conversation.has_value());

    auto use_and_bail = [&]() -> Expected<void> {
        auto scope = scoped_conversation(service, *conversation);
        return tl::unexpected(Error{ErrorCode::RunFailed, "bail out"});
    };

    EXPECT_FALSE(use_and_bail().has_value());
    EXPECT_EQ(service->conversations.count(*conversation), 0u);
}

TEST_F(ResourceScopeTest, ConversationDeletedWhenExceptionUnwinds) {
    auto conversation = service->create_conversation();
    ASSERT_TRUE(conversation.has_value());

    EXPECT_THROW({
        auto scope = scoped_conversation(service, *conversation);
        throw std::runtime_error("unwind");
    }, std::runtime_error);

    EXPECT_EQ(service->conversations.count(*conversation), 0u);
}

// ============================================================================
// RS-002: Release is idempotent, failures are swallowed
// ============================================================================

TEST_F(ResourceScopeTest, ReleaseTwiceDeletesOnce) {
    std::string agent_id = make_agent();
    auto scope = scoped_agent(service, agent_id);

    EXPECT_TRUE(scope.release());
    EXPECT_FALSE(scope.active());
    EXPECT_TRUE(scope.release());

    EXPECT_EQ(service->deletion_log.size(), 1u);
}

TEST_F(ResourceScopeTest, FailedDeleteIsLoggedNotThrown) {
    std::string agent_id = make_agent();
    service->fail_deletes = true;

    auto scope = scoped_agent(service, agent_id);
    EXPECT_NO_THROW({
        EXPECT_FALSE(scope.release());
    });
    // Ownership was dropped; the destructor does not try again
    EXPECT_FALSE(scope.active());
    EXPECT_EQ(service->deletion_log.size(), 1u);
}

TEST_F(ResourceScopeTest, ThrowingDeleterIsContained) {
    ScopedResource scope("widget", "w1", [](const std::string&) -> Expected<void> {
        throw std::runtime_error("deleter blew up");
    });

    EXPECT_NO_THROW({
        EXPECT_FALSE(scope.release());
    });
    EXPECT_FALSE(scope.active());
}

TEST_F(ResourceScopeTest, EmptyIdIsInactive) {
    auto scope = scoped_conversation(service, "");
    EXPECT_FALSE(scope.active());
    EXPECT_TRUE(scope.release());
    EXPECT_TRUE(service->deletion_log.empty());
}

TEST_F(ResourceScopeTest, DismissKeepsResource) {
    std::string agent_id = make_agent();
    {
        auto scope = scoped_agent(service, agent_id);
        EXPECT_EQ(scope.dismiss(), agent_id);
    }
    EXPECT_EQ(service->agents.count(agent_id), 1u);
    EXPECT_TRUE(service->deletion_log.empty());
}

TEST_F(ResourceScopeTest, MoveTransfersOwnership) {
    std::string agent_id = make_agent();
    {
        auto outer = scoped_agent(service, "");
        {
            auto inner = scoped_agent(service, agent_id);
            outer = std::move(inner);
        }
        // The moved-from guard released nothing
        EXPECT_EQ(service->agents.count(agent_id), 1u);
        EXPECT_EQ(outer.id(), agent_id);
    }
    EXPECT_EQ(service->agents.count(agent_id), 0u);
    EXPECT_EQ(service->deletion_log.size(), 1u);
}

// ============================================================================
// RS-003: Vector stores released before the files they index
// ============================================================================

TEST_F(ResourceScopeTest, VectorStoreReleasedBeforeFiles) {
    std::string store_id;
    std::vector<std::string> file_ids;
    {
        std::vector<ScopedResource> file_scopes;
        for (const std::string name : {"a.md", "b.md"}) {
            auto file = service->upload_file(name, "content of " + name);
            ASSERT_TRUE(file.has_value());
            file_ids.push_back(file->id);
            file_scopes.push_back(scoped_file(service, file->id));
        }
        auto store = service->create_vector_store("docs", file_ids);
        ASSERT_TRUE(store.has_value());
        store_id = store->id;
        auto store_scope = scoped_vector_store(service, store->id);
    }

    ASSERT_EQ(service->deletion_log.size(), 3u);
    EXPECT_EQ(service->deletion_log[0], "vector_store:" + store_id);
    EXPECT_TRUE(service->files.empty());
    EXPECT_TRUE(service->vector_stores.empty());
}

// ============================================================================
// RS-004: safe_cleanup twice never raises
// ============================================================================

TEST_F(ResourceScopeTest, SafeCleanupTwiceNeverThrows) {
    std::string agent_id = make_agent();
    auto conversation = service->create_conversation();
    ASSERT_TRUE(conversation.has_value());

    EXPECT_NO_THROW(safe_cleanup(*service, agent_id, *conversation));
    EXPECT_NO_THROW(safe_cleanup(*service, agent_id, *conversation));

    EXPECT_EQ(service->agents.count(agent_id), 0u);
    EXPECT_EQ(service->conversations.count(*conversation), 0u);
    // Conversation first, then agent, on both calls
    ASSERT_EQ(service->deletion_log.size(), 4u);
    EXPECT_EQ(service->deletion_log[0], "conversation:" + *conversation);
    EXPECT_EQ(service->deletion_log[1], "agent:" + agent_id);
}

TEST_F(ResourceScopeTest, SafeCleanupWithoutConversation) {
    std::string agent_id = make_agent();

    safe_cleanup(*service, agent_id);

    ASSERT_EQ(service->deletion_log.size(), 1u);
    EXPECT_EQ(service->deletion_log[0], "agent:" + agent_id);
}
