#include <gtest/gtest.h>
#include "turnkey/config.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>

using namespace turnkey;
using json = nlohmann::json;
using namespace std::chrono_literals;

class SettingsTest : public ::testing::Test {
protected:
    std::filesystem::path temp_path;

    void TearDown() override {
        if (!temp_path.empty()) {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
        }
    }

    std::string write_temp(const std::string& name, const std::string& contents) {
        temp_path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(temp_path);
        out << contents;
        return temp_path.string();
    }

    static EnvLookup env(std::map<std::string, std::string> vars) {
        auto table = std::make_shared<std::map<std::string, std::string>>(std::move(vars));
        return [table](const char* name) -> const char* {
            auto it = table->find(name);
            return it == table->end() ? nullptr : it->second.c_str();
        };
    }

    static EnvLookup no_env() {
        return [](const char*) -> const char* { return nullptr; };
    }

    static json minimal() {
        return json{{"AzureAI", {{"ConnectionString", "https://example.services.ai.azure.com/api/projects/demo"}}}};
    }
};

// ============================================================================
// CF-001: Defaults and required keys
// ============================================================================

TEST_F(SettingsTest, MinimalDocumentUsesDefaults) {
    auto settings = settings_from_json(minimal());
    ASSERT_TRUE(settings.has_value()) << settings.error().to_string();

    EXPECT_EQ(settings->service.endpoint, "https://example.services.ai.azure.com/api/projects/demo");
    EXPECT_EQ(settings->service.api_version, "v1");
    EXPECT_EQ(settings->model, "gpt-4o");
    EXPECT_EQ(settings->turn.poll_interval, 500ms);
    ASSERT_TRUE(settings->turn.run_timeout.has_value());
    EXPECT_EQ(*settings->turn.run_timeout, 60s);
    ASSERT_TRUE(settings->turn.max_tool_round_trips.has_value());
    EXPECT_EQ(*settings->turn.max_tool_round_trips, 5);
    EXPECT_EQ(settings->retry.max_attempts, 3);
    EXPECT_EQ(settings->retry.base_delay, 1000ms);
    EXPECT_EQ(settings->log_level, "info");
    EXPECT_FALSE(settings->has_search());
}

TEST_F(SettingsTest, MissingEndpointRejected) {
    auto settings = settings_from_json(json{{"AzureAI", {{"ModelDeploymentName", "gpt-4o-mini"}}}});

    ASSERT_FALSE(settings.has_value());
    EXPECT_EQ(settings.error().code, ErrorCode::MissingEndpoint);
    EXPECT_NE(settings.error().message.find("AzureAI:ConnectionString"), std::string::npos);
}

TEST_F(SettingsTest, EndpointSchemeChecked) {
    auto settings = settings_from_json(json{{"AzureAI", {{"ConnectionString", "example.com"}}}});

    ASSERT_FALSE(settings.has_value());
    EXPECT_EQ(settings.error().code, ErrorCode::InvalidConfig);
}

TEST_F(SettingsTest, AllKeysRead) {
    json doc = {
        {"AzureAI", {
            {"ConnectionString", "https://example.com/api/projects/p"},
            {"ModelDeploymentName", "gpt-4o-mini"},
            {"ApiVersion", "2025-05-01"},
            {"AccessToken", "secret"}
        }},
        {"AzureAISearch", {{"ConnectionId", "conn-1"}, {"IndexName", "products"}}},
        {"Agent", {
            {"PollIntervalMs", 250},
            {"RunTimeoutSeconds", "30"},
            {"MaxToolRoundTrips", 8},
            {"MaxAttempts", 4},
            {"BaseDelayMs", 50},
            {"RequestTimeoutSeconds", 10}
        }},
        {"Logging", {{"Level", "debug"}}}
    };

    auto settings = settings_from_json(doc);
    ASSERT_TRUE(settings.has_value()) << settings.error().to_string();

    EXPECT_EQ(settings->model, "gpt-4o-mini");
    EXPECT_EQ(settings->service.api_version, "2025-05-01");
    EXPECT_EQ(settings->service.access_token, "secret");
    EXPECT_EQ(settings->service.request_timeout, 10s);
    EXPECT_TRUE(settings->has_search());
    EXPECT_EQ(settings->search_index_name, "products");
    EXPECT_EQ(settings->turn.poll_interval, 250ms);
    EXPECT_EQ(*settings->turn.run_timeout, 30s);
    EXPECT_EQ(*settings->turn.max_tool_round_trips, 8);
    EXPECT_EQ(settings->retry.max_attempts, 4);
    EXPECT_EQ(settings->retry.base_delay, 50ms);
    EXPECT_EQ(settings->log_level, "debug");
}

// ============================================================================
// CF-002: Invalid values
// ============================================================================

TEST_F(SettingsTest, NonIntegerValueRejected) {
    json doc = minimal();
    doc["Agent"] = {{"MaxAttempts", "three"}};

    auto settings = settings_from_json(doc);
    ASSERT_FALSE(settings.has_value());
    EXPECT_EQ(settings.error().code, ErrorCode::InvalidConfig);
    ASSERT_TRUE(settings.error().context.has_value());
    EXPECT_EQ(*settings.error().context, "three");
}

TEST_F(SettingsTest, TrailingGarbageRejected) {
    json doc = minimal();
    doc["Agent"] = {{"PollIntervalMs", "500ms"}};

    auto settings = settings_from_json(doc);
    ASSERT_FALSE(settings.has_value());
    EXPECT_EQ(settings.error().code, ErrorCode::InvalidConfig);
}

TEST_F(SettingsTest, NonPositiveLimitsRejected) {
    json doc = minimal();
    doc["Agent"] = {{"MaxToolRoundTrips", 0}};
    EXPECT_FALSE(settings_from_json(doc).has_value());

    doc["Agent"] = {{"RunTimeoutSeconds", -5}};
    EXPECT_FALSE(settings_from_json(doc).has_value());

    doc["Agent"] = {{"MaxAttempts", 0}};
    EXPECT_FALSE(settings_from_json(doc).has_value());
}

TEST_F(SettingsTest, CountsBeyondIntRangeRejected) {
    json doc = minimal();
    doc["Agent"] = {{"MaxAttempts", 4294967298LL}};

    auto settings = settings_from_json(doc);
    ASSERT_FALSE(settings.has_value());
    EXPECT_EQ(settings.error().code, ErrorCode::InvalidConfig);
    ASSERT_TRUE(settings.error().context.has_value());
    EXPECT_EQ(*settings.error().context, "4294967298");

    doc["Agent"] = {{"MaxToolRoundTrips", "-4294967295"}};
    EXPECT_FALSE(settings_from_json(doc).has_value());
}

// ============================================================================
// CF-003: Environment overrides
// ============================================================================

TEST_F(SettingsTest, EnvironmentOverridesDocument) {
    json doc = minimal();
    doc["AzureAI"]["ModelDeploymentName"] = "from-file";

    apply_environment(doc, env({
        {"AzureAI__ModelDeploymentName", "from-env"},
        {"Agent__MaxAttempts", "5"}
    }));

    auto settings = settings_from_json(doc);
    ASSERT_TRUE(settings.has_value()) << settings.error().to_string();
    EXPECT_EQ(settings->model, "from-env");
    EXPECT_EQ(settings->retry.max_attempts, 5);
}

TEST_F(SettingsTest, EnvironmentSuppliesMissingSection) {
    json doc = json::object();

    apply_environment(doc, env({{"AzureAI__ConnectionString", "https://env.example.com"}}));

    auto settings = settings_from_json(doc);
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->service.endpoint, "https://env.example.com");
}

// ============================================================================
// CF-004: Loading from disk
// ============================================================================

TEST_F(SettingsTest, LoadMissingFile) {
    auto settings = load_settings("/nonexistent/turnkey/appsettings.json", no_env());

    ASSERT_FALSE(settings.has_value());
    EXPECT_EQ(settings.error().code, ErrorCode::ConfigFileUnreadable);
    ASSERT_TRUE(settings.error().context.has_value());
    EXPECT_EQ(*settings.error().context, "/nonexistent/turnkey/appsettings.json");
}

TEST_F(SettingsTest, LoadInvalidJson) {
    auto path = write_temp("turnkey_invalid_settings.json", "{ \"AzureAI\": ");

    auto settings = load_settings(path, no_env());
    ASSERT_FALSE(settings.has_value());
    EXPECT_EQ(settings.error().code, ErrorCode::InvalidConfig);
}

TEST_F(SettingsTest, LoadFileWithComments) {
    auto path = write_temp("turnkey_settings.json", R"({
        // project endpoint
        "AzureAI": {
            "ConnectionString": "https://file.example.com/api/projects/p",
            "ModelDeploymentName": "gpt-4o"
        },
        /* tuned for tests */
        "Agent": { "PollIntervalMs": 100 }
    })");

    auto settings = load_settings(path, env({{"Logging__Level", "warn"}}));
    ASSERT_TRUE(settings.has_value()) << settings.error().to_string();
    EXPECT_EQ(settings->service.endpoint, "https://file.example.com/api/projects/p");
    EXPECT_EQ(settings->turn.poll_interval, 100ms);
    EXPECT_EQ(settings->log_level, "warn");
}

// ============================================================================
// CF-005: Retry policy
// ============================================================================

TEST(RetryPolicyTest, DelayDoublesFromBase) {
    RetryPolicy policy{5, 1000ms};

    EXPECT_EQ(policy.delay_before(1), 0ms);
    EXPECT_EQ(policy.delay_before(2), 1000ms);
    EXPECT_EQ(policy.delay_before(3), 2000ms);
    EXPECT_EQ(policy.delay_before(4), 4000ms);
    EXPECT_EQ(policy.delay_before(5), 8000ms);
}

TEST(RetryPolicyTest, Validation) {
    EXPECT_TRUE(RetryPolicy{}.validate().has_value());
    EXPECT_TRUE((RetryPolicy{1, 0ms}.validate().has_value()));
    EXPECT_FALSE((RetryPolicy{0, 100ms}.validate().has_value()));
    EXPECT_FALSE((RetryPolicy{32, 100ms}.validate().has_value()));
    EXPECT_FALSE((RetryPolicy{3, -1ms}.validate().has_value()));
}

TEST(TurnConfigTest, Validation) {
    TurnConfig config;
    EXPECT_TRUE(config.validate().has_value());

    config.run_timeout = 0s;
    EXPECT_FALSE(config.validate().has_value());

    config.run_timeout = 30s;
    config.max_tool_round_trips = -1;
    EXPECT_FALSE(config.validate().has_value());
}
