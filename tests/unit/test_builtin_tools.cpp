#include <gtest/gtest.h>
#include "turnkey/tools/builtin_tools.hpp"
#include <set>

using namespace turnkey;
using namespace turnkey::engine;
using json = nlohmann::json;

class BuiltinToolsTest : public ::testing::Test {
protected:
    ToolDispatchRegistry registry;

    void SetUp() override {
        tools::register_builtin_tools(registry);
    }

    json call(const std::string& name, const json& args) {
        return registry.dispatch(name, args);
    }
};

// ============================================================================
// BT-001: Registration
// ============================================================================

TEST_F(BuiltinToolsTest, RegistersAllTools) {
    EXPECT_EQ(registry.size(), 5u);

    auto names = registry.get_tool_names();
    std::vector<std::string> expected = {
        "calculate", "get_database_record", "get_stock_price", "get_weather", "search_knowledge_base"
    };
    EXPECT_EQ(names, expected);
}

TEST_F(BuiltinToolsTest, DatabaseSchemaRequiresBothFields) {
    auto def = registry.get_definition("get_database_record");
    ASSERT_TRUE(def.has_value());

    EXPECT_EQ(def->parameters["required"], json::array({"recordId", "table"}));
    EXPECT_EQ(def->parameters["properties"]["table"]["type"], "string");
}

TEST_F(BuiltinToolsTest, TypedToolSchemasCarryDescriptions) {
    auto stock = registry.get_definition("get_stock_price");
    ASSERT_TRUE(stock.has_value());
    EXPECT_EQ(stock->parameters["properties"]["symbol"],
              json({{"type", "string"}, {"description", "The stock ticker symbol, e.g., 'MSFT'"}}));
    EXPECT_EQ(stock->parameters["required"], json::array({"symbol"}));

    auto calc = registry.get_definition("calculate");
    ASSERT_TRUE(calc.has_value());
    EXPECT_EQ(calc->parameters["properties"]["expression"]["type"], "string");
    EXPECT_FALSE(calc->parameters["properties"]["expression"]["description"].get<std::string>().empty());
}

TEST_F(BuiltinToolsTest, TypedToolRejectsWrongArgumentType) {
    auto result = call("get_stock_price", {{"symbol", 42}});

    EXPECT_EQ(result["error"], "Invalid arguments");
    EXPECT_EQ(result["details"], "Argument 'symbol' has wrong type: expected string, got integer");
}

// ============================================================================
// BT-002: Weather and stock quotes
// ============================================================================

TEST_F(BuiltinToolsTest, WeatherIsDeterministicPerCity) {
    auto first = call("get_weather", {{"city", "Seattle"}});
    auto second = call("get_weather", {{"city", "Seattle"}});

    EXPECT_EQ(first, second);
    EXPECT_EQ(first["City"], "Seattle");

    double temperature = first["TemperatureCelsius"].get<double>();
    EXPECT_GE(temperature, 5.0);
    EXPECT_LE(temperature, 40.0);

    int humidity = first["Humidity"].get<int>();
    EXPECT_GE(humidity, 30);
    EXPECT_LT(humidity, 90);

    std::set<std::string> conditions = {"Sunny", "Cloudy", "Rainy", "Partly Cloudy", "Snowy"};
    EXPECT_EQ(conditions.count(first["Condition"].get<std::string>()), 1u);
}

TEST_F(BuiltinToolsTest, WeatherRequiresCity) {
    auto result = call("get_weather", json::object());

    EXPECT_EQ(result["error"], "Invalid arguments");
    EXPECT_EQ(result["details"], "Missing required argument: city");
}

TEST_F(BuiltinToolsTest, KnownSymbolUsesFixedPrice) {
    auto result = call("get_stock_price", {{"symbol", "msft"}});

    EXPECT_EQ(result["Symbol"], "MSFT");
    EXPECT_DOUBLE_EQ(result["Price"].get<double>(), 425.52);
    EXPECT_TRUE(result.contains("Change"));
    EXPECT_TRUE(result.contains("ChangePercent"));
}

TEST_F(BuiltinToolsTest, UnknownSymbolPriceInRange) {
    auto result = call("get_stock_price", {{"symbol", "ZZZZ"}});

    double price = result["Price"].get<double>();
    EXPECT_GE(price, 100.0);
    EXPECT_LT(price, 300.0);

    double change = result["Change"].get<double>();
    EXPECT_GE(change, -5.0);
    EXPECT_LE(change, 5.0);

    EXPECT_EQ(call("get_stock_price", {{"symbol", "ZZZZ"}}), result);
}

// ============================================================================
// BT-003: Knowledge base search
// ============================================================================

TEST_F(BuiltinToolsTest, KnowledgeBaseMatchesTopicCaseInsensitive) {
    auto result = call("search_knowledge_base", {{"query", "REFUND"}});

    ASSERT_TRUE(result.contains("results"));
    ASSERT_EQ(result["results"].size(), 1u);
    EXPECT_EQ(result["results"][0]["topic"], "refund policy");
    EXPECT_NE(result["results"][0]["content"].get<std::string>().find("30 days"), std::string::npos);
    EXPECT_EQ(result["query"], "REFUND");
}

TEST_F(BuiltinToolsTest, KnowledgeBaseMatchesContent) {
    // "support@company.com" appears in the refund and contact entries
    auto result = call("search_knowledge_base", {{"query", "support@company.com"}});

    ASSERT_TRUE(result.contains("results"));
    EXPECT_EQ(result["results"].size(), 2u);
}

TEST_F(BuiltinToolsTest, KnowledgeBaseMiss) {
    auto result = call("search_knowledge_base", {{"query", "quantum teleportation"}});

    EXPECT_FALSE(result.contains("results"));
    EXPECT_EQ(result["message"], "No relevant information found.");
    EXPECT_EQ(result["query"], "quantum teleportation");
}

// ============================================================================
// BT-004: Calculator
// ============================================================================

TEST_F(BuiltinToolsTest, CalculatorPrecedence) {
    EXPECT_EQ(call("calculate", {{"expression", "2 + 3 * 4"}})["result"], "14");
    EXPECT_EQ(call("calculate", {{"expression", "(2 + 3) * 4"}})["result"], "20");
    EXPECT_EQ(call("calculate", {{"expression", "-(3 + 2) * 2"}})["result"], "-10");
    EXPECT_EQ(call("calculate", {{"expression", "17 % 5"}})["result"], "2");
}

TEST_F(BuiltinToolsTest, CalculatorFractions) {
    auto result = call("calculate", {{"expression", "10 / 4"}});

    EXPECT_EQ(result["expression"], "10 / 4");
    EXPECT_EQ(result["result"], "2.5");
}

TEST_F(BuiltinToolsTest, CalculatorErrorsArePayloads) {
    auto divide = call("calculate", {{"expression", "1 / 0"}});
    EXPECT_FALSE(divide.contains("result"));
    EXPECT_EQ(divide["error"], "Attempted to divide by zero.");

    auto dangling = call("calculate", {{"expression", "2 +"}});
    EXPECT_EQ(dangling["error"], "Unexpected end of expression");

    auto unbalanced = call("calculate", {{"expression", "(1 + 2"}});
    EXPECT_EQ(unbalanced["error"], "Missing closing parenthesis");

    auto letters = call("calculate", {{"expression", "2 * x"}});
    EXPECT_EQ(letters["error"], "Unexpected character 'x'");

    auto dots = call("calculate", {{"expression", "1.2.3"}});
    EXPECT_EQ(dots["error"], "Invalid number '1.2.3'");
}

// ============================================================================
// BT-005: Database records
// ============================================================================

TEST_F(BuiltinToolsTest, KnownRecords) {
    auto employee = call("get_database_record", {{"recordId", "emp-001"}, {"table", "Employees"}});
    EXPECT_EQ(employee["recordId"], "emp-001");
    EXPECT_EQ(employee["data"]["Name"], "Alice Johnson");
    EXPECT_EQ(employee["data"]["Department"], "Engineering");

    auto order = call("get_database_record", {{"recordId", "ORD-555"}, {"table", "orders"}});
    EXPECT_EQ(order["data"]["Status"], "Shipped");
}

TEST_F(BuiltinToolsTest, MissingRecordSuggestsFix) {
    auto result = call("get_database_record", {{"recordId", "EMP-999"}, {"table", "employees"}});

    EXPECT_FALSE(result.contains("data"));
    EXPECT_EQ(result["error"], "Record 'EMP-999' not found in table 'employees'");
    EXPECT_EQ(result["suggestion"], "Check the record ID and table name");
}

TEST_F(BuiltinToolsTest, ArgumentsAsEncodedString) {
    auto result = call("get_database_record", json(R"({"recordId":"ORD-555","table":"orders"})"));

    EXPECT_EQ(result["data"]["Total"], "$2,990.00");
}
