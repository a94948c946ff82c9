#include <gtest/gtest.h>
#include "quarry/tools/tool_arguments.hpp"
#include "quarry/tools/tool_result.hpp"
#include <limits>

using namespace quarry;
using namespace quarry::tools;
using json = nlohmann::json;

// ============================================================================
// Argument parsing
// ============================================================================

TEST(ToolArgumentsTest, ParsesObject) {
    auto args = ToolArguments::parse(R"({"count": 5, "focus": "robotics"})");
    EXPECT_FALSE(args.degraded());
    EXPECT_EQ(args.int_or("count", 0), 5);
    EXPECT_EQ(args.string_or("focus", ""), "robotics");
}

TEST(ToolArgumentsTest, BlankInputIsEmptyAndNotDegraded) {
    for (const char* raw : {"", "   ", "\n\t"}) {
        auto args = ToolArguments::parse(raw);
        EXPECT_FALSE(args.degraded());
        EXPECT_TRUE(args.raw().is_object());
        EXPECT_TRUE(args.raw().empty());
    }
}

TEST(ToolArgumentsTest, InvalidJsonDegradesToEmptyObject) {
    auto args = ToolArguments::parse("{count: five");
    EXPECT_TRUE(args.degraded());
    EXPECT_TRUE(args.raw().is_object());
    EXPECT_EQ(args.int_or("count", 10), 10);
}

TEST(ToolArgumentsTest, NonObjectJsonDegrades) {
    EXPECT_TRUE(ToolArguments::parse("[1, 2]").degraded());
    EXPECT_TRUE(ToolArguments::parse("\"text\"").degraded());
    EXPECT_TRUE(ToolArguments::parse("42").degraded());
}

// ============================================================================
// Typed getters
// ============================================================================

TEST(ToolArgumentsTest, MistypedValuesUseFallback) {
    auto args = ToolArguments::parse(R"({"count": "five", "flag": 1, "name": 7, "hours": "lots"})");
    EXPECT_EQ(args.int_or("count", 3), 3);
    EXPECT_TRUE(args.bool_or("flag", true));
    EXPECT_EQ(args.string_or("name", "default"), "default");
    EXPECT_DOUBLE_EQ(args.double_or("hours", 20.0), 20.0);
}

TEST(ToolArgumentsTest, NumericConversions) {
    auto args = ToolArguments::parse(R"({"count": 4.9, "hours": 12})");
    EXPECT_EQ(args.int_or("count", 0), 4);
    EXPECT_DOUBLE_EQ(args.double_or("hours", 0.0), 12.0);
}

TEST(ToolArgumentsTest, OutOfRangeIntegersUseFallback) {
    auto args = ToolArguments::parse(R"({
        "huge_float": 1e300, "tiny_float": -1e300, "above_float": 9.3e18,
        "max_unsigned": 18446744073709551615, "just_above": 9223372036854775808
    })");
    EXPECT_EQ(args.int_or("huge_float", 8), 8);
    EXPECT_EQ(args.int_or("tiny_float", 8), 8);
    EXPECT_EQ(args.int_or("above_float", 8), 8);
    EXPECT_EQ(args.int_or("max_unsigned", 8), 8);
    EXPECT_EQ(args.int_or("just_above", 8), 8);
}

TEST(ToolArgumentsTest, IntegerLimitsAreKept) {
    auto args = ToolArguments::parse(R"({
        "max": 9223372036854775807, "min": -9223372036854775808, "negative_float": -1.5
    })");
    EXPECT_EQ(args.int_or("max", 0), std::numeric_limits<long long>::max());
    EXPECT_EQ(args.int_or("min", 0), std::numeric_limits<long long>::min());
    EXPECT_EQ(args.int_or("negative_float", 0), -1);
}

TEST(ToolArgumentsTest, HasIgnoresNull) {
    auto args = ToolArguments::parse(R"({"a": null, "b": false})");
    EXPECT_FALSE(args.has("a"));
    EXPECT_TRUE(args.has("b"));
    EXPECT_FALSE(args.has("c"));
}

TEST(ToolArgumentsTest, StringList) {
    auto args = ToolArguments::parse(R"({"sectors": ["robotics", 3, true, {"x": 1}], "single": "robotics"})");
    EXPECT_EQ(args.string_list("sectors"), (std::vector<std::string>{"robotics", "3", "true", ""}));
    EXPECT_TRUE(args.string_list("single").empty());
    EXPECT_TRUE(args.string_list("missing").empty());
}

TEST(ToolArgumentsTest, ObjectList) {
    auto args = ToolArguments::parse(R"({"contacts": [{"name": "Ada"}, "Bob"]})");
    auto list = args.object_list("contacts");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0]["name"], "Ada");
    EXPECT_TRUE(list[1].is_object());
    EXPECT_TRUE(list[1].empty());
    EXPECT_TRUE(args.object_list("missing").is_array());
}

// ============================================================================
// Result envelopes
// ============================================================================

TEST(ToolResultTest, ContextEnvelope) {
    auto result = ToolResult::context_provided(json{{"requested_count", 5}}, "Find sources");
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.status(), "context_provided");
    EXPECT_EQ(result.instruction(), std::optional<std::string>("Find sources"));
    EXPECT_FALSE(result.error_message().has_value());
    EXPECT_EQ(result.body()["requested_count"], 5);
}

TEST(ToolResultTest, ErrorEnvelope) {
    auto result = ToolResult::error("Unknown tool: x");
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error_message(), std::optional<std::string>("Unknown tool: x"));
    EXPECT_EQ(json::parse(result.to_string()), json({{"status", "error"}, {"error", "Unknown tool: x"}}));
}

TEST(ToolResultTest, FromErrorAppendsContext) {
    auto with_context = ToolResult::from_error(Error{ErrorCode::ContextUnavailable, "Context unavailable", "pipeline_status"});
    EXPECT_EQ(with_context.error_message(), std::optional<std::string>("Context unavailable: pipeline_status"));

    auto without = ToolResult::from_error(Error{ErrorCode::ToolNotFound, "Unknown tool: y"});
    EXPECT_EQ(without.error_message(), std::optional<std::string>("Unknown tool: y"));
}

TEST(ToolResultTest, FromBodyRequiresStatusField) {
    EXPECT_FALSE(ToolResult::from_body(json::array()).has_value());
    EXPECT_FALSE(ToolResult::from_body(json{{"instruction", "x"}}).has_value());
    EXPECT_FALSE(ToolResult::from_body(json{{"status", "done"}}).has_value());
    EXPECT_FALSE(ToolResult::from_body(json{{"status", "context_provided"}}).has_value());
    EXPECT_FALSE(ToolResult::from_body(json{{"status", "error"}}).has_value());
    EXPECT_TRUE(ToolResult::from_body(json{{"status", "error"}, {"error", "boom"}}).has_value());
}

TEST(ToolResultTest, ParseText) {
    auto parsed = ToolResult::parse(R"({"status": "context_provided", "instruction": "go"})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->instruction(), std::optional<std::string>("go"));

    auto garbage = ToolResult::parse("not json");
    ASSERT_FALSE(garbage.has_value());
    EXPECT_EQ(garbage.error().code, ErrorCode::InvalidJson);

    auto wrong_shape = ToolResult::parse("[]");
    ASSERT_FALSE(wrong_shape.has_value());
    EXPECT_EQ(wrong_shape.error().code, ErrorCode::UnexpectedShape);
}

TEST(ToolResultTest, InvalidUtf8IsReplaced) {
    auto result = ToolResult::error(std::string("bad \xff byte"));
    std::string text;
    EXPECT_NO_THROW(text = result.to_string());
    EXPECT_FALSE(json::parse(text, nullptr, false).is_discarded());
}
