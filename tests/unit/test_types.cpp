#include <gtest/gtest.h>
#include "quarry/types.hpp"

using namespace quarry;
using json = nlohmann::json;

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, ToStringIncludesCodeAndContext) {
    Error plain{ErrorCode::ToolNotFound, "Unknown tool: foo"};
    EXPECT_EQ(plain.to_string(), "[200] Unknown tool: foo");

    Error with_context{ErrorCode::SchemaResourceMissing, "Schema resource not found", "plan_daily_tasks.json"};
    EXPECT_EQ(with_context.to_string(), "[101] Schema resource not found | Context: plan_daily_tasks.json");
}

TEST(ErrorTest, DecodeErrorCategory) {
    EXPECT_TRUE(is_decode_error(ErrorCode::InvalidJson));
    EXPECT_TRUE(is_decode_error(ErrorCode::MissingField));
    EXPECT_TRUE(is_decode_error(ErrorCode::FieldTypeMismatch));
    EXPECT_TRUE(is_decode_error(ErrorCode::UnexpectedShape));
    EXPECT_FALSE(is_decode_error(ErrorCode::ValidationFailed));
    EXPECT_FALSE(is_decode_error(ErrorCode::ToolNotFound));
    EXPECT_FALSE(is_decode_error(ErrorCode::Unknown));
}

TEST(ErrorTest, ValidationErrorIsSeparateFromDecodeErrors) {
    EXPECT_TRUE(is_validation_error(ErrorCode::ValidationFailed));
    EXPECT_FALSE(is_validation_error(ErrorCode::InvalidJson));
}

TEST(ExpectedTest, CarriesValueOrError) {
    Expected<int> ok = 42;
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 42);

    Expected<int> failed = tl::unexpected(Error{ErrorCode::QueueFull, "Invocation queue is full"});
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::QueueFull);
}

// ============================================================================
// Config Tests
// ============================================================================

TEST(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_FALSE(config.schema_directory.has_value());
    EXPECT_EQ(config.dispatch_workers, 4u);
    EXPECT_EQ(config.dispatch_queue_capacity, 0u);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.logger_name, "quarry");
}

TEST(ConfigTest, ZeroWorkersRejected) {
    Config config;
    config.dispatch_workers = 0;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
}

TEST(ConfigTest, UnknownLogLevelRejected) {
    Config config;
    config.log_level = "verbose";
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
    ASSERT_TRUE(result.error().context.has_value());
    EXPECT_EQ(*result.error().context, "verbose");
}

TEST(ConfigTest, EmptyLoggerNameRejected) {
    Config config;
    config.logger_name = "";
    EXPECT_FALSE(config.validate().has_value());
}

TEST(ConfigTest, EmptySchemaDirectoryRejected) {
    Config config;
    config.schema_directory = "";
    EXPECT_FALSE(config.validate().has_value());
}

TEST(ConfigTest, FromJsonReadsAllKeys) {
    json doc = {
        {"schema_directory", "/etc/quarry/schemas"},
        {"dispatch_workers", 2},
        {"dispatch_queue_capacity", 16},
        {"log_level", "debug"},
        {"logger_name", "agent"},
        {"unrelated", true}
    };

    auto config = Config::from_json(doc);
    ASSERT_TRUE(config.has_value());
    ASSERT_TRUE(config->schema_directory.has_value());
    EXPECT_EQ(*config->schema_directory, "/etc/quarry/schemas");
    EXPECT_EQ(config->dispatch_workers, 2u);
    EXPECT_EQ(config->dispatch_queue_capacity, 16u);
    EXPECT_EQ(config->log_level, "debug");
    EXPECT_EQ(config->logger_name, "agent");
}

TEST(ConfigTest, FromJsonKeepsDefaultsForAbsentKeys) {
    auto config = Config::from_json(json::object());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(*config, Config{});
}

TEST(ConfigTest, FromJsonNullSchemaDirectoryMeansBuiltIns) {
    auto config = Config::from_json(json{{"schema_directory", nullptr}});
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->schema_directory.has_value());
}

TEST(ConfigTest, FromJsonRejectsNonObject) {
    auto config = Config::from_json(json::array({1, 2}));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

TEST(ConfigTest, FromJsonRejectsNegativeOrFractionalCounts) {
    EXPECT_FALSE(Config::from_json(json{{"dispatch_workers", -1}}).has_value());
    EXPECT_FALSE(Config::from_json(json{{"dispatch_workers", 2.5}}).has_value());
    EXPECT_FALSE(Config::from_json(json{{"dispatch_queue_capacity", "8"}}).has_value());
}

TEST(ConfigTest, FromJsonRejectsMistypedStrings) {
    auto config = Config::from_json(json{{"log_level", 3}});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

TEST(ConfigTest, Equality) {
    Config a;
    Config b;
    EXPECT_EQ(a, b);
    b.dispatch_workers = 8;
    EXPECT_NE(a, b);
}

// ============================================================================
// Logging helpers
// ============================================================================

TEST(LogTest, ParseLevel) {
    EXPECT_EQ(log::parse_level("warn"), spdlog::level::warn);
    EXPECT_EQ(log::parse_level("error"), spdlog::level::err);
    EXPECT_FALSE(log::parse_level("WARN").has_value());
}

TEST(LogTest, ShortId) {
    EXPECT_EQ(log::short_id("0123456789abcdef"), "01234567");
    EXPECT_EQ(log::short_id("abc"), "abc");
}

TEST(LogTest, OrDefaultFallsBackToDefaultLogger) {
    EXPECT_EQ(log::or_default(nullptr), spdlog::default_logger());
    auto custom = log::make_logger("custom", spdlog::level::off);
    EXPECT_EQ(log::or_default(custom), custom);
    EXPECT_EQ(custom->level(), spdlog::level::off);
}
