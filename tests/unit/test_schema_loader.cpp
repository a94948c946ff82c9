#include <gtest/gtest.h>
#include "quarry/schema/schema_loader.hpp"
#include <filesystem>
#include <fstream>

using namespace quarry;
using namespace quarry::schema;
namespace fs = std::filesystem;

class SchemaLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("quarry_schema_loader_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path write(const std::string& name, const std::string& contents) {
        auto path = dir / name;
        std::ofstream out(path);
        out << contents;
        return path;
    }

    fs::path dir;
};

// ============================================================================
// SL-001: In-memory resources
// ============================================================================

TEST_F(SchemaLoaderTest, LoadStringCompiles) {
    auto node = SchemaLoader::load_string(
        R"({"type": "object", "properties": {"count": {"type": "integer"}}})", "inline");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->property("count")->kind, SchemaKind::Integer);
}

TEST_F(SchemaLoaderTest, LoadStringRejectsInvalidJson) {
    auto node = SchemaLoader::load_string("{not json", "broken.json");
    ASSERT_FALSE(node.has_value());
    EXPECT_EQ(node.error().code, ErrorCode::SchemaParseFailed);
    EXPECT_EQ(node.error().context, std::optional<std::string>("broken.json"));
}

TEST_F(SchemaLoaderTest, LoadStringRejectsNonObject) {
    auto node = SchemaLoader::load_string("[1, 2, 3]", "array.json");
    ASSERT_FALSE(node.has_value());
    EXPECT_EQ(node.error().code, ErrorCode::SchemaParseFailed);
}

TEST_F(SchemaLoaderTest, CompileErrorNamesResourceAndPath) {
    auto node = SchemaLoader::load_string(
        R"({"properties": {"tags": {"type": "array"}}})", "tags.json");
    ASSERT_FALSE(node.has_value());
    EXPECT_EQ(node.error().code, ErrorCode::InvalidSchema);
    ASSERT_TRUE(node.error().context.has_value());
    EXPECT_EQ(*node.error().context, "tags.json at $.properties.tags");
}

// ============================================================================
// SL-002: File resources
// ============================================================================

TEST_F(SchemaLoaderTest, LoadFileCompiles) {
    auto path = write("find_events.json",
                      R"({"type": "object", "properties": {"query": {"type": "string"}}, "required": ["query"]})");
    auto node = SchemaLoader::load_file(path);
    ASSERT_TRUE(node.has_value());
    EXPECT_TRUE(node->is_required("query"));
}

TEST_F(SchemaLoaderTest, MissingFileReported) {
    auto node = SchemaLoader::load_file(dir / "absent.json");
    ASSERT_FALSE(node.has_value());
    EXPECT_EQ(node.error().code, ErrorCode::SchemaResourceMissing);
    ASSERT_TRUE(node.error().context.has_value());
    EXPECT_NE(node.error().context->find("absent.json"), std::string::npos);
}

TEST_F(SchemaLoaderTest, UnparseableFileReported) {
    auto path = write("bad.json", "{\"type\": ");
    auto node = SchemaLoader::load_file(path);
    ASSERT_FALSE(node.has_value());
    EXPECT_EQ(node.error().code, ErrorCode::SchemaParseFailed);
}

// ============================================================================
// SL-003: require_* raise ConfigurationError
// ============================================================================

TEST_F(SchemaLoaderTest, RequireFileThrowsForMissingResource) {
    try {
        SchemaLoader::require_file(dir / "absent.json");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.error().code, ErrorCode::SchemaResourceMissing);
        EXPECT_NE(std::string(e.what()).find("absent.json"), std::string::npos);
    }
}

TEST_F(SchemaLoaderTest, RequireStringThrowsForInvalidSchema) {
    EXPECT_THROW(SchemaLoader::require_string(R"({"required": ["x"]})", "x.json"), ConfigurationError);
}

TEST_F(SchemaLoaderTest, RequireStringReturnsNode) {
    auto node = SchemaLoader::require_string(R"({"type": "boolean"})", "flag.json");
    EXPECT_EQ(node.kind, SchemaKind::Boolean);
}
