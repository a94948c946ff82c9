#pragma once

#include "../types.hpp"
#include "schema_compiler.hpp"
#include "schema_node.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace quarry {

/**
 * @brief Fatal start-up configuration failure
 *
 * Thrown only while the tool catalogue is being built. Carries the
 * underlying Error so the diagnostic names the offending resource.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(Error error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    const Error& error() const noexcept { return error_; }

private:
    Error error_;
};

namespace schema {

/**
 * @brief Reads schema resources and compiles them
 *
 * load_* report failures as values; require_* turn them into a
 * ConfigurationError for use during initialization.
 */
class SchemaLoader {
public:
    /**
     * @brief Parse and compile a schema held in memory
     *
     * @param text JSON text of the schema description
     * @param resource_name Name reported in errors
     */
    static Expected<SchemaNode> load_string(std::string_view text, const std::string& resource_name) {
        auto doc = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        if (doc.is_discarded()) {
            return tl::unexpected(Error{
                ErrorCode::SchemaParseFailed,
                "Schema resource is not valid JSON",
                resource_name
            });
        }
        if (!doc.is_object()) {
            return tl::unexpected(Error{
                ErrorCode::SchemaParseFailed,
                "Schema resource must contain a JSON object",
                resource_name
            });
        }

        auto node = SchemaCompiler::compile(doc);
        if (!node) {
            const auto& err = node.error();
            std::string context = resource_name;
            if (err.context) {
                context += " at " + *err.context;
            }
            return tl::unexpected(Error{err.code, err.message, context});
        }
        return node;
    }

    /// Read a schema resource from disk and compile it.
    static Expected<SchemaNode> load_file(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in) {
            return tl::unexpected(Error{
                ErrorCode::SchemaResourceMissing,
                "Schema resource not found",
                path.string()
            });
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return load_string(buffer.str(), path.string());
    }

    static SchemaNode require_string(std::string_view text, const std::string& resource_name) {
        auto node = load_string(text, resource_name);
        if (!node) {
            throw ConfigurationError(node.error());
        }
        return std::move(*node);
    }

    static SchemaNode require_file(const std::filesystem::path& path) {
        auto node = load_file(path);
        if (!node) {
            throw ConfigurationError(node.error());
        }
        return std::move(*node);
    }
};

} // namespace schema
} // namespace quarry
