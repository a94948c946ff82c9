#pragma once

#include "log.hpp"
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace quarry {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * Error codes are grouped into ranges by category:
 * - 100-199: Configuration errors (schema resources, catalogue setup)
 * - 200-299: Tool invocation errors
 * - 300-399: Structured decoding errors
 * - 400-499: Operation tracking errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    SchemaResourceMissing = 101,
    SchemaParseFailed = 102,
    InvalidSchema = 103,
    DuplicateTool = 104,

    // Tool invocation errors (200-299)
    ToolNotFound = 200,
    ToolExecutionFailed = 201,
    ContextUnavailable = 202,
    DispatcherStopped = 203,
    QueueFull = 204,

    // Decode errors (300-399)
    InvalidJson = 300,
    MissingField = 301,
    FieldTypeMismatch = 302,
    UnexpectedShape = 303,
    ValidationFailed = 350,

    // Tracking errors (400-499)
    OperationNotFound = 400,
    DuplicateOperation = 401,

    // Unknown
    Unknown = 999
};

/// True for failures caused by the shape of a model reply (retry with a corrected prompt).
[[nodiscard]] inline bool is_decode_error(ErrorCode code) {
    const int value = static_cast<int>(code);
    return value >= 300 && value < 350;
}

/// True when the reply was well-formed but failed its semantic checks.
[[nodiscard]] inline bool is_validation_error(ErrorCode code) {
    return code == ErrorCode::ValidationFailed;
}

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (e.g., resource paths, field names)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration for AgentCore initialization
 *
 * Value type holding catalogue, dispatch and logging settings.
 * Must be validated via validate() before use.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Config {
    std::optional<std::string> schema_directory;  ///< Directory of <tool>.json argument schemas (overrides built-ins)
    size_t dispatch_workers = 4;                  ///< Worker threads serving submit() (> 0)
    size_t dispatch_queue_capacity = 0;           ///< Maximum pending submissions (0 = unlimited)
    std::string log_level = "info";               ///< trace, debug, info, warn, error or off
    std::string logger_name = "quarry";           ///< Name of the logger created by AgentCore

    Expected<void> validate() const {
        if (dispatch_workers == 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "dispatch_workers must be positive"});
        }
        if (!log::parse_level(log_level)) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Unknown log level", log_level});
        }
        if (logger_name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "logger_name cannot be empty"});
        }
        if (schema_directory.has_value() && schema_directory->empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "schema_directory cannot be empty when set"});
        }
        return {};
    }

    /**
     * @brief Read a configuration document
     *
     * Recognized keys: schema_directory, dispatch_workers,
     * dispatch_queue_capacity, log_level, logger_name. Unknown keys are
     * ignored; absent keys keep their defaults.
     */
    static Expected<Config> from_json(const nlohmann::json& doc) {
        if (!doc.is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Configuration must be a JSON object"});
        }

        Config config;
        try {
            if (auto it = doc.find("schema_directory"); it != doc.end() && !it->is_null()) {
                config.schema_directory = it->get<std::string>();
            }
            for (const char* key : {"dispatch_workers", "dispatch_queue_capacity"}) {
                auto it = doc.find(key);
                if (it != doc.end() && (!it->is_number_integer() || it->get<long long>() < 0)) {
                    return tl::unexpected(Error{
                        ErrorCode::InvalidConfig,
                        std::string(key) + " must be a non-negative integer"
                    });
                }
            }
            if (auto it = doc.find("dispatch_workers"); it != doc.end()) {
                config.dispatch_workers = it->get<size_t>();
            }
            if (auto it = doc.find("dispatch_queue_capacity"); it != doc.end()) {
                config.dispatch_queue_capacity = it->get<size_t>();
            }
            if (auto it = doc.find("log_level"); it != doc.end()) {
                config.log_level = it->get<std::string>();
            }
            if (auto it = doc.find("logger_name"); it != doc.end()) {
                config.logger_name = it->get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                std::string("Invalid configuration value: ") + e.what()
            });
        }
        return config;
    }

    bool operator==(const Config& other) const {
        return schema_directory == other.schema_directory &&
               dispatch_workers == other.dispatch_workers &&
               dispatch_queue_capacity == other.dispatch_queue_capacity &&
               log_level == other.log_level &&
               logger_name == other.logger_name;
    }

    bool operator!=(const Config& other) const {
        return !(*this == other);
    }
};

} // namespace quarry
