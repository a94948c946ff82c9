#pragma once

#include "../types.hpp"
#include "../schema/schema_node.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace quarry {
namespace tools {

// ============================================================================
// Tool Handler Type
// ============================================================================

/**
 * @brief Callable type for tool execution
 *
 * Takes the (already defensively parsed) JSON argument object and returns
 * the ToolResult body, or an Error that the dispatcher turns into an error
 * envelope. Handlers may also throw; the dispatcher catches at its boundary.
 */
using ToolHandler = std::function<Expected<nlohmann::json>(const nlohmann::json&)>;

// ============================================================================
// Tool Descriptor
// ============================================================================

/** @brief Published contract of a single tool. */
struct ToolDescriptor {
    std::string name;                  ///< Unique tool name used for invocation
    std::string description;           ///< Short description shown to the model
    schema::SchemaNode argument_schema; ///< Compiled argument contract

    /// {name, description, parameters} as consumed by the model transport.
    nlohmann::json to_json() const {
        return nlohmann::json{
            {"name", name},
            {"description", description},
            {"parameters", argument_schema.to_json()}
        };
    }
};

/** @brief Holds the descriptor and handler for a single registered tool. */
struct ToolEntry {
    ToolDescriptor descriptor;  ///< Advertised contract
    ToolHandler handler;        ///< Callable that gathers context for the model
};

// ============================================================================
// ToolRegistry
// ============================================================================

/**
 * @brief Catalogue of tools with schema advertisement and invocation.
 *
 * Populated once during start-up and read-only afterwards. Advertisement
 * order is registration order.
 *
 * @threadsafety All public methods are thread-safe. Read operations use shared
 * locks; register_tool uses an exclusive lock.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool.
     *
     * @return ErrorCode::DuplicateTool if the name is taken,
     *         ErrorCode::InvalidConfig for an empty name or missing handler
     */
    Expected<void> register_tool(ToolDescriptor descriptor, ToolHandler handler) {
        if (descriptor.name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Tool name cannot be empty"});
        }
        if (!handler) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Tool handler is empty", descriptor.name});
        }

        std::unique_lock lock(mutex_);
        if (tools_.find(descriptor.name) != tools_.end()) {
            return tl::unexpected(Error{ErrorCode::DuplicateTool, "Tool already registered", descriptor.name});
        }
        order_.push_back(descriptor.name);
        std::string name = descriptor.name;
        tools_.emplace(std::move(name), ToolEntry{std::move(descriptor), std::move(handler)});
        return {};
    }

    /** @brief Convenience overload taking the descriptor fields. */
    Expected<void> register_tool(const std::string& name, const std::string& description,
                                 schema::SchemaNode argument_schema, ToolHandler handler) {
        return register_tool(ToolDescriptor{name, description, std::move(argument_schema)}, std::move(handler));
    }

    /** @brief Check whether a tool with the given name is registered. */
    bool has_tool(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return tools_.find(name) != tools_.end();
    }

    /** @brief Invoke a registered tool by name with the given JSON arguments. */
    Expected<nlohmann::json> invoke(const std::string& name, const nlohmann::json& args) const {
        ToolHandler handler;
        {
            std::shared_lock lock(mutex_);
            auto it = tools_.find(name);
            if (it == tools_.end()) {
                return tl::unexpected(Error{
                    ErrorCode::ToolNotFound,
                    "Unknown tool: " + name
                });
            }
            handler = it->second.handler;
        }
        return handler(args);
    }

    /** @brief Descriptor of a registered tool, or nullptr. */
    const ToolDescriptor* get_descriptor(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return nullptr;
        }
        return &it->second.descriptor;
    }

    /** @brief Get the JSON function-calling schema for a single tool, or empty JSON if not found. */
    nlohmann::json get_tool_schema(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return nlohmann::json{};
        }
        return build_schema_json(it->second.descriptor);
    }

    /** @brief Get an array of JSON function-calling schemas for all registered tools. */
    nlohmann::json get_all_schemas() const {
        std::shared_lock lock(mutex_);
        nlohmann::json schemas = nlohmann::json::array();
        for (const auto& name : order_) {
            schemas.push_back(build_schema_json(tools_.at(name).descriptor));
        }
        return schemas;
    }

    /** @brief Return all registered tool names in registration order. */
    std::vector<std::string> get_tool_names() const {
        std::shared_lock lock(mutex_);
        return order_;
    }

    /** @brief Return the number of registered tools. */
    size_t size() const {
        std::shared_lock lock(mutex_);
        return tools_.size();
    }

private:
    static nlohmann::json build_schema_json(const ToolDescriptor& descriptor) {
        return nlohmann::json{
            {"type", "function"},
            {"function", descriptor.to_json()}
        };
    }

    std::unordered_map<std::string, ToolEntry> tools_;
    std::vector<std::string> order_;
    mutable std::shared_mutex mutex_;
};

} // namespace tools
} // namespace quarry
