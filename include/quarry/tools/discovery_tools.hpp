#pragma once

#include "../types.hpp"
#include "context_provider.hpp"
#include "tool_arguments.hpp"
#include "tool_registry.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quarry {
namespace tools {

/** @brief Static catalogue entry of a built-in job-search tool. */
struct CatalogEntry {
    const char* name;           ///< Tool name
    const char* description;    ///< Short description advertised to the model
    const char* schema_source;  ///< Built-in argument schema description (JSON text)
};

/// Built-in tools in advertisement order.
const std::vector<CatalogEntry>& discovery_catalog();

/**
 * @brief Compile the descriptors of every built-in tool
 *
 * With a schema directory, each tool's argument schema is read from
 * <directory>/<tool_name>.json instead of the built-in description.
 *
 * @throws ConfigurationError if any schema resource is missing or malformed
 */
std::vector<ToolDescriptor> build_discovery_descriptors(
    const std::optional<std::filesystem::path>& schema_directory = std::nullopt);

/**
 * @brief Context-gathering handlers for the job-search tools
 *
 * Each handler reads its arguments with per-tool defaults, starts every
 * context snapshot it needs, and answers with a context_provided envelope
 * whose instruction tells the model the exact output shape to produce.
 * Handlers are stateless apart from the shared provider.
 */
class DiscoveryTools {
public:
    explicit DiscoveryTools(std::shared_ptr<IContextProvider> provider);

    Expected<nlohmann::json> generate_daily_tasks(const ToolArguments& args) const;
    Expected<nlohmann::json> discover_job_sources(const ToolArguments& args) const;
    Expected<nlohmann::json> discover_networking_events(const ToolArguments& args) const;
    Expected<nlohmann::json> evaluate_networking_event(const ToolArguments& args) const;
    Expected<nlohmann::json> prepare_for_event(const ToolArguments& args) const;
    Expected<nlohmann::json> debrief_event(const ToolArguments& args) const;
    Expected<nlohmann::json> suggest_networking_actions(const ToolArguments& args) const;
    Expected<nlohmann::json> draft_outreach_message(const ToolArguments& args) const;
    Expected<nlohmann::json> recommend_weekly_goals(const ToolArguments& args) const;
    Expected<nlohmann::json> generate_weekly_reflection(const ToolArguments& args) const;

    /// Handler bound to the named tool, or an empty function for unknown names.
    ToolHandler handler_for(const std::string& tool_name) const;

private:
    std::shared_ptr<IContextProvider> provider_;
};

/**
 * @brief Register every built-in tool
 *
 * @throws ConfigurationError if a schema resource cannot be loaded
 * @return ErrorCode::DuplicateTool if the registry already holds one of the names
 */
Expected<void> register_discovery_tools(
    ToolRegistry& registry,
    std::shared_ptr<IContextProvider> provider,
    const std::optional<std::filesystem::path>& schema_directory = std::nullopt);

} // namespace tools
} // namespace quarry
