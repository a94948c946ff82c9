#pragma once

#include "log.hpp"
#include "types.hpp"
#include "decode/structured_decoder.hpp"
#include "schema/schema_loader.hpp"
#include "tools/context_provider.hpp"
#include "tools/discovery_tools.hpp"
#include "tools/tool_dispatcher.hpp"
#include "tools/tool_registry.hpp"
#include "tools/tool_result.hpp"
#include "tracking/operation_tracker.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace quarry {

/**
 * @brief Agent core facade
 *
 * Wires the built-in tool catalogue, the dispatcher, the structured decoder
 * and the operation tracker around one injected logger and context
 * provider. Requires linking quarry_tools.
 *
 * Example:
 * @code
 * auto core = quarry::AgentCore::create(config, provider);
 * if (!core) {
 *     std::cerr << core.error().to_string() << std::endl;
 *     return 1;
 * }
 * std::string envelope = (*core)->execute("generate_daily_tasks", R"({"max_tasks": 5})");
 * @endcode
 *
 * @threadsafety All public methods are thread-safe.
 */
class AgentCore {
public:
    /**
     * @brief Factory method to create an AgentCore
     *
     * @param config Validated before use
     * @param provider Source of live application context (required)
     * @param logger Logger shared by every component; built from config when null
     * @return The core, or ErrorCode::InvalidConfig
     * @throws ConfigurationError if a tool schema resource is missing or malformed
     */
    static Expected<std::unique_ptr<AgentCore>> create(
        const Config& config,
        std::shared_ptr<tools::IContextProvider> provider,
        std::shared_ptr<spdlog::logger> logger = nullptr
    ) {
        auto valid = config.validate();
        if (!valid) {
            return tl::unexpected(valid.error());
        }
        if (!provider) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Context provider is required"});
        }
        if (!logger) {
            logger = log::make_logger(config.logger_name, *log::parse_level(config.log_level));
        }

        auto registry = std::make_shared<tools::ToolRegistry>();
        std::optional<std::filesystem::path> schema_directory;
        if (config.schema_directory) {
            schema_directory = std::filesystem::path(*config.schema_directory);
        }
        auto registered = tools::register_discovery_tools(*registry, std::move(provider), schema_directory);
        if (!registered) {
            return tl::unexpected(registered.error());
        }
        logger->info("Tool catalogue ready ({} tools)", registry->size());

        return std::unique_ptr<AgentCore>(new AgentCore(config, std::move(registry), std::move(logger)));
    }

    ~AgentCore() {
        shutdown();
    }

    AgentCore(const AgentCore&) = delete;
    AgentCore& operator=(const AgentCore&) = delete;

    // ========================================================================
    // Tools
    // ========================================================================

    /// Advertisement array for the model transport.
    nlohmann::json tool_schemas() const {
        return registry_->get_all_schemas();
    }

    std::string execute(const std::string& tool_name, std::string_view raw_arguments) noexcept {
        return dispatcher_->execute(tool_name, raw_arguments);
    }

    std::string execute_request(std::string_view request_text) noexcept {
        return dispatcher_->execute_request(request_text);
    }

    Expected<std::future<std::string>> submit(std::string tool_name, std::string raw_arguments) {
        return dispatcher_->submit(std::move(tool_name), std::move(raw_arguments));
    }

    /**
     * @brief Execute a tool as a tracked tool_invocation operation
     *
     * The call and its envelope are recorded in the transcript; the
     * operation completes or fails according to the envelope status.
     *
     * @return Envelope text, or ErrorCode::DuplicateOperation if the id is in use
     */
    Expected<std::string> execute_tracked(const std::string& operation_id,
                                          const std::string& tool_name,
                                          std::string_view raw_arguments) {
        auto tracked = tracker_.track_operation(operation_id, tracking::OperationKind::ToolInvocation, tool_name);
        if (!tracked) {
            return tl::unexpected(tracked.error());
        }

        tracker_.append_transcript(operation_id, tracking::TranscriptEntryType::Tool,
                                   tool_name, std::string(raw_arguments));
        std::string envelope = dispatcher_->execute(tool_name, raw_arguments);

        auto result = tools::ToolResult::parse(envelope);
        const std::string status = result ? result->status() : std::string(tools::ToolResult::kError);
        tracker_.append_transcript(operation_id, tracking::TranscriptEntryType::ToolResult, status, envelope);

        if (!result) {
            tracker_.mark_failed(operation_id, result.error().message);
        } else if (auto message = result->error_message()) {
            tracker_.mark_failed(operation_id, *message);
        } else {
            tracker_.mark_completed(operation_id);
        }
        return envelope;
    }

    // ========================================================================
    // Decoding
    // ========================================================================

    template<typename T>
    Expected<T> decode(std::string_view reply) const {
        return decoder_.decode<T>(reply);
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    tracking::OperationTracker& tracker() { return tracker_; }
    const tracking::OperationTracker& tracker() const { return tracker_; }
    const tools::ToolDispatcher& dispatcher() const { return *dispatcher_; }
    const tools::ToolRegistry& registry() const { return *registry_; }
    const decode::StructuredDecoder& decoder() const { return decoder_; }
    const Config& get_config() const { return config_; }
    std::shared_ptr<spdlog::logger> logger() const { return logger_; }

    /// Stop the dispatcher worker pool; queued invocations still run.
    void shutdown() {
        dispatcher_->stop();
    }

private:
    AgentCore(const Config& config,
              std::shared_ptr<tools::ToolRegistry> registry,
              std::shared_ptr<spdlog::logger> logger)
        : config_(config)
        , logger_(std::move(logger))
        , registry_(std::move(registry))
        , dispatcher_(std::make_unique<tools::ToolDispatcher>(
              registry_, logger_,
              tools::DispatcherOptions{config.dispatch_workers, config.dispatch_queue_capacity}))
        , tracker_(logger_)
        , decoder_(logger_)
    {}

    Config config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<tools::ToolRegistry> registry_;
    std::unique_ptr<tools::ToolDispatcher> dispatcher_;
    tracking::OperationTracker tracker_;
    decode::StructuredDecoder decoder_;
};

} // namespace quarry
