#pragma once

#include "../log.hpp"
#include "../types.hpp"
#include "invocation_queue.hpp"
#include "tool_arguments.hpp"
#include "tool_registry.hpp"
#include "tool_result.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace quarry {
namespace tools {

/** @brief Counters describing dispatcher activity since construction. */
struct DispatchStats {
    size_t invocations = 0;          ///< Calls to execute(), direct or via submit()
    size_t errors = 0;               ///< Invocations answered with an error envelope
    size_t unknown_tools = 0;        ///< Invocations naming an unregistered tool
    size_t degraded_arguments = 0;   ///< Argument blobs replaced by an empty object
};

/** @brief Worker pool settings for asynchronous submission. */
struct DispatcherOptions {
    size_t workers = 4;          ///< Threads serving submit() (0 = submit() disabled)
    size_t queue_capacity = 0;   ///< Maximum pending submissions (0 = unlimited)
};

/**
 * @brief Routes tool invocations to registered handlers
 *
 * execute() is the single entry point and never throws: unknown tools,
 * handler errors and exceptions raised while gathering context all come
 * back as a status:error envelope. Malformed argument text degrades to an
 * empty argument object.
 *
 * submit() queues an invocation for the worker pool and returns a future
 * for the envelope text. Invocations may complete in any order.
 *
 * @threadsafety execute() and submit() may be called from any thread.
 */
class ToolDispatcher {
public:
    ToolDispatcher(std::shared_ptr<const ToolRegistry> registry,
                   std::shared_ptr<spdlog::logger> logger = nullptr,
                   DispatcherOptions options = {})
        : registry_(std::move(registry))
        , logger_(log::or_default(std::move(logger)))
        , queue_(options.queue_capacity)
    {
        workers_.reserve(options.workers);
        for (size_t i = 0; i < options.workers; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~ToolDispatcher() {
        stop();
    }

    ToolDispatcher(const ToolDispatcher&) = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;

    /**
     * @brief Execute a tool synchronously
     *
     * @param tool_name Exact registered name
     * @param raw_arguments JSON text of the argument object
     * @return Envelope JSON text; always valid JSON with a "status" field
     */
    std::string execute(const std::string& tool_name, std::string_view raw_arguments) noexcept {
        invocations_.fetch_add(1, std::memory_order_relaxed);
        try {
            return dispatch(tool_name, raw_arguments).to_string();
        } catch (const std::exception& e) {
            errors_.fetch_add(1, std::memory_order_relaxed);
            log_failure(tool_name, e.what());
            return fallback_error(e.what());
        } catch (...) {
            errors_.fetch_add(1, std::memory_order_relaxed);
            log_failure(tool_name, "non-standard exception");
            return fallback_error("Tool execution failed");
        }
    }

    /**
     * @brief Execute a wire request {toolName, arguments}
     *
     * "arguments" is normally a JSON-encoded string; an inline object is
     * accepted too, and a missing value means no arguments.
     */
    std::string execute_request(std::string_view request_text) noexcept {
        std::string tool_name;
        std::string raw_arguments;
        try {
            auto request = nlohmann::json::parse(request_text.begin(), request_text.end(), nullptr, false);
            if (request.is_discarded() || !request.is_object()) {
                return reject_request("Invalid tool request: expected a JSON object");
            }
            auto name_it = request.find("toolName");
            if (name_it == request.end() || !name_it->is_string()) {
                return reject_request("Invalid tool request: missing toolName");
            }
            tool_name = name_it->get<std::string>();

            auto args_it = request.find("arguments");
            if (args_it != request.end()) {
                if (args_it->is_string()) {
                    raw_arguments = args_it->get<std::string>();
                } else if (!args_it->is_null()) {
                    raw_arguments = args_it->dump();
                }
            }
        } catch (const std::exception& e) {
            return fallback_error(std::string("Invalid tool request: ") + e.what());
        }
        return execute(tool_name, raw_arguments);
    }

    /**
     * @brief Queue an invocation for the worker pool
     *
     * @return Future for the envelope text, or ErrorCode::DispatcherStopped /
     *         ErrorCode::QueueFull
     */
    Expected<std::future<std::string>> submit(std::string tool_name, std::string raw_arguments) {
        if (workers_.empty()) {
            return tl::unexpected(Error{ErrorCode::DispatcherStopped, "Dispatcher has no workers"});
        }

        PendingInvocation invocation{std::move(tool_name), std::move(raw_arguments), {}};
        auto future = invocation.promise.get_future();
        if (!queue_.push(invocation)) {
            if (queue_.is_shutdown()) {
                return tl::unexpected(Error{ErrorCode::DispatcherStopped, "Dispatcher is stopped"});
            }
            logger_->warn("Invocation queue full, rejecting {}", invocation.tool_name);
            return tl::unexpected(Error{ErrorCode::QueueFull, "Invocation queue is full", invocation.tool_name});
        }
        return future;
    }

    /**
     * @brief Stop accepting submissions and join the workers
     *
     * Invocations already queued are still executed. Idempotent.
     */
    void stop() {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        queue_.shutdown();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    bool is_stopped() const {
        return queue_.is_shutdown();
    }

    size_t pending() const {
        return queue_.size();
    }

    DispatchStats stats() const {
        DispatchStats s;
        s.invocations = invocations_.load(std::memory_order_relaxed);
        s.errors = errors_.load(std::memory_order_relaxed);
        s.unknown_tools = unknown_tools_.load(std::memory_order_relaxed);
        s.degraded_arguments = degraded_arguments_.load(std::memory_order_relaxed);
        return s;
    }

    const ToolRegistry& registry() const { return *registry_; }

private:
    ToolResult dispatch(const std::string& tool_name, std::string_view raw_arguments) {
        auto args = ToolArguments::parse(raw_arguments);
        if (args.degraded()) {
            degraded_arguments_.fetch_add(1, std::memory_order_relaxed);
            logger_->warn("Arguments for {} are not a JSON object, using defaults", tool_name);
        }

        if (!registry_->has_tool(tool_name)) {
            unknown_tools_.fetch_add(1, std::memory_order_relaxed);
            errors_.fetch_add(1, std::memory_order_relaxed);
            logger_->warn("Unknown tool requested: {}", tool_name);
            return ToolResult::error("Unknown tool: " + tool_name);
        }

        logger_->info("Dispatching tool {}", tool_name);
        auto body = registry_->invoke(tool_name, args.raw());
        if (!body) {
            errors_.fetch_add(1, std::memory_order_relaxed);
            log_failure(tool_name, body.error().to_string());
            return ToolResult::from_error(body.error());
        }

        auto result = ToolResult::from_body(std::move(*body));
        if (!result) {
            errors_.fetch_add(1, std::memory_order_relaxed);
            log_failure(tool_name, "handler returned a malformed envelope");
            return ToolResult::error("Tool " + tool_name + " returned a malformed result");
        }
        if (result->is_error()) {
            errors_.fetch_add(1, std::memory_order_relaxed);
        }
        return std::move(*result);
    }

    void worker_loop() {
        while (auto invocation = queue_.pop()) {
            invocation->promise.set_value(execute(invocation->tool_name, invocation->raw_arguments));
        }
    }

    std::string reject_request(const std::string& message) {
        invocations_.fetch_add(1, std::memory_order_relaxed);
        errors_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("{}", message);
        return ToolResult::error(message).to_string();
    }

    // spdlog reports its own failures through its error handler
    void log_failure(const std::string& tool_name, const std::string& what) noexcept {
        logger_->error("Tool {} failed: {}", tool_name, what);
    }

    // Built without nlohmann so it cannot fail a second time
    static std::string fallback_error(const std::string& message) noexcept {
        try {
            std::string escaped;
            escaped.reserve(message.size());
            for (char c : message) {
                if (c == '"' || c == '\\') {
                    escaped += '\\';
                    escaped += c;
                } else if (static_cast<unsigned char>(c) < 0x20 || static_cast<unsigned char>(c) >= 0x80) {
                    escaped += ' ';
                } else {
                    escaped += c;
                }
            }
            return "{\"error\":\"" + escaped + "\",\"status\":\"error\"}";
        } catch (const std::bad_alloc&) {
            return "{\"error\":\"Tool execution failed\",\"status\":\"error\"}";
        }
    }

    std::shared_ptr<const ToolRegistry> registry_;
    std::shared_ptr<spdlog::logger> logger_;
    InvocationQueue queue_;
    std::vector<std::thread> workers_;
    std::mutex stop_mutex_;

    std::atomic<size_t> invocations_{0};
    std::atomic<size_t> errors_{0};
    std::atomic<size_t> unknown_tools_{0};
    std::atomic<size_t> degraded_arguments_{0};
};

} // namespace tools
} // namespace quarry
