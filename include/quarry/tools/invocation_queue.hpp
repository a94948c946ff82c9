#pragma once

#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace quarry {
namespace tools {

/** @brief A submitted tool call waiting for a dispatcher worker. */
struct PendingInvocation {
    std::string tool_name;                ///< Requested tool
    std::string raw_arguments;            ///< Argument text as received
    std::promise<std::string> promise;    ///< Fulfilled with the envelope text
};

/**
 * @brief Thread-safe MPMC queue of pending tool invocations
 *
 * Multiple producers (submitting threads), multiple consumers (dispatcher
 * workers).
 *
 * Design:
 * - Mutex + condition variable
 * - Blocking pop for workers
 * - Non-blocking push for callers
 * - Shutdown stops new pushes; already queued invocations are still handed out
 */
class InvocationQueue {
public:
    /**
     * @brief Construct queue with optional capacity limit
     *
     * @param max_size Maximum queue size (0 = unlimited)
     */
    explicit InvocationQueue(size_t max_size = 0)
        : max_size_(max_size)
        , shutdown_(false)
    {}

    /**
     * @brief Push an invocation onto the queue (non-blocking)
     *
     * On failure the invocation is left untouched so the caller can still
     * fulfil its promise.
     *
     * @return true if enqueued, false if queue is full or shutdown
     */
    bool push(PendingInvocation& invocation) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (shutdown_) {
            return false;
        }

        if (max_size_ > 0 && queue_.size() >= max_size_) {
            return false;
        }

        queue_.push(std::move(invocation));
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Pop an invocation from the queue (blocking)
     *
     * Blocks until an invocation is available or shutdown is signaled.
     *
     * @return std::nullopt once shut down and drained
     */
    std::optional<PendingInvocation> pop() {
        std::unique_lock<std::mutex> lock(mutex_);

        cv_.wait(lock, [this] {
            return !queue_.empty() || shutdown_;
        });

        if (shutdown_ && queue_.empty()) {
            return std::nullopt;
        }

        PendingInvocation invocation = std::move(queue_.front());
        queue_.pop();
        return invocation;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    /**
     * @brief Signal shutdown
     *
     * Wakes up blocked pop() calls and prevents new pushes.
     * Does not clear existing invocations.
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        cv_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

private:
    std::queue<PendingInvocation> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t max_size_;
    bool shutdown_;
};

} // namespace tools
} // namespace quarry
