#pragma once

#include "../log.hpp"
#include "../types.hpp"
#include "operation.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quarry {
namespace tracking {

/**
 * @brief Counts of calls that were tolerated as no-ops
 *
 * A late completion signal for a cleared operation and a duplicate
 * completion both end up here instead of raising.
 */
struct TrackerDiagnostics {
    size_t ignored_unknown_id = 0;           ///< Calls naming an id that is not tracked
    size_t ignored_terminal_transition = 0;  ///< Lifecycle calls on a terminated operation
    size_t ignored_phase_update = 0;         ///< Phase updates on a terminated operation
};

/**
 * @brief Lifecycle, transcript and token accounting for AI operations
 *
 * Operations are kept most-recent-first. Mutation goes exclusively through
 * this interface; get() and snapshot() return copies.
 *
 * Unknown ids and transitions out of a terminal state are ignored (logged
 * at warn and counted in diagnostics()). Token usage is accepted in any
 * state.
 *
 * When the last running operation terminates, the completion callback is
 * invoked with the summaries of every operation that finished since the
 * previous invocation. The callback runs outside the tracker lock and may
 * call back into the tracker.
 *
 * @threadsafety All public methods are thread-safe.
 */
class OperationTracker {
public:
    using Clock = std::function<TimePoint()>;
    using CompletionCallback = std::function<void(const std::vector<OperationSummary>&)>;

    explicit OperationTracker(std::shared_ptr<spdlog::logger> logger = nullptr, Clock clock = nullptr)
        : logger_(log::or_default(std::move(logger)))
        , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
    {}

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start tracking an operation in the Running state
     *
     * The operation becomes selected when nothing is selected or when it is
     * the only running operation.
     *
     * @return ErrorCode::DuplicateOperation if the id is already tracked
     */
    Expected<void> track_operation(const std::string& id, OperationKind kind, const std::string& name) {
        return insert(id, kind, name, OperationStatus::Running);
    }

    /// Start tracking an operation that has not begun yet.
    Expected<void> track_pending(const std::string& id, OperationKind kind, const std::string& name) {
        return insert(id, kind, name, OperationStatus::Pending);
    }

    /// Move a pending operation to Running.
    void mark_running(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        Operation* op = find_locked(id, "mark running");
        if (op == nullptr) return;

        if (op->is_terminal()) {
            ignore_terminal_locked(*op, "mark running");
            return;
        }
        if (op->status == OperationStatus::Pending) {
            op->status = OperationStatus::Running;
            op->start_time = clock_();
            logger_->info("Operation started: {} (id: {})", op->name, log::short_id(id));
        }
    }

    void mark_completed(const std::string& id) {
        finish(id, OperationStatus::Completed, std::nullopt);
    }

    /// Terminate with an error; also records an error transcript entry.
    void mark_failed(const std::string& id, const std::string& error) {
        finish(id, OperationStatus::Failed, error);
    }

    // ========================================================================
    // Progress
    // ========================================================================

    void append_transcript(const std::string& id,
                           TranscriptEntryType type,
                           const std::string& content,
                           std::optional<std::string> details = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        Operation* op = find_locked(id, "append transcript");
        if (op == nullptr) return;
        append_locked(*op, type, content, std::move(details));
    }

    /// Set the current phase and record it in the transcript.
    void update_phase(const std::string& id, const std::string& phase) {
        std::lock_guard<std::mutex> lock(mutex_);
        Operation* op = find_locked(id, "update phase");
        if (op == nullptr) return;

        if (op->is_terminal()) {
            ++diagnostics_.ignored_phase_update;
            logger_->warn("Cannot update phase: operation already {} (id: {})",
                          to_string(op->status), log::short_id(id));
            return;
        }
        op->current_phase = phase;
        append_locked(*op, TranscriptEntryType::Phase, phase, std::nullopt);
    }

    /// Accumulate token counts; negative amounts are treated as zero.
    void add_token_usage(const std::string& id, std::int64_t input, std::int64_t output, std::int64_t cached = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        Operation* op = find_locked(id, "add token usage");
        if (op == nullptr) return;

        op->input_tokens += std::max<std::int64_t>(input, 0);
        op->output_tokens += std::max<std::int64_t>(output, 0);
        op->cached_tokens += std::max<std::int64_t>(cached, 0);
    }

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<Operation> get(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& op : operations_) {
            if (op.id == id) return op;
        }
        return std::nullopt;
    }

    /// Copies of all operations, most recent first.
    std::vector<Operation> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return operations_;
    }

    /// Elapsed time of an operation (live while running).
    std::optional<std::chrono::milliseconds> duration(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& op : operations_) {
            if (op.id == id) return op.duration(clock_());
        }
        return std::nullopt;
    }

    size_t running_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_count_locked();
    }

    bool is_any_running() const {
        return running_count() > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return operations_.size();
    }

    TrackerDiagnostics diagnostics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return diagnostics_;
    }

    TimePoint now() const {
        return clock_();
    }

    // ========================================================================
    // Selection and cleanup
    // ========================================================================

    /// Select a tracked operation; returns false for unknown ids.
    bool select(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!contains_locked(id)) {
            return false;
        }
        selected_id_ = id;
        return true;
    }

    std::optional<std::string> selected_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return selected_id_;
    }

    /**
     * @brief Remove every terminated operation
     *
     * If the selection was removed it falls back to the first remaining
     * operation, or to none.
     *
     * @return Number of operations removed
     */
    size_t clear_completed() {
        std::lock_guard<std::mutex> lock(mutex_);
        const size_t before = operations_.size();
        operations_.erase(
            std::remove_if(operations_.begin(), operations_.end(),
                           [](const Operation& op) { return op.is_terminal(); }),
            operations_.end());
        const size_t removed = before - operations_.size();

        if (selected_id_ && !contains_locked(*selected_id_)) {
            if (operations_.empty()) {
                selected_id_.reset();
            } else {
                selected_id_ = operations_.front().id;
            }
        }

        if (removed > 0) {
            logger_->debug("Cleared {} finished operations", removed);
        }
        return removed;
    }

    void set_completion_callback(CompletionCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_all_completed_ = std::move(callback);
    }

private:
    Expected<void> insert(const std::string& id, OperationKind kind, const std::string& name,
                          OperationStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (contains_locked(id)) {
            logger_->warn("Operation already tracked (id: {})", log::short_id(id));
            return tl::unexpected(Error{ErrorCode::DuplicateOperation, "Operation already tracked", id});
        }

        Operation op;
        op.id = id;
        op.kind = kind;
        op.name = name;
        op.status = status;
        if (status == OperationStatus::Running) {
            op.start_time = clock_();
        }
        operations_.insert(operations_.begin(), std::move(op));

        if (!selected_id_ || (status == OperationStatus::Running && running_count_locked() == 1)) {
            selected_id_ = id;
        }

        logger_->info("Operation tracked: {} [{}] (id: {})", name, to_string(kind), log::short_id(id));
        return {};
    }

    void finish(const std::string& id, OperationStatus terminal, const std::optional<std::string>& error) {
        CompletionCallback callback;
        std::vector<OperationSummary> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Operation* op = find_locked(id, terminal == OperationStatus::Completed ? "mark completed" : "mark failed");
            if (op == nullptr) return;

            if (op->is_terminal()) {
                ignore_terminal_locked(*op, to_string(terminal));
                return;
            }

            const TimePoint now = clock_();
            op->status = terminal;
            op->end_time = now;
            op->current_phase.reset();

            if (terminal == OperationStatus::Failed) {
                op->error = error;
                append_locked(*op, TranscriptEntryType::Error, "Operation failed", error);
                logger_->error("Operation failed: {} - {}", op->name, error.value_or(""));
            } else {
                auto elapsed = op->duration(now);
                logger_->info("Operation completed: {} ({} ms)", op->name, elapsed ? elapsed->count() : 0);
            }

            finished_.push_back(OperationSummary{
                op->id, op->kind, op->name,
                terminal == OperationStatus::Completed,
                op->duration(now),
                op->error
            });

            if (running_count_locked() == 0 && on_all_completed_) {
                batch.swap(finished_);
                callback = on_all_completed_;
                logger_->info("All operations finished ({} in batch)", batch.size());
            } else if (running_count_locked() == 0) {
                finished_.clear();
            }
        }

        if (callback) {
            callback(batch);
        }
    }

    Operation* find_locked(const std::string& id, const char* action) {
        for (auto& op : operations_) {
            if (op.id == id) return &op;
        }
        ++diagnostics_.ignored_unknown_id;
        logger_->warn("Cannot {}: operation not found (id: {})", action, log::short_id(id));
        return nullptr;
    }

    void ignore_terminal_locked(const Operation& op, const char* action) {
        ++diagnostics_.ignored_terminal_transition;
        logger_->warn("Cannot {}: operation already {} (id: {})",
                      action, to_string(op.status), log::short_id(op.id));
    }

    void append_locked(Operation& op, TranscriptEntryType type, const std::string& content,
                       std::optional<std::string> details) {
        TranscriptEntry entry;
        entry.id = "entry_" + std::to_string(++entry_counter_);
        entry.timestamp = clock_();
        entry.type = type;
        entry.content = content;
        entry.details = std::move(details);
        op.transcript.push_back(std::move(entry));
    }

    bool contains_locked(const std::string& id) const {
        for (const auto& op : operations_) {
            if (op.id == id) return true;
        }
        return false;
    }

    size_t running_count_locked() const {
        return static_cast<size_t>(std::count_if(operations_.begin(), operations_.end(),
            [](const Operation& op) { return op.status == OperationStatus::Running; }));
    }

    std::shared_ptr<spdlog::logger> logger_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::vector<Operation> operations_;            // most recent first
    std::optional<std::string> selected_id_;
    std::vector<OperationSummary> finished_;       // since the last completion callback
    CompletionCallback on_all_completed_;
    TrackerDiagnostics diagnostics_;
    std::uint64_t entry_counter_ = 0;
};

} // namespace tracking
} // namespace quarry
