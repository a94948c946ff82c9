#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {
namespace tracking {

using TimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Enumerations
// ============================================================================

/** @brief Kind of long-running AI operation. */
enum class OperationKind {
    ToolInvocation,
    DailyPlanning,
    SourceDiscovery,
    EventDiscovery,
    Networking,
    WeeklyReview,
    SkillReorder,
    SkillMerge,
    JobRecommendation,
    CoverLetterSelection
};

inline const char* to_string(OperationKind kind) {
    switch (kind) {
        case OperationKind::ToolInvocation: return "tool_invocation";
        case OperationKind::DailyPlanning: return "daily_planning";
        case OperationKind::SourceDiscovery: return "source_discovery";
        case OperationKind::EventDiscovery: return "event_discovery";
        case OperationKind::Networking: return "networking";
        case OperationKind::WeeklyReview: return "weekly_review";
        case OperationKind::SkillReorder: return "skill_reorder";
        case OperationKind::SkillMerge: return "skill_merge";
        case OperationKind::JobRecommendation: return "job_recommendation";
        case OperationKind::CoverLetterSelection: return "cover_letter_selection";
    }
    return "tool_invocation";
}

/**
 * @brief Lifecycle state
 *
 * pending -> running -> {completed, failed}. Completed and Failed are
 * terminal.
 */
enum class OperationStatus {
    Pending,
    Running,
    Completed,
    Failed
};

inline const char* to_string(OperationStatus status) {
    switch (status) {
        case OperationStatus::Pending: return "pending";
        case OperationStatus::Running: return "running";
        case OperationStatus::Completed: return "completed";
        case OperationStatus::Failed: return "failed";
    }
    return "pending";
}

[[nodiscard]] inline bool is_terminal(OperationStatus status) {
    return status == OperationStatus::Completed || status == OperationStatus::Failed;
}

/** @brief Type of a transcript entry. */
enum class TranscriptEntryType {
    System,
    ModelRequest,
    ModelResponse,
    Error,
    Phase,
    Tool,        ///< Tool call issued
    ToolResult   ///< Envelope returned by a tool
};

inline const char* to_string(TranscriptEntryType type) {
    switch (type) {
        case TranscriptEntryType::System: return "system";
        case TranscriptEntryType::ModelRequest: return "model_request";
        case TranscriptEntryType::ModelResponse: return "model_response";
        case TranscriptEntryType::Error: return "error";
        case TranscriptEntryType::Phase: return "phase";
        case TranscriptEntryType::Tool: return "tool";
        case TranscriptEntryType::ToolResult: return "tool_result";
    }
    return "system";
}

inline std::int64_t to_epoch_millis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

// ============================================================================
// TranscriptEntry
// ============================================================================

/**
 * @brief Immutable transcript record
 *
 * Insertion order is authoritative; the timestamp is informational.
 */
struct TranscriptEntry {
    std::string id;
    TimePoint timestamp;
    TranscriptEntryType type = TranscriptEntryType::System;
    std::string content;
    std::optional<std::string> details;

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"id", id},
            {"timestamp", to_epoch_millis(timestamp)},
            {"type", to_string(type)},
            {"content", content}
        };
        if (details) {
            j["details"] = *details;
        }
        return j;
    }
};

// ============================================================================
// Operation
// ============================================================================

/**
 * @brief Snapshot of a tracked operation
 *
 * Live instances are owned by OperationTracker; callers only ever see
 * copies.
 */
struct Operation {
    std::string id;                             ///< Caller-supplied correlation key
    OperationKind kind = OperationKind::ToolInvocation;
    std::string name;
    OperationStatus status = OperationStatus::Pending;
    std::optional<TimePoint> start_time;        ///< Set on entering Running
    std::optional<TimePoint> end_time;          ///< Set on entering a terminal state
    std::vector<TranscriptEntry> transcript;    ///< Append-only, insertion ordered
    std::optional<std::string> error;
    std::optional<std::string> current_phase;
    std::int64_t input_tokens = 0;
    std::int64_t output_tokens = 0;
    std::int64_t cached_tokens = 0;

    bool is_terminal() const { return tracking::is_terminal(status); }

    std::int64_t total_tokens() const { return input_tokens + output_tokens; }

    /**
     * @brief Elapsed time
     *
     * end - start once ended, now - start while running, nullopt when the
     * operation never started.
     */
    std::optional<std::chrono::milliseconds> duration(TimePoint now) const {
        if (!start_time) {
            return std::nullopt;
        }
        const TimePoint end = end_time.value_or(now);
        if (end < *start_time) {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(end - *start_time);
    }

    nlohmann::json to_json(TimePoint now) const {
        nlohmann::json j = {
            {"id", id},
            {"kind", to_string(kind)},
            {"name", name},
            {"status", to_string(status)},
            {"input_tokens", input_tokens},
            {"output_tokens", output_tokens},
            {"cached_tokens", cached_tokens},
            {"transcript", nlohmann::json::array()}
        };
        if (start_time) j["start_time"] = to_epoch_millis(*start_time);
        if (end_time) j["end_time"] = to_epoch_millis(*end_time);
        if (auto d = duration(now)) j["duration_ms"] = d->count();
        if (error) j["error"] = *error;
        if (current_phase) j["current_phase"] = *current_phase;
        for (const auto& entry : transcript) {
            j["transcript"].push_back(entry.to_json());
        }
        return j;
    }
};

/** @brief Outcome of one operation, delivered when a batch finishes. */
struct OperationSummary {
    std::string id;
    OperationKind kind = OperationKind::ToolInvocation;
    std::string name;
    bool succeeded = false;
    std::optional<std::chrono::milliseconds> duration;
    std::optional<std::string> error;
};

} // namespace tracking
} // namespace quarry
