#include <gtest/gtest.h>
#include "quarry/tracking/operation_tracker.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace quarry;
using namespace quarry::tracking;
using namespace std::chrono_literals;

class OperationTrackerTest : public ::testing::Test {
protected:
    void advance(std::chrono::milliseconds step) {
        current += step;
    }

    TimePoint current = TimePoint{} + std::chrono::hours(24 * 365 * 50);
    OperationTracker tracker{log::make_logger("tracker-test", spdlog::level::off), [this] { return current; }};
};

// ============================================================================
// OT-001: Tracking and lifecycle
// ============================================================================

TEST_F(OperationTrackerTest, TrackStartsRunning) {
    ASSERT_TRUE(tracker.track_operation("op-1", OperationKind::SourceDiscovery, "Discover sources"));

    auto op = tracker.get("op-1");
    ASSERT_TRUE(op.has_value());
    EXPECT_EQ(op->status, OperationStatus::Running);
    EXPECT_EQ(op->kind, OperationKind::SourceDiscovery);
    EXPECT_EQ(op->name, "Discover sources");
    EXPECT_EQ(op->start_time, std::optional<TimePoint>(current));
    EXPECT_FALSE(op->end_time.has_value());
    EXPECT_TRUE(op->transcript.empty());
    EXPECT_EQ(tracker.running_count(), 1u);
    EXPECT_TRUE(tracker.is_any_running());
}

TEST_F(OperationTrackerTest, DuplicateIdRejected) {
    ASSERT_TRUE(tracker.track_operation("op-1", OperationKind::Networking, "First"));
    auto again = tracker.track_operation("op-1", OperationKind::Networking, "Second");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::DuplicateOperation);
    EXPECT_EQ(tracker.size(), 1u);
    EXPECT_EQ(tracker.get("op-1")->name, "First");
}

TEST_F(OperationTrackerTest, PendingThenRunning) {
    ASSERT_TRUE(tracker.track_pending("op-1", OperationKind::WeeklyReview, "Weekly review"));
    EXPECT_EQ(tracker.get("op-1")->status, OperationStatus::Pending);
    EXPECT_FALSE(tracker.duration("op-1").has_value());
    EXPECT_EQ(tracker.running_count(), 0u);

    advance(100ms);
    tracker.mark_running("op-1");
    auto op = tracker.get("op-1");
    EXPECT_EQ(op->status, OperationStatus::Running);
    EXPECT_EQ(op->start_time, std::optional<TimePoint>(current));
}

TEST_F(OperationTrackerTest, CompletionSetsEndTimeAndDuration) {
    ASSERT_TRUE(tracker.track_operation("op-1", OperationKind::DailyPlanning, "Plan day"));
    tracker.update_phase("op-1", "Gathering context");
    advance(250ms);
    EXPECT_EQ(tracker.duration("op-1"), std::optional<std::chrono::milliseconds>(250ms));

    advance(250ms);
    tracker.mark_completed("op-1");
    advance(1000ms);

    auto op = tracker.get("op-1");
    EXPECT_EQ(op->status, OperationStatus::Completed);
    EXPECT_TRUE(op->end_time.has_value());
    EXPECT_FALSE(op->current_phase.has_value());
    EXPECT_FALSE(op->error.has_value());
    EXPECT_EQ(tracker.duration("op-1"), std::optional<std::chrono::milliseconds>(500ms));
    EXPECT_EQ(tracker.running_count(), 0u);
}

TEST_F(OperationTrackerTest, PendingCanTerminateDirectly) {
    ASSERT_TRUE(tracker.track_pending("op-1", OperationKind::SkillMerge, "Merge skills"));
    tracker.mark_failed("op-1", "Cancelled");
    auto op = tracker.get("op-1");
    EXPECT_EQ(op->status, OperationStatus::Failed);
    EXPECT_FALSE(op->duration(current).has_value());
}

// ============================================================================
// OT-002: Failure and terminal states
// ============================================================================

TEST_F(OperationTrackerTest, FailureRecordsErrorEntryOnce) {
    ASSERT_TRUE(tracker.track_operation("op-1", OperationKind::SkillReorder, "Reorder skills"));
    tracker.mark_failed("op-1", "Model returned invalid JSON");
    tracker.mark_failed("op-1", "Second failure");
    tracker.mark_completed("op-1");

    auto op = tracker.get("op-1");
    EXPECT_EQ(op->status, OperationStatus::Failed);
    EXPECT_EQ(op->error, std::optional<std::string>("Model returned invalid JSON"));
    ASSERT_EQ(op->transcript.size(), 1u);
    EXPECT_EQ(op->transcript[0].type, TranscriptEntryType::Error);
    EXPECT_EQ(op->transcript[0].content, "Operation failed");
    EXPECT_EQ(op->transcript[0].details, std::optional<std::string>("Model returned invalid JSON"));

    EXPECT_EQ(tracker.diagnostics().ignored_terminal_transition, 2u);
}

TEST_F(OperationTrackerTest, CompletedCannotRestart) {
    ASSERT_TRUE(tracker.track_operation("op-1", OperationKind::Networking, "Network"));
    tracker.mark_completed("op-1");
    tracker.mark_running("op-1");
    EXPECT_EQ(tracker.get("op-1")->status, OperationStatus::Completed);
    EXPECT_EQ(tracker.diagnostics().ignored_terminal_transition, 1u);
}

TEST_F(OperationTrackerTest, PhaseUpdateAfterTerminalIgnored) {
    ASSERT_TRUE(tracker.track_operation("op-1", OperationKind::EventDiscovery, "Find events"));
    tracker.mark_completed("op-1");
    tracker.update_phase("op-1", "Too late");

    auto op = tracker.get("op-1");
    EXPECT_FALSE(op->current_phase.has_value());
    EXPECT_TRUE(op->transcript.empty());
    EXPECT_EQ(tracker.diagnostics().ignored_phase_update, 1u);
}

TEST_F(OperationTrackerTest, UnknownIdsAreCounted) {
    tracker.mark_running("ghost");
    tracker.mark_completed("ghost");
    tracker.mark_failed("ghost", "x");
    tracker.update_phase("ghost", "x");
    tracker.append_transcript("ghost", TranscriptEntryType::System, "x");
    tracker.add_token_usage("ghost", 1, 1);

    EXPECT_EQ(tracker.diagnostics().ignored_unknown_id, 6u);
    EXPECT_EQ(tracker.size(), 0u);
    EXPECT_FALSE(tracker.get("ghost").has_value());
    EXPECT_FALSE(tracker.duration("ghost").has_value());
}

// ============================================================================
// OT-003: Transcript and tokens
// ============================================================================

TEST_F(OperationTrackerTest, TranscriptKeepsInsertionOrder) {
    ASSERT_TRUE(tracker.track_operation("op-1", OperationKind::JobRecommendation, "Recommend job"));
    tracker.append_transcript("op-1", TranscriptEntryType::System, "You are a career coach");
    tracker.update_phase("op-1", "Asking model");
    tracker.append_transcript("op-1", TranscriptEntryType::ModelRequest, "Which job?", std::string("model: a"));
    tracker.append_transcript("op-1", TranscriptEntryType::ModelResponse, "{\"recommendedJobId\": \"x\"}");

    auto op = tracker.get("op-1");
    ASSERT_EQ(op->transcript.size(), 4u);
    EXPECT_EQ(op->transcript[0].type, TranscriptEntryType::System);
    EXPECT_EQ(op->transcript[1].type, TranscriptEntryType::Phase);
    EXPECT_EQ(op->transcript[1].content, "Asking model");
    EXPECT_EQ(op->transcript[2].details, std::optional<std::string>("model: a"));
    EXPECT_EQ(op->transcript[3].type, TranscriptEntryType::ModelResponse);
    EXPECT_EQ(op->current_phase, std::optional<std::string>("Asking model"));

    std::vector<std::string> ids;
    for (const auto& entry : op->transcript) ids.push_back(entry.id);
    EXPECT_EQ(ids, (std::vector<std::string>{"entry_1", "entry_2", "entry_3", "entry_4"}));
}

TEST_F(OperationTrackerTest, TokenUsageAccumulates) {
    ASSERT_TRUE(tracker.track_operation("op-1", OperationKind::CoverLetterSelection, "Pick letter"));
    tracker.add_token_usage("op-1", 10, 5);
    tracker.add_token_usage("op-1", 3, 2, 4);

    auto op = tracker.get("op-1");
    EXPECT_EQ(op->input_tokens, 13);
    EXPECT_EQ(op->output_tokens, 7);
    EXPECT_EQ(op->cached_tokens, 4);
    EXPECT_EQ(op->total_tokens(), 20);
}

TEST_F(OperationTrackerTest, NegativeTokensClampedAndLateUsageAccepted) {
    ASSERT_TRUE(tracker.track_operation("op-1", OperationKind::SkillMerge, "Merge"));
    tracker.add_token_usage("op-1", -5, 3);
    tracker.mark_completed("op-1");
    tracker.add_token_usage("op-1", 2, 0);

    auto op = tracker.get("op-1");
    EXPECT_EQ(op->input_tokens, 2);
    EXPECT_EQ(op->output_tokens, 3);
}

TEST_F(OperationTrackerTest, ConcurrentTokenUpdates) {
    ASSERT_TRUE(tracker.track_operation("op-1", OperationKind::Networking, "Network"));
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 100; ++i) {
                tracker.add_token_usage("op-1", 1, 2);
            }
        });
    }
    for (auto& thread : threads) thread.join();

    auto op = tracker.get("op-1");
    EXPECT_EQ(op->input_tokens, 800);
    EXPECT_EQ(op->output_tokens, 1600);
}

// ============================================================================
// OT-004: Ordering and selection
// ============================================================================

TEST_F(OperationTrackerTest, MostRecentFirst) {
    ASSERT_TRUE(tracker.track_operation("a", OperationKind::Networking, "A"));
    ASSERT_TRUE(tracker.track_operation("b", OperationKind::Networking, "B"));
    ASSERT_TRUE(tracker.track_pending("c", OperationKind::Networking, "C"));

    auto all = tracker.snapshot();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "c");
    EXPECT_EQ(all[1].id, "b");
    EXPECT_EQ(all[2].id, "a");
}

TEST_F(OperationTrackerTest, FirstOperationIsSelected) {
    ASSERT_TRUE(tracker.track_operation("a", OperationKind::Networking, "A"));
    ASSERT_TRUE(tracker.track_operation("b", OperationKind::Networking, "B"));
    EXPECT_EQ(tracker.selected_id(), std::optional<std::string>("a"));
}

TEST_F(OperationTrackerTest, OnlyRunningOperationTakesSelection) {
    ASSERT_TRUE(tracker.track_pending("queued", OperationKind::WeeklyReview, "Queued"));
    EXPECT_EQ(tracker.selected_id(), std::optional<std::string>("queued"));

    ASSERT_TRUE(tracker.track_operation("live", OperationKind::WeeklyReview, "Live"));
    EXPECT_EQ(tracker.selected_id(), std::optional<std::string>("live"));
}

TEST_F(OperationTrackerTest, ExplicitSelection) {
    ASSERT_TRUE(tracker.track_operation("a", OperationKind::Networking, "A"));
    ASSERT_TRUE(tracker.track_operation("b", OperationKind::Networking, "B"));
    EXPECT_TRUE(tracker.select("b"));
    EXPECT_EQ(tracker.selected_id(), std::optional<std::string>("b"));
    EXPECT_FALSE(tracker.select("missing"));
    EXPECT_EQ(tracker.selected_id(), std::optional<std::string>("b"));
}

TEST_F(OperationTrackerTest, ClearCompletedRepairsSelection) {
    ASSERT_TRUE(tracker.track_operation("a", OperationKind::Networking, "A"));
    ASSERT_TRUE(tracker.track_operation("b", OperationKind::Networking, "B"));
    tracker.mark_completed("a");
    ASSERT_TRUE(tracker.select("a"));

    EXPECT_EQ(tracker.clear_completed(), 1u);
    EXPECT_EQ(tracker.size(), 1u);
    EXPECT_EQ(tracker.selected_id(), std::optional<std::string>("b"));
}

TEST_F(OperationTrackerTest, ClearCompletedKeepsLiveSelection) {
    ASSERT_TRUE(tracker.track_operation("a", OperationKind::Networking, "A"));
    ASSERT_TRUE(tracker.track_operation("b", OperationKind::Networking, "B"));
    tracker.mark_failed("b", "boom");

    EXPECT_EQ(tracker.clear_completed(), 1u);
    EXPECT_EQ(tracker.selected_id(), std::optional<std::string>("a"));
}

TEST_F(OperationTrackerTest, ClearEverythingClearsSelection) {
    ASSERT_TRUE(tracker.track_operation("a", OperationKind::Networking, "A"));
    tracker.mark_completed("a");
    EXPECT_EQ(tracker.clear_completed(), 1u);
    EXPECT_FALSE(tracker.selected_id().has_value());
    EXPECT_EQ(tracker.clear_completed(), 0u);
}

// ============================================================================
// OT-005: Completion callback
// ============================================================================

TEST_F(OperationTrackerTest, CallbackFiresWhenLastRunningFinishes) {
    std::vector<std::vector<OperationSummary>> batches;
    tracker.set_completion_callback([&batches](const std::vector<OperationSummary>& batch) {
        batches.push_back(batch);
    });

    ASSERT_TRUE(tracker.track_operation("a", OperationKind::SourceDiscovery, "A"));
    ASSERT_TRUE(tracker.track_operation("b", OperationKind::EventDiscovery, "B"));
    advance(40ms);
    tracker.mark_completed("a");
    EXPECT_TRUE(batches.empty());

    tracker.mark_failed("b", "timeout");
    ASSERT_EQ(batches.size(), 1u);
    ASSERT_EQ(batches[0].size(), 2u);
    EXPECT_EQ(batches[0][0].id, "a");
    EXPECT_TRUE(batches[0][0].succeeded);
    EXPECT_EQ(batches[0][0].duration, std::optional<std::chrono::milliseconds>(40ms));
    EXPECT_EQ(batches[0][1].id, "b");
    EXPECT_FALSE(batches[0][1].succeeded);
    EXPECT_EQ(batches[0][1].error, std::optional<std::string>("timeout"));
}

TEST_F(OperationTrackerTest, CallbackMayReenterTracker) {
    size_t cleared = 0;
    tracker.set_completion_callback([this, &cleared](const std::vector<OperationSummary>&) {
        cleared = tracker.clear_completed();
    });

    ASSERT_TRUE(tracker.track_operation("a", OperationKind::Networking, "A"));
    tracker.mark_completed("a");
    EXPECT_EQ(cleared, 1u);
    EXPECT_EQ(tracker.size(), 0u);
}

TEST_F(OperationTrackerTest, BatchStartsAfterPreviousQuietPeriod) {
    ASSERT_TRUE(tracker.track_operation("early", OperationKind::Networking, "Early"));
    tracker.mark_completed("early");

    std::vector<OperationSummary> last;
    tracker.set_completion_callback([&last](const std::vector<OperationSummary>& batch) {
        last = batch;
    });

    ASSERT_TRUE(tracker.track_operation("late", OperationKind::Networking, "Late"));
    tracker.mark_completed("late");
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0].id, "late");
}

// ============================================================================
// OT-006: Serialization
// ============================================================================

TEST_F(OperationTrackerTest, OperationToJson) {
    ASSERT_TRUE(tracker.track_operation("op-1", OperationKind::SkillReorder, "Reorder"));
    tracker.add_token_usage("op-1", 13, 7);
    advance(1500ms);
    tracker.mark_failed("op-1", "bad reply");

    auto j = tracker.get("op-1")->to_json(tracker.now());
    EXPECT_EQ(j["kind"], "skill_reorder");
    EXPECT_EQ(j["status"], "failed");
    EXPECT_EQ(j["duration_ms"], 1500);
    EXPECT_EQ(j["input_tokens"], 13);
    EXPECT_EQ(j["error"], "bad reply");
    ASSERT_EQ(j["transcript"].size(), 1u);
    EXPECT_EQ(j["transcript"][0]["type"], "error");
    EXPECT_EQ(j["transcript"][0]["details"], "bad reply");
}

TEST(OperationEnumsTest, Names) {
    EXPECT_STREQ(to_string(OperationKind::ToolInvocation), "tool_invocation");
    EXPECT_STREQ(to_string(OperationKind::CoverLetterSelection), "cover_letter_selection");
    EXPECT_STREQ(to_string(OperationStatus::Running), "running");
    EXPECT_STREQ(to_string(TranscriptEntryType::ToolResult), "tool_result");
    EXPECT_TRUE(is_terminal(OperationStatus::Completed));
    EXPECT_TRUE(is_terminal(OperationStatus::Failed));
    EXPECT_FALSE(is_terminal(OperationStatus::Pending));
}
