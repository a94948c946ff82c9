#include "quarry/tools/discovery_tools.hpp"
#include "quarry/tools/tool_result.hpp"

#include <exception>
#include <initializer_list>
#include <utility>

namespace quarry {
namespace tools {

namespace {

using nlohmann::json;

/// Wait for one context snapshot, mapping a provider failure to ContextUnavailable.
template<typename T>
Expected<T> await_snapshot(std::future<T>& future, const char* snapshot) {
    try {
        return future.get();
    } catch (const std::exception& e) {
        return tl::unexpected(Error{
            ErrorCode::ContextUnavailable,
            std::string("Context unavailable: ") + snapshot,
            e.what()
        });
    }
}

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

// Instruction lines are joined with '\n' and carry no trailing newline.
std::string lines(std::initializer_list<std::string> parts) {
    return join(std::vector<std::string>(parts), "\n");
}

const char* boolean(bool value) {
    return value ? "true" : "false";
}

// Shortest round-trip form that keeps a fractional part ("20.0", "7.5").
std::string decimal(double value) {
    return json(value).dump();
}

} // namespace

DiscoveryTools::DiscoveryTools(std::shared_ptr<IContextProvider> provider)
    : provider_(std::move(provider)) {}

// ============================================================================
// Daily planning
// ============================================================================

Expected<json> DiscoveryTools::generate_daily_tasks(const ToolArguments& args) const {
    const auto focus_area = args.string_or("focus_area", "balanced");
    const auto max_tasks = args.int_or("max_tasks", 8);

    auto context_future = provider_->daily_task_context();
    auto context = await_snapshot(context_future, "daily task context");
    if (!context) return tl::unexpected(context.error());

    json payload;
    payload["focus_area"] = focus_area;
    payload["max_tasks"] = max_tasks;
    payload["context"] = std::move(*context);

    return ToolResult::context_provided(std::move(payload), lines({
        "Based on the context provided, generate " + std::to_string(max_tasks) + " prioritized daily tasks.",
        "Focus area: " + focus_area + ".",
        "Return tasks as a JSON array with: task_type, title, description, priority (0-2), estimated_minutes.",
        "Task types: gather, customize, apply, follow_up, networking, event_prep, debrief."
    })).body();
}

// ============================================================================
// Discovery
// ============================================================================

Expected<json> DiscoveryTools::discover_job_sources(const ToolArguments& args) const {
    const auto sectors = args.string_list("sectors");
    const auto location = args.string_or("location", "");
    const auto include_remote = args.bool_or("include_remote", true);
    const auto count = args.int_or("count", 10);

    auto preferences_future = provider_->preferences_context();
    auto sources_future = provider_->existing_source_urls();

    auto preferences = await_snapshot(preferences_future, "preferences");
    if (!preferences) return tl::unexpected(preferences.error());
    auto existing_sources = await_snapshot(sources_future, "existing source URLs");
    if (!existing_sources) return tl::unexpected(existing_sources.error());

    json payload;
    payload["sectors"] = sectors;
    payload["location"] = location;
    payload["include_remote"] = include_remote;
    payload["requested_count"] = count;
    payload["existing_source_urls"] = std::move(*existing_sources);
    payload["preferences"] = std::move(*preferences);

    return ToolResult::context_provided(std::move(payload), lines({
        "Discover " + std::to_string(count) + " new job sources for sectors: " + join(sectors, ", ") + " in " + location + ".",
        "Exclude URLs already in existing_source_urls.",
        std::string("Include remote-friendly: ") + boolean(include_remote) + ".",
        "Return sources as JSON array with: name, url, category, relevance_reason, recommended_cadence_days.",
        "Categories: local, industry, company_direct, aggregator, startup, staffing, networking."
    })).body();
}

Expected<json> DiscoveryTools::discover_networking_events(const ToolArguments& args) const {
    const auto sectors = args.string_list("sectors");
    const auto location = args.string_or("location", "");
    const auto days_ahead = args.int_or("days_ahead", 14);
    const auto include_virtual = args.bool_or("include_virtual", true);

    auto preferences_future = provider_->preferences_context();
    auto event_urls_future = provider_->existing_event_urls();

    auto preferences = await_snapshot(preferences_future, "preferences");
    if (!preferences) return tl::unexpected(preferences.error());
    auto existing_event_urls = await_snapshot(event_urls_future, "existing event URLs");
    if (!existing_event_urls) return tl::unexpected(existing_event_urls.error());

    json payload;
    payload["sectors"] = sectors;
    payload["location"] = location;
    payload["days_ahead"] = days_ahead;
    payload["include_virtual"] = include_virtual;
    payload["existing_event_urls"] = std::move(*existing_event_urls);
    payload["preferences"] = std::move(*preferences);

    return ToolResult::context_provided(std::move(payload), lines({
        "Search for networking events in the next " + std::to_string(days_ahead) + " days.",
        "Sectors: " + join(sectors, ", ") + ". Location: " + location + ".",
        std::string("Include virtual: ") + boolean(include_virtual) + ".",
        "Exclude URLs in existing_event_urls.",
        "Return events as JSON array with: name, date (ISO8601), time, location, url, event_type, organizer, estimated_attendance, cost, relevance_reason.",
        "Event types: meetup, happy_hour, conference, workshop, tech_talk, open_house, career_fair, panel_discussion, hackathon, virtual_event."
    })).body();
}

// ============================================================================
// Events
// ============================================================================

Expected<json> DiscoveryTools::evaluate_networking_event(const ToolArguments& args) const {
    const auto event_id = args.string_or("event_id", "");

    auto event_future = provider_->event_context(event_id);
    auto feedback_future = provider_->event_feedback_summary();
    auto preferences_future = provider_->preferences_context();

    auto event = await_snapshot(event_future, "event");
    if (!event) return tl::unexpected(event.error());
    auto feedback = await_snapshot(feedback_future, "event feedback summary");
    if (!feedback) return tl::unexpected(feedback.error());
    auto preferences = await_snapshot(preferences_future, "preferences");
    if (!preferences) return tl::unexpected(preferences.error());

    json payload;
    payload["event_id"] = event_id;
    payload["event"] = std::move(*event);
    payload["historical_feedback"] = std::move(*feedback);
    payload["preferences"] = std::move(*preferences);

    return ToolResult::context_provided(std::move(payload), lines({
        "Evaluate this event for attendance value.",
        "Consider: relevance to target sectors, expected networking value, time investment, historical outcomes from similar events.",
        "Return JSON with: recommendation (strong_yes/yes/maybe/skip), rationale, expected_value, concerns (array), preparation_tips."
    })).body();
}

Expected<json> DiscoveryTools::prepare_for_event(const ToolArguments& args) const {
    const auto event_id = args.string_or("event_id", "");
    const auto focus_companies = args.string_list("focus_companies");
    const auto personal_goals = args.string_or("personal_goals", "Make meaningful connections");

    auto event_future = provider_->event_context(event_id);
    auto preferences_future = provider_->preferences_context();
    auto contacts_future = provider_->contacts_at_companies(focus_companies);

    auto event = await_snapshot(event_future, "event");
    if (!event) return tl::unexpected(event.error());
    auto preferences = await_snapshot(preferences_future, "preferences");
    if (!preferences) return tl::unexpected(preferences.error());
    auto contacts = await_snapshot(contacts_future, "contacts at companies");
    if (!contacts) return tl::unexpected(contacts.error());

    json payload;
    payload["event_id"] = event_id;
    payload["event"] = std::move(*event);
    payload["focus_companies"] = focus_companies;
    payload["personal_goals"] = personal_goals;
    payload["existing_contacts"] = std::move(*contacts);
    payload["preferences"] = std::move(*preferences);

    return ToolResult::context_provided(std::move(payload), lines({
        "Generate event preparation materials.",
        "Return JSON with:",
        "- goal: One sentence goal for this event",
        "- pitch_script: 30-second elevator pitch",
        "- talking_points: Array of {topic, relevance, your_angle}",
        "- target_companies: Array of {company, why_relevant, recent_news, open_roles, possible_openers}",
        "- conversation_starters: Array of conversation starters",
        "- things_to_avoid: Array of topics/behaviors to avoid"
    })).body();
}

Expected<json> DiscoveryTools::debrief_event(const ToolArguments& args) const {
    const auto event_id = args.string_or("event_id", "");
    auto contacts_made = args.object_list("contacts_made");
    const auto rating = args.int_or("rating", 3);
    const auto would_recommend = args.bool_or("would_recommend", false);

    auto event_future = provider_->event_context(event_id);
    auto event = await_snapshot(event_future, "event");
    if (!event) return tl::unexpected(event.error());

    json payload;
    payload["event_id"] = event_id;
    payload["event"] = std::move(*event);
    payload["contacts_made"] = std::move(contacts_made);
    payload["rating"] = rating;
    payload["would_recommend"] = would_recommend;
    payload["what_worked"] = args.string_or("what_worked", "");
    payload["what_didnt_work"] = args.string_or("what_didnt_work", "");
    payload["notes"] = args.string_or("notes", "");

    return ToolResult::context_provided(std::move(payload), lines({
        "Process this event debrief and generate follow-up actions.",
        "Return JSON with:",
        "- summary: Brief summary of the event outcome",
        "- follow_up_actions: Array of {contact_name, action, deadline (within_24_hours/within_3_days/this_week/next_week), priority (high/medium/low)}",
        "- lessons_learned: What to remember for future similar events",
        "- event_feedback: Structured feedback for learning system"
    })).body();
}

// ============================================================================
// Networking
// ============================================================================

Expected<json> DiscoveryTools::suggest_networking_actions(const ToolArguments& args) const {
    const auto focus = args.string_or("focus", "balanced");
    const auto max_suggestions = args.int_or("max_suggestions", 5);

    auto attention_future = provider_->contacts_needing_attention();
    auto hot_future = provider_->hot_contacts();
    auto follow_ups_future = provider_->pending_follow_ups();
    auto events_future = provider_->upcoming_events_context();

    auto attention = await_snapshot(attention_future, "contacts needing attention");
    if (!attention) return tl::unexpected(attention.error());
    auto hot = await_snapshot(hot_future, "hot contacts");
    if (!hot) return tl::unexpected(hot.error());
    auto follow_ups = await_snapshot(follow_ups_future, "pending follow-ups");
    if (!follow_ups) return tl::unexpected(follow_ups.error());
    auto events = await_snapshot(events_future, "upcoming events");
    if (!events) return tl::unexpected(events.error());

    json payload;
    payload["focus"] = focus;
    payload["max_suggestions"] = max_suggestions;
    payload["contacts_needing_attention"] = std::move(*attention);
    payload["hot_contacts"] = std::move(*hot);
    payload["pending_follow_ups"] = std::move(*follow_ups);
    payload["upcoming_events"] = std::move(*events);

    return ToolResult::context_provided(std::move(payload), lines({
        "Suggest " + std::to_string(max_suggestions) + " networking actions. Focus: " + focus + ".",
        "Return JSON array with: contact_name, contact_id, action_type (reach_out/follow_up/reconnect/invite_to_event), action_description, urgency (high/medium/low), suggested_message_opener."
    })).body();
}

Expected<json> DiscoveryTools::draft_outreach_message(const ToolArguments& args) const {
    const auto contact_id = args.string_or("contact_id", "");
    const auto purpose = args.string_or("purpose", "");
    const auto channel = args.string_or("channel", "");
    const auto context = args.string_or("context", "");
    const auto tone = args.string_or("tone", "professional");

    auto contact_future = provider_->contact_context(contact_id);
    auto history_future = provider_->contact_interaction_history(contact_id);
    auto profile_future = provider_->user_profile_context();

    auto contact = await_snapshot(contact_future, "contact");
    if (!contact) return tl::unexpected(contact.error());
    auto history = await_snapshot(history_future, "contact interaction history");
    if (!history) return tl::unexpected(history.error());
    auto profile = await_snapshot(profile_future, "user profile");
    if (!profile) return tl::unexpected(profile.error());

    json payload;
    payload["contact_id"] = contact_id;
    payload["contact"] = std::move(*contact);
    payload["interaction_history"] = std::move(*history);
    payload["user_profile"] = std::move(*profile);
    payload["purpose"] = purpose;
    payload["channel"] = channel;
    payload["additional_context"] = context;
    payload["tone"] = tone;

    return ToolResult::context_provided(std::move(payload), lines({
        "Draft an outreach message for " + channel + ".",
        "Purpose: " + purpose + ". Tone: " + tone + ".",
        "Return JSON with:",
        "- subject: Subject line (for email)",
        "- message: The draft message",
        "- notes: Tips for sending/timing"
    })).body();
}

// ============================================================================
// Weekly review
// ============================================================================

Expected<json> DiscoveryTools::recommend_weekly_goals(const ToolArguments& args) const {
    const auto available_hours = args.double_or("available_hours", 20.0);
    const auto priority = args.string_or("priority", "balanced");

    auto performance_future = provider_->weekly_performance_history();
    auto pipeline_future = provider_->pipeline_status();
    auto events_future = provider_->upcoming_events_context();

    auto performance = await_snapshot(performance_future, "weekly performance history");
    if (!performance) return tl::unexpected(performance.error());
    auto pipeline = await_snapshot(pipeline_future, "pipeline status");
    if (!pipeline) return tl::unexpected(pipeline.error());
    auto events = await_snapshot(events_future, "upcoming events");
    if (!events) return tl::unexpected(events.error());

    json payload;
    payload["available_hours"] = available_hours;
    payload["priority"] = priority;
    payload["historical_performance"] = std::move(*performance);
    payload["pipeline_status"] = std::move(*pipeline);
    payload["upcoming_events"] = std::move(*events);

    return ToolResult::context_provided(std::move(payload), lines({
        "Recommend weekly goals. Available hours: " + decimal(available_hours) + ". Priority: " + priority + ".",
        "Return JSON with:",
        "- application_target: Number of applications to submit",
        "- events_target: Number of events to attend",
        "- new_contacts_target: Number of new contacts to make",
        "- follow_ups_target: Number of follow-ups to send",
        "- time_target_hours: Hours to dedicate",
        "- rationale: Why these targets make sense",
        "- focus_areas: Array of specific focus areas for the week"
    })).body();
}

Expected<json> DiscoveryTools::generate_weekly_reflection(const ToolArguments& args) const {
    const auto include_metrics = args.bool_or("include_metrics", true);
    const auto focus = args.string_or("focus", "balanced");

    auto summary_future = provider_->weekly_summary_context();
    auto progress_future = provider_->goal_progress_context();

    auto summary = await_snapshot(summary_future, "weekly summary");
    if (!summary) return tl::unexpected(summary.error());
    auto progress = await_snapshot(progress_future, "goal progress");
    if (!progress) return tl::unexpected(progress.error());

    json payload;
    payload["include_metrics"] = include_metrics;
    payload["focus"] = focus;
    payload["weekly_summary"] = std::move(*summary);
    payload["goal_progress"] = std::move(*progress);

    return ToolResult::context_provided(std::move(payload), lines({
        "Generate a weekly reflection. Focus: " + focus + ". Include metrics: " + boolean(include_metrics) + ".",
        "Return JSON with:",
        "- reflection: 2-3 paragraph reflection text",
        "- achievements: Array of notable achievements",
        "- improvements: Array of areas to improve",
        "- next_week_focus: Key focus for next week",
        "- encouragement: Personalized encouragement message"
    })).body();
}

// ============================================================================
// Registration
// ============================================================================

ToolHandler DiscoveryTools::handler_for(const std::string& tool_name) const {
    using Method = Expected<json> (DiscoveryTools::*)(const ToolArguments&) const;
    static const std::vector<std::pair<const char*, Method>> methods = {
        {"generate_daily_tasks", &DiscoveryTools::generate_daily_tasks},
        {"discover_job_sources", &DiscoveryTools::discover_job_sources},
        {"discover_networking_events", &DiscoveryTools::discover_networking_events},
        {"evaluate_networking_event", &DiscoveryTools::evaluate_networking_event},
        {"prepare_for_event", &DiscoveryTools::prepare_for_event},
        {"debrief_event", &DiscoveryTools::debrief_event},
        {"suggest_networking_actions", &DiscoveryTools::suggest_networking_actions},
        {"draft_outreach_message", &DiscoveryTools::draft_outreach_message},
        {"recommend_weekly_goals", &DiscoveryTools::recommend_weekly_goals},
        {"generate_weekly_reflection", &DiscoveryTools::generate_weekly_reflection},
    };

    for (const auto& [name, method] : methods) {
        if (tool_name == name) {
            DiscoveryTools tools = *this;
            Method bound = method;
            return [tools, bound](const json& args) -> Expected<json> {
                return (tools.*bound)(ToolArguments(args));
            };
        }
    }
    return {};
}

Expected<void> register_discovery_tools(
    ToolRegistry& registry,
    std::shared_ptr<IContextProvider> provider,
    const std::optional<std::filesystem::path>& schema_directory) {
    if (!provider) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Context provider is required"});
    }

    DiscoveryTools tools(std::move(provider));
    for (auto& descriptor : build_discovery_descriptors(schema_directory)) {
        auto handler = tools.handler_for(descriptor.name);
        auto registered = registry.register_tool(std::move(descriptor), std::move(handler));
        if (!registered) {
            return registered;
        }
    }
    return {};
}

} // namespace tools
} // namespace quarry
