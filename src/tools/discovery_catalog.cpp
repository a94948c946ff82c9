#include "quarry/tools/discovery_tools.hpp"
#include "quarry/schema/schema_loader.hpp"

namespace quarry {
namespace tools {

namespace {

// ============================================================================
// Built-in argument schemas
// ============================================================================

const char* const kGenerateDailyTasksSchema = R"json({
  "type": "object",
  "description": "Generate prioritized daily tasks for job search based on current state.\nConsiders due sources, upcoming events, contacts needing attention, and weekly goals.\nReturns 5-8 actionable tasks with priorities and time estimates.",
  "properties": {
    "focus_area": {
      "type": "string",
      "description": "Optional focus area: applications, networking, follow_ups, or balanced",
      "enum": ["applications", "networking", "follow_ups", "balanced"]
    },
    "max_tasks": {
      "type": "integer",
      "description": "Maximum number of tasks to generate (default: 8)"
    }
  },
  "required": [],
  "additionalProperties": false
})json";

const char* const kDiscoverJobSourcesSchema = R"json({
  "type": "object",
  "description": "Discover new job sources tailored to candidate's target sectors and location.\nSearches for job boards, company career pages, and industry-specific resources.\nReturns sources with URLs, categories, and relevance explanations.",
  "properties": {
    "sectors": {
      "type": "array",
      "description": "Target sectors to search for (e.g., robotics, aerospace)",
      "items": {"type": "string"}
    },
    "location": {
      "type": "string",
      "description": "Primary location (e.g., Austin, TX)"
    },
    "include_remote": {
      "type": "boolean",
      "description": "Include remote-friendly sources (default: true)"
    },
    "count": {
      "type": "integer",
      "description": "Number of sources to discover (default: 10)"
    }
  },
  "required": ["sectors", "location"],
  "additionalProperties": false
})json";

const char* const kDiscoverNetworkingEventsSchema = R"json({
  "type": "object",
  "description": "Search for upcoming networking events, meetups, conferences, and professional gatherings.\nConsiders candidate's target sectors and location preferences.\nReturns events with dates, locations, URLs, and relevance scores.",
  "properties": {
    "sectors": {
      "type": "array",
      "description": "Target sectors (e.g., robotics, aerospace)",
      "items": {"type": "string"}
    },
    "location": {
      "type": "string",
      "description": "Primary location (e.g., Austin, TX)"
    },
    "days_ahead": {
      "type": "integer",
      "description": "Days to look ahead (default: 14)"
    },
    "include_virtual": {
      "type": "boolean",
      "description": "Include virtual events (default: true)"
    }
  },
  "required": ["sectors", "location"],
  "additionalProperties": false
})json";

const char* const kEvaluateNetworkingEventSchema = R"json({
  "type": "object",
  "description": "Evaluate a networking event for attendance value.\nConsiders event type, expected attendees, relevance to target companies,\ntime investment, and historical data from similar events.\nReturns recommendation (strong_yes/yes/maybe/skip) with rationale.",
  "properties": {
    "event_id": {
      "type": "string",
      "description": "UUID of the event to evaluate"
    },
    "event_details": {
      "type": "object",
      "description": "Event details if not stored (name, date, location, type, organizer)"
    }
  },
  "required": ["event_id"],
  "additionalProperties": false
})json";

const char* const kPrepareForEventSchema = R"json({
  "type": "object",
  "description": "Generate preparation materials for an upcoming networking event.\nCreates: elevator pitch, talking points, target company context,\nconversation starters, and things to avoid.",
  "properties": {
    "event_id": {
      "type": "string",
      "description": "UUID of the event to prepare for"
    },
    "focus_companies": {
      "type": "array",
      "description": "Specific companies to research for this event",
      "items": {"type": "string"}
    },
    "personal_goals": {
      "type": "string",
      "description": "Personal goals for this event (e.g., make 3 contacts)"
    }
  },
  "required": ["event_id"],
  "additionalProperties": false
})json";

const char* const kDebriefEventSchema = R"json({
  "type": "object",
  "description": "Process post-event debrief information and generate follow-up actions.\nCaptures contacts made, event rating, what worked/didn't work.\nGenerates prioritized follow-up actions with deadlines.",
  "properties": {
    "event_id": {
      "type": "string",
      "description": "UUID of the event being debriefed"
    },
    "contacts_made": {
      "type": "array",
      "description": "Contacts made at the event",
      "items": {
        "type": "object",
        "properties": {
          "name": {"type": "string"},
          "company": {"type": "string"},
          "title": {"type": "string"},
          "email": {"type": "string"},
          "linkedin": {"type": "string"},
          "notes": {"type": "string"},
          "follow_up_action": {"type": "string"}
        },
        "required": ["name"]
      }
    },
    "rating": {
      "type": "integer",
      "description": "Event rating 1-5"
    },
    "would_recommend": {
      "type": "boolean",
      "description": "Would recommend this event to others"
    },
    "what_worked": {
      "type": "string",
      "description": "What worked well at this event"
    },
    "what_didnt_work": {
      "type": "string",
      "description": "What didn't work or could be improved"
    },
    "notes": {
      "type": "string",
      "description": "General notes about the event"
    }
  },
  "required": ["event_id", "rating"],
  "additionalProperties": false
})json";

const char* const kSuggestNetworkingActionsSchema = R"json({
  "type": "object",
  "description": "Suggest networking actions based on current contacts and relationship health.\nConsiders warmth decay, pending follow-ups, and upcoming events.\nReturns prioritized list of suggested actions.",
  "properties": {
    "focus": {
      "type": "string",
      "description": "Focus area: reactivate_dormant, maintain_hot, expand_network",
      "enum": ["reactivate_dormant", "maintain_hot", "expand_network", "balanced"]
    },
    "max_suggestions": {
      "type": "integer",
      "description": "Maximum suggestions to return (default: 5)"
    }
  },
  "required": [],
  "additionalProperties": false
})json";

const char* const kDraftOutreachMessageSchema = R"json({
  "type": "object",
  "description": "Draft an outreach message to a networking contact.\nConsiders relationship context, reason for outreach, and communication style.\nReturns draft message with subject line (if email).",
  "properties": {
    "contact_id": {
      "type": "string",
      "description": "UUID of the contact"
    },
    "purpose": {
      "type": "string",
      "description": "Purpose of outreach",
      "enum": ["follow_up", "reconnect", "ask_for_referral", "thank_you", "share_update", "request_meeting"]
    },
    "channel": {
      "type": "string",
      "description": "Communication channel",
      "enum": ["email", "linkedin", "text"]
    },
    "context": {
      "type": "string",
      "description": "Additional context for the message"
    },
    "tone": {
      "type": "string",
      "description": "Desired tone: professional, casual, warm",
      "enum": ["professional", "casual", "warm"]
    }
  },
  "required": ["contact_id", "purpose", "channel"],
  "additionalProperties": false
})json";

const char* const kRecommendWeeklyGoalsSchema = R"json({
  "type": "object",
  "description": "Recommend weekly goals based on job search progress and upcoming opportunities.\nConsiders past performance, pipeline status, and available time.\nReturns balanced goals for applications, networking, and time investment.",
  "properties": {
    "available_hours": {
      "type": "number",
      "description": "Hours available for job search this week"
    },
    "priority": {
      "type": "string",
      "description": "Current priority: volume, quality, networking, balanced",
      "enum": ["volume", "quality", "networking", "balanced"]
    }
  },
  "required": [],
  "additionalProperties": false
})json";

const char* const kGenerateWeeklyReflectionSchema = R"json({
  "type": "object",
  "description": "Generate a weekly reflection on job search progress.\nAnalyzes achievements, areas for improvement, and provides encouragement.\nReturns 2-3 paragraph reflection with actionable suggestions.",
  "properties": {
    "include_metrics": {
      "type": "boolean",
      "description": "Include specific metrics in reflection (default: true)"
    },
    "focus": {
      "type": "string",
      "description": "Reflection focus: achievements, improvements, planning",
      "enum": ["achievements", "improvements", "planning", "balanced"]
    }
  },
  "required": [],
  "additionalProperties": false
})json";

} // namespace

const std::vector<CatalogEntry>& discovery_catalog() {
    static const std::vector<CatalogEntry> catalog = {
        {"generate_daily_tasks", "Generate prioritized daily job search tasks", kGenerateDailyTasksSchema},
        {"discover_job_sources", "Discover job boards and sources matching target sectors", kDiscoverJobSourcesSchema},
        {"discover_networking_events", "Search for upcoming networking events matching target sectors", kDiscoverNetworkingEventsSchema},
        {"evaluate_networking_event", "Evaluate whether to attend a networking event", kEvaluateNetworkingEventSchema},
        {"prepare_for_event", "Generate preparation materials for a networking event", kPrepareForEventSchema},
        {"debrief_event", "Process event debrief and generate follow-up actions", kDebriefEventSchema},
        {"suggest_networking_actions", "Suggest networking actions to maintain relationships", kSuggestNetworkingActionsSchema},
        {"draft_outreach_message", "Draft an outreach message to a contact", kDraftOutreachMessageSchema},
        {"recommend_weekly_goals", "Recommend weekly goals for job search", kRecommendWeeklyGoalsSchema},
        {"generate_weekly_reflection", "Generate weekly reflection on job search progress", kGenerateWeeklyReflectionSchema},
    };
    return catalog;
}

std::vector<ToolDescriptor> build_discovery_descriptors(
    const std::optional<std::filesystem::path>& schema_directory) {
    std::vector<ToolDescriptor> descriptors;
    descriptors.reserve(discovery_catalog().size());

    for (const auto& entry : discovery_catalog()) {
        schema::SchemaNode argument_schema = schema_directory
            ? schema::SchemaLoader::require_file(*schema_directory / (std::string(entry.name) + ".json"))
            : schema::SchemaLoader::require_string(entry.schema_source, entry.name);

        if (argument_schema.kind != schema::SchemaKind::Object) {
            throw ConfigurationError(Error{
                ErrorCode::InvalidSchema,
                "Tool argument schema must be an object",
                entry.name
            });
        }
        descriptors.push_back(ToolDescriptor{entry.name, entry.description, std::move(argument_schema)});
    }
    return descriptors;
}

} // namespace tools
} // namespace quarry
