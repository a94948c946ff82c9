/**
 * @file demo_quarry.cpp
 * @brief Command-line driver for the job-search tool catalogue
 *
 * Runs tool invocations against a small in-memory job-search workspace and
 * prints the JSON envelope a model would receive.
 *
 * Usage:
 *   ./quarry_demo [options]
 *
 * Options:
 *   --config <file>    JSON configuration (schema_directory, dispatch_workers, ...)
 *   --schemas          Print the tool advertisement array and exit
 *   --tool <name>      Tool to invoke (default: generate_daily_tasks)
 *   --args <json>      Raw arguments for --tool (default: {})
 *   --request <json>   Wire request {"toolName": ..., "arguments": ...}
 *   --help             Show this help message
 */

#include <quarry/quarry.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using nlohmann::json;
using quarry::tools::make_ready_future;

/**
 * @brief Fixed workspace snapshot served from memory
 */
class InMemoryContextProvider : public quarry::tools::IContextProvider {
public:
    std::future<json> daily_task_context() override {
        return make_ready_future(json{
            {"date", "2026-10-17"},
            {"open_applications", 4},
            {"follow_ups_due", 2},
            {"streak_days", 6}
        });
    }

    std::future<json> preferences_context() override {
        return make_ready_future(json{
            {"target_roles", {"Robotics Software Engineer", "Controls Engineer"}},
            {"locations", {"Austin, TX", "Remote"}},
            {"salary_floor", 135000}
        });
    }

    std::future<std::vector<std::string>> existing_source_urls() override {
        return make_ready_future(std::vector<std::string>{
            "https://boards.greenhouse.io/roboticsco",
            "https://jobs.lever.co/aerodyne"
        });
    }

    std::future<std::vector<std::string>> existing_event_urls() override {
        return make_ready_future(std::vector<std::string>{"https://www.meetup.com/austin-robotics"});
    }

    std::future<json> event_context(const std::string& event_id) override {
        return make_ready_future(json{
            {"event_id", event_id},
            {"name", "Austin Robotics Meetup"},
            {"date", "2026-10-22"},
            {"status", "registered"}
        });
    }

    std::future<json> event_feedback_summary() override {
        return make_ready_future(json{{"events_attended", 3}, {"average_rating", 4.3}});
    }

    std::future<json> upcoming_events_context() override {
        return make_ready_future(json::array({
            json{{"name", "Austin Robotics Meetup"}, {"date", "2026-10-22"}}
        }));
    }

    std::future<json> contacts_at_companies(const std::vector<std::string>& companies) override {
        json contacts = json::array();
        for (const auto& company : companies) {
            contacts.push_back({{"company", company}, {"name", "Jordan Reyes"}, {"warmth", "warm"}});
        }
        return make_ready_future(std::move(contacts));
    }

    std::future<json> contacts_needing_attention() override {
        return make_ready_future(json::array({
            json{{"name", "Sam Patel"}, {"days_since_contact", 34}}
        }));
    }

    std::future<json> hot_contacts() override {
        return make_ready_future(json::array({
            json{{"name", "Jordan Reyes"}, {"company", "RoboticsCo"}}
        }));
    }

    std::future<json> pending_follow_ups() override {
        return make_ready_future(json::array({
            json{{"contact", "Sam Patel"}, {"due", "2026-10-18"}}
        }));
    }

    std::future<json> contact_context(const std::string& contact_id) override {
        return make_ready_future(json{
            {"contact_id", contact_id},
            {"name", "Jordan Reyes"},
            {"role", "Engineering Manager"},
            {"company", "RoboticsCo"}
        });
    }

    std::future<json> contact_interaction_history(const std::string& contact_id) override {
        return make_ready_future(json::array({
            json{{"contact_id", contact_id}, {"type", "coffee_chat"}, {"date", "2026-09-30"}}
        }));
    }

    std::future<json> user_profile_context() override {
        return make_ready_future(json{
            {"name", "Alex Morgan"},
            {"headline", "Robotics engineer, motion planning"},
            {"years_experience", 6}
        });
    }

    std::future<json> weekly_performance_history() override {
        return make_ready_future(json::array({
            json{{"week", "2026-W40"}, {"applications", 8}, {"interviews", 1}},
            json{{"week", "2026-W41"}, {"applications", 11}, {"interviews", 2}}
        }));
    }

    std::future<json> pipeline_status() override {
        return make_ready_future(json{{"applied", 14}, {"interviewing", 3}, {"offer", 0}});
    }

    std::future<json> weekly_summary_context() override {
        return make_ready_future(json{{"applications_sent", 11}, {"events_attended", 1}});
    }

    std::future<json> goal_progress_context() override {
        return make_ready_future(json{{"applications_goal", 10}, {"applications_done", 11}});
    }
};

struct CLIArgs {
    std::string config_path;
    std::string tool_name = "generate_daily_tasks";
    std::string tool_args = "{}";
    std::string request;
    bool schemas = false;
    bool help = false;
    bool invalid = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>    JSON configuration file\n";
    std::cout << "  --schemas          Print the tool advertisement array and exit\n";
    std::cout << "  --tool <name>      Tool to invoke (default: generate_daily_tasks)\n";
    std::cout << "  --args <json>      Raw arguments for --tool (default: {})\n";
    std::cout << "  --request <json>   Wire request {\"toolName\": ..., \"arguments\": ...}\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --schemas\n";
    std::cout << "  " << program_name << " --tool suggest_networking_actions --args '{\"focus\": \"maintain_hot\"}'\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        }
        else if (arg == "--schemas") {
            args.schemas = true;
        }
        else if (arg == "--tool" && i + 1 < argc) {
            args.tool_name = argv[++i];
        }
        else if (arg == "--args" && i + 1 < argc) {
            args.tool_args = argv[++i];
        }
        else if (arg == "--request" && i + 1 < argc) {
            args.request = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.invalid = true;
            return args;
        }
    }

    return args;
}

quarry::Expected<quarry::Config> load_config(const std::string& path) {
    if (path.empty()) {
        return quarry::Config{};
    }

    std::ifstream in(path);
    if (!in) {
        return tl::unexpected(quarry::Error{quarry::ErrorCode::InvalidConfig, "Cannot open configuration file", path});
    }
    auto doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return tl::unexpected(quarry::Error{quarry::ErrorCode::InvalidConfig, "Configuration file is not valid JSON", path});
    }
    return quarry::Config::from_json(doc);
}

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);

    if (args.help || args.invalid) {
        print_usage(argv[0]);
        return args.invalid ? 1 : 0;
    }

    auto config = load_config(args.config_path);
    if (!config) {
        std::cerr << "Error: " << config.error().to_string() << "\n";
        return 1;
    }

    std::unique_ptr<quarry::AgentCore> core;
    try {
        auto created = quarry::AgentCore::create(*config, std::make_shared<InMemoryContextProvider>());
        if (!created) {
            std::cerr << "Error: " << created.error().to_string() << "\n";
            return 1;
        }
        core = std::move(*created);
    } catch (const quarry::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (args.schemas) {
        std::cout << core->tool_schemas().dump(2) << "\n";
        return 0;
    }

    std::string envelope;
    if (!args.request.empty()) {
        envelope = core->execute_request(args.request);
    } else {
        auto tracked = core->execute_tracked("demo-1", args.tool_name, args.tool_args);
        if (!tracked) {
            std::cerr << "Error: " << tracked.error().to_string() << "\n";
            return 1;
        }
        envelope = *tracked;
    }

    auto pretty = json::parse(envelope, nullptr, false);
    std::cout << (pretty.is_discarded() ? envelope : pretty.dump(2)) << "\n";

    if (auto op = core->tracker().get("demo-1")) {
        std::cout << std::string(60, '-') << "\n";
        std::cout << "Operation " << op->id << ": " << quarry::tracking::to_string(op->status) << "\n";
        if (op->error) {
            std::cout << "  Error: " << *op->error << "\n";
        }
        if (auto duration = op->duration(core->tracker().now())) {
            std::cout << "  Duration: " << duration->count() << " ms\n";
        }
    }

    core->shutdown();
    return 0;
}
