#pragma once

#include <nlohmann/json.hpp>
#include <future>
#include <string>
#include <vector>

namespace quarry {
namespace tools {

/**
 * @brief Read-only source of live application context for tool handlers
 *
 * One asynchronous accessor per context snapshot. Each returns a future so
 * a handler can start every snapshot it needs before waiting on any of
 * them. A failing snapshot reports through its future (or by throwing
 * from the accessor itself); the dispatcher converts it into an error
 * envelope.
 *
 * Implementations must be safe to call from several dispatcher workers at
 * once.
 */
class IContextProvider {
public:
    virtual ~IContextProvider() = default;

    // Daily planning
    virtual std::future<nlohmann::json> daily_task_context() = 0;

    // Sources and preferences
    virtual std::future<nlohmann::json> preferences_context() = 0;
    virtual std::future<std::vector<std::string>> existing_source_urls() = 0;

    // Events
    virtual std::future<std::vector<std::string>> existing_event_urls() = 0;
    virtual std::future<nlohmann::json> event_context(const std::string& event_id) = 0;
    virtual std::future<nlohmann::json> event_feedback_summary() = 0;
    virtual std::future<nlohmann::json> upcoming_events_context() = 0;

    // Contacts
    virtual std::future<nlohmann::json> contacts_at_companies(const std::vector<std::string>& companies) = 0;
    virtual std::future<nlohmann::json> contacts_needing_attention() = 0;
    virtual std::future<nlohmann::json> hot_contacts() = 0;
    virtual std::future<nlohmann::json> pending_follow_ups() = 0;
    virtual std::future<nlohmann::json> contact_context(const std::string& contact_id) = 0;
    virtual std::future<nlohmann::json> contact_interaction_history(const std::string& contact_id) = 0;

    // Profile
    virtual std::future<nlohmann::json> user_profile_context() = 0;

    // Weekly review
    virtual std::future<nlohmann::json> weekly_performance_history() = 0;
    virtual std::future<nlohmann::json> pipeline_status() = 0;
    virtual std::future<nlohmann::json> weekly_summary_context() = 0;
    virtual std::future<nlohmann::json> goal_progress_context() = 0;
};

/// Future that is already satisfied with value.
template<typename T>
std::future<T> make_ready_future(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

/// Future that already holds an exception.
template<typename T, typename E>
std::future<T> make_failed_future(E error) {
    std::promise<T> promise;
    promise.set_exception(std::make_exception_ptr(std::move(error)));
    return promise.get_future();
}

} // namespace tools
} // namespace quarry
