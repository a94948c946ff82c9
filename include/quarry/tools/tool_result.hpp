#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace quarry {
namespace tools {

/**
 * @brief Envelope returned to the model for every tool invocation
 *
 * Always a JSON object with "status" set to "context_provided" or "error".
 * Error envelopes carry an "error" string; context envelopes carry an
 * "instruction" string next to the tool-specific payload fields.
 */
class ToolResult {
public:
    static constexpr const char* kContextProvided = "context_provided";
    static constexpr const char* kError = "error";

    /**
     * @brief Build a context envelope
     *
     * @param payload Echoed parameters and context snapshots (object)
     * @param instruction Literal instruction steering the model's output
     */
    static ToolResult context_provided(nlohmann::json payload, std::string instruction) {
        if (!payload.is_object()) {
            payload = nlohmann::json::object();
        }
        payload["status"] = kContextProvided;
        payload["instruction"] = std::move(instruction);
        return ToolResult(std::move(payload));
    }

    static ToolResult error(const std::string& message) {
        return ToolResult(nlohmann::json{
            {"status", kError},
            {"error", message}
        });
    }

    /// Error envelope text for an Error value ("message: context" when context is set).
    static ToolResult from_error(const Error& err) {
        if (err.context.has_value() && !err.context->empty()) {
            return error(err.message + ": " + *err.context);
        }
        return error(err.message);
    }

    /**
     * @brief Accept a handler's body if it is a well-formed envelope
     *
     * @return nullopt when the body is not an object with a known status, or
     *         is missing the field its status requires
     */
    static std::optional<ToolResult> from_body(nlohmann::json body) {
        if (!body.is_object()) {
            return std::nullopt;
        }
        auto status = body.find("status");
        if (status == body.end() || !status->is_string()) {
            return std::nullopt;
        }
        if (*status == kContextProvided) {
            auto it = body.find("instruction");
            if (it == body.end() || !it->is_string()) return std::nullopt;
        } else if (*status == kError) {
            auto it = body.find("error");
            if (it == body.end() || !it->is_string()) return std::nullopt;
        } else {
            return std::nullopt;
        }
        return ToolResult(std::move(body));
    }

    /// Parse envelope text produced by the dispatcher.
    static Expected<ToolResult> parse(std::string_view text) {
        auto doc = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        if (doc.is_discarded()) {
            return tl::unexpected(Error{ErrorCode::InvalidJson, "Tool result is not valid JSON"});
        }
        auto result = from_body(std::move(doc));
        if (!result) {
            return tl::unexpected(Error{ErrorCode::UnexpectedShape, "Tool result is not a valid envelope"});
        }
        return std::move(*result);
    }

    bool is_error() const {
        return body_["status"] == kError;
    }

    std::string status() const {
        return body_["status"].get<std::string>();
    }

    /// Error message, or nullopt for a context envelope.
    std::optional<std::string> error_message() const {
        if (!is_error()) {
            return std::nullopt;
        }
        return body_["error"].get<std::string>();
    }

    std::optional<std::string> instruction() const {
        auto it = body_.find("instruction");
        if (it == body_.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }

    const nlohmann::json& body() const { return body_; }

    /// Compact JSON text; invalid UTF-8 is replaced rather than thrown on.
    std::string to_string() const {
        return body_.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

private:
    explicit ToolResult(nlohmann::json body) : body_(std::move(body)) {}

    nlohmann::json body_;
};

} // namespace tools
} // namespace quarry
