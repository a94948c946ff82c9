#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace quarry {
namespace decode {

/**
 * @brief Locates the JSON document inside a model reply
 *
 * Models wrap structured output in prose or markdown fences. Extraction:
 * 1. Trim surrounding whitespace
 * 2. Strip a leading ```/```json fence and its closing fence
 * 3. Parse the whole remaining text
 * 4. Otherwise parse the first balanced {...} or [...] span that is valid JSON
 */
class JsonExtractor {
public:
    static Expected<nlohmann::json> extract(std::string_view text) {
        std::string_view body = strip_fences(trim(text));
        if (body.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidJson, "Reply is empty"});
        }

        auto whole = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
        if (!whole.is_discarded()) {
            return whole;
        }

        size_t pos = body.find_first_of("{[");
        while (pos != std::string_view::npos) {
            size_t end_pos = find_json_end(body, pos);
            if (end_pos != std::string_view::npos) {
                auto candidate = body.substr(pos, end_pos - pos + 1);
                auto doc = nlohmann::json::parse(candidate.begin(), candidate.end(), nullptr, false);
                if (!doc.is_discarded()) {
                    return doc;
                }
            }
            pos = body.find_first_of("{[", pos + 1);
        }

        return tl::unexpected(Error{
            ErrorCode::InvalidJson,
            "Reply does not contain valid JSON",
            preview(body)
        });
    }

    static std::string_view trim(std::string_view text) {
        const char* ws = " \t\r\n";
        size_t first = text.find_first_not_of(ws);
        if (first == std::string_view::npos) {
            return {};
        }
        size_t last = text.find_last_not_of(ws);
        return text.substr(first, last - first + 1);
    }

    /// Remove a surrounding markdown code fence, if present.
    static std::string_view strip_fences(std::string_view text) {
        if (text.substr(0, 3) != "```") {
            return text;
        }
        size_t line_end = text.find('\n');
        if (line_end == std::string_view::npos) {
            return {};
        }
        std::string_view inner = text.substr(line_end + 1);
        size_t closing = inner.rfind("```");
        if (closing != std::string_view::npos) {
            inner = inner.substr(0, closing);
        }
        return trim(inner);
    }

private:
    /**
     * @brief Find the end position of a balanced JSON value starting at start.
     *
     * Handles string escaping and nesting of both objects and arrays.
     *
     * @param text The text to search within
     * @param start Starting position (must point to '{' or '[')
     * @return Position of the matching closing bracket, or npos if unbalanced
     */
    static size_t find_json_end(std::string_view text, size_t start) {
        if (start >= text.size() || (text[start] != '{' && text[start] != '[')) {
            return std::string_view::npos;
        }

        int depth = 0;
        bool in_string = false;
        bool escape_next = false;

        for (size_t i = start; i < text.size(); ++i) {
            char c = text[i];

            if (escape_next) {
                escape_next = false;
                continue;
            }

            if (c == '\\' && in_string) {
                escape_next = true;
                continue;
            }

            if (c == '"') {
                in_string = !in_string;
                continue;
            }

            if (!in_string) {
                if (c == '{' || c == '[') {
                    ++depth;
                } else if (c == '}' || c == ']') {
                    --depth;
                    if (depth == 0) {
                        return i;
                    }
                }
            }
        }

        return std::string_view::npos;  // Unbalanced
    }

    static std::string preview(std::string_view text) {
        constexpr size_t kMax = 80;
        if (text.size() <= kMax) {
            return std::string(text);
        }
        return std::string(text.substr(0, kMax)) + "...";
    }
};

} // namespace decode
} // namespace quarry
