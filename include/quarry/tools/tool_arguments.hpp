#pragma once

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {
namespace tools {

/**
 * @brief Lenient view over a tool's argument object
 *
 * Raw arguments come from the model and are untrusted. Parsing never fails:
 * text that is not a JSON object degrades to an empty object, and every
 * getter falls back to the caller's default when a key is absent or holds
 * a value of the wrong type.
 */
class ToolArguments {
public:
    ToolArguments() : args_(nlohmann::json::object()) {}

    /// Wrap an already parsed value; non-objects are treated as empty.
    explicit ToolArguments(const nlohmann::json& args)
        : args_(args.is_object() ? args : nlohmann::json::object())
        , degraded_(!args.is_object()) {}

    /**
     * @brief Parse raw argument text
     *
     * Empty or whitespace-only text is treated as "no arguments" and is not
     * counted as degraded.
     */
    static ToolArguments parse(std::string_view raw) {
        if (raw.find_first_not_of(" \t\r\n") == std::string_view::npos) {
            return ToolArguments();
        }
        auto doc = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
        if (doc.is_discarded()) {
            ToolArguments args;
            args.degraded_ = true;
            return args;
        }
        return ToolArguments(doc);
    }

    /// True when the raw input was unusable and replaced by an empty object.
    bool degraded() const { return degraded_; }

    const nlohmann::json& raw() const { return args_; }

    bool has(const std::string& key) const {
        auto it = args_.find(key);
        return it != args_.end() && !it->is_null();
    }

    std::string string_or(const std::string& key, const std::string& fallback) const {
        auto it = args_.find(key);
        if (it == args_.end() || !it->is_string()) {
            return fallback;
        }
        return it->get<std::string>();
    }

    /// Integer value; floating-point numbers are truncated. Values outside long long use fallback.
    long long int_or(const std::string& key, long long fallback) const {
        auto it = args_.find(key);
        if (it == args_.end()) {
            return fallback;
        }
        if (it->is_number_unsigned()) {
            auto value = it->get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<long long>::max())) {
                return fallback;
            }
            return static_cast<long long>(value);
        }
        if (it->is_number_integer()) {
            return it->get<long long>();
        }
        if (it->is_number_float()) {
            // [-2^63, 2^63) is exactly representable as double
            const double lo = static_cast<double>(std::numeric_limits<long long>::min());
            const double value = it->get<double>();
            if (!std::isfinite(value) || value < lo || value >= -lo) {
                return fallback;
            }
            return static_cast<long long>(value);
        }
        return fallback;
    }

    double double_or(const std::string& key, double fallback) const {
        auto it = args_.find(key);
        if (it == args_.end() || !it->is_number()) {
            return fallback;
        }
        return it->get<double>();
    }

    bool bool_or(const std::string& key, bool fallback) const {
        auto it = args_.find(key);
        if (it == args_.end() || !it->is_boolean()) {
            return fallback;
        }
        return it->get<bool>();
    }

    /**
     * @brief Array of strings
     *
     * A missing or non-array value yields an empty list. Scalar elements
     * are rendered as text; other elements become empty strings.
     */
    std::vector<std::string> string_list(const std::string& key) const {
        std::vector<std::string> out;
        auto it = args_.find(key);
        if (it == args_.end() || !it->is_array()) {
            return out;
        }
        out.reserve(it->size());
        for (const auto& element : *it) {
            if (element.is_string()) {
                out.push_back(element.get<std::string>());
            } else if (element.is_number() || element.is_boolean()) {
                out.push_back(element.dump());
            } else {
                out.emplace_back();
            }
        }
        return out;
    }

    /// Array of objects; non-object elements become empty objects.
    nlohmann::json object_list(const std::string& key) const {
        nlohmann::json out = nlohmann::json::array();
        auto it = args_.find(key);
        if (it == args_.end() || !it->is_array()) {
            return out;
        }
        for (const auto& element : *it) {
            out.push_back(element.is_object() ? element : nlohmann::json::object());
        }
        return out;
    }

private:
    nlohmann::json args_;
    bool degraded_ = false;
};

} // namespace tools
} // namespace quarry
