#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace quarry {
namespace decode {

// ============================================================================
// FieldKeys
// ============================================================================

/**
 * @brief Ordered candidate names of one logical field
 *
 * The first name is canonical; the rest are accepted aliases, tried in
 * order. The list is part of a response type's documented contract.
 */
class FieldKeys {
public:
    FieldKeys(std::initializer_list<std::string> names) : names_(names) {}

    const std::vector<std::string>& names() const { return names_; }
    const std::string& canonical() const { return names_.front(); }

    /// "a, b, c" for diagnostics.
    std::string describe() const {
        std::string out;
        for (size_t i = 0; i < names_.size(); ++i) {
            if (i > 0) out += ", ";
            out += names_[i];
        }
        return out;
    }

private:
    std::vector<std::string> names_;
};

namespace detail {

template<typename T>
struct field_converter;

template<> struct field_converter<std::string> {
    static constexpr const char* type = "string";
    static std::optional<std::string> convert(const nlohmann::json& value) {
        if (!value.is_string()) return std::nullopt;
        return value.get<std::string>();
    }
};

// Integral floats ("3.0") are accepted; values outside int are a mismatch
template<> struct field_converter<int> {
    static constexpr const char* type = "integer";
    static std::optional<int> convert(const nlohmann::json& value) {
        constexpr auto lo = std::numeric_limits<int>::min();
        constexpr auto hi = std::numeric_limits<int>::max();
        if (value.is_number_unsigned()) {
            auto u = value.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(hi)) return std::nullopt;
            return static_cast<int>(u);
        }
        if (value.is_number_integer()) {
            auto i = value.get<std::int64_t>();
            if (i < lo || i > hi) return std::nullopt;
            return static_cast<int>(i);
        }
        if (value.is_number_float()) {
            double d = value.get<double>();
            if (!std::isfinite(d) || std::floor(d) != d) return std::nullopt;
            if (d < static_cast<double>(lo) || d > static_cast<double>(hi)) return std::nullopt;
            return static_cast<int>(d);
        }
        return std::nullopt;
    }
};

template<> struct field_converter<double> {
    static constexpr const char* type = "number";
    static std::optional<double> convert(const nlohmann::json& value) {
        if (!value.is_number()) return std::nullopt;
        return value.get<double>();
    }
};

template<> struct field_converter<bool> {
    static constexpr const char* type = "boolean";
    static std::optional<bool> convert(const nlohmann::json& value) {
        if (!value.is_boolean()) return std::nullopt;
        return value.get<bool>();
    }
};

template<> struct field_converter<std::vector<std::string>> {
    static constexpr const char* type = "array of strings";
    static std::optional<std::vector<std::string>> convert(const nlohmann::json& value) {
        if (!value.is_array()) return std::nullopt;
        std::vector<std::string> out;
        out.reserve(value.size());
        for (const auto& element : value) {
            if (!element.is_string()) return std::nullopt;
            out.push_back(element.get<std::string>());
        }
        return out;
    }
};

} // namespace detail

// ============================================================================
// FieldReader
// ============================================================================

/**
 * @brief Reads logical fields from a JSON object by candidate names
 *
 * Resolution is first-match-wins over FieldKeys: the first candidate that
 * is present, non-null and of the expected type supplies the value. A
 * candidate holding the wrong type is skipped in favour of later aliases.
 */
class FieldReader {
public:
    /**
     * @param object Object to read (must outlive the reader)
     * @param path Location used in error context, e.g. "$.items[2]"
     */
    explicit FieldReader(const nlohmann::json& object, std::string path = "$")
        : object_(object), path_(std::move(path)) {}

    /// First present, non-null candidate value regardless of type, or nullptr.
    const nlohmann::json* find(const FieldKeys& keys) const {
        if (!object_.is_object()) return nullptr;
        for (const auto& name : keys.names()) {
            auto it = object_.find(name);
            if (it != object_.end() && !it->is_null()) {
                return &*it;
            }
        }
        return nullptr;
    }

    /**
     * @brief Required field
     *
     * @return ErrorCode::MissingField naming every candidate when none is
     *         present; ErrorCode::FieldTypeMismatch when candidates exist but
     *         none has the expected type
     */
    template<typename T>
    Expected<T> required(const FieldKeys& keys) const {
        bool present = false;
        if (object_.is_object()) {
            for (const auto& name : keys.names()) {
                auto it = object_.find(name);
                if (it == object_.end() || it->is_null()) {
                    continue;
                }
                present = true;
                if (auto value = detail::field_converter<T>::convert(*it)) {
                    return std::move(*value);
                }
            }
        }

        if (present) {
            return tl::unexpected(Error{
                ErrorCode::FieldTypeMismatch,
                "Field '" + keys.canonical() + "' is not a " + detail::field_converter<T>::type +
                    " (tried: " + keys.describe() + ")",
                path_
            });
        }
        return tl::unexpected(Error{
            ErrorCode::MissingField,
            "Missing required field '" + keys.canonical() + "' (tried: " + keys.describe() + ")",
            path_
        });
    }

    /// Optional field; absent or mistyped under every candidate yields fallback.
    template<typename T>
    T optional(const FieldKeys& keys, T fallback) const {
        if (object_.is_object()) {
            for (const auto& name : keys.names()) {
                auto it = object_.find(name);
                if (it == object_.end() || it->is_null()) {
                    continue;
                }
                if (auto value = detail::field_converter<T>::convert(*it)) {
                    return std::move(*value);
                }
            }
        }
        return fallback;
    }

    const std::string& path() const { return path_; }

private:
    const nlohmann::json& object_;
    std::string path_;
};

} // namespace decode
} // namespace quarry
