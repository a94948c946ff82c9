#pragma once

#include "../log.hpp"
#include "../types.hpp"
#include "json_extractor.hpp"
#include "responses.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace quarry {
namespace decode {

namespace detail {

// Response types whose canonical shape is an object wrapping one named array
template<typename T, typename = void>
struct has_envelope : std::false_type {};

template<typename T>
struct has_envelope<T, std::void_t<decltype(T::from_items(
    std::declval<const nlohmann::json&>(), std::declval<const std::string&>()))>> : std::true_type {};

} // namespace detail

/**
 * @brief Decodes model replies into canonical response types
 *
 * T must provide:
 * - static Expected<T> from_json(const nlohmann::json&)
 * - Expected<void> validate() const
 * and, for enveloped list types,
 * - static Expected<T> from_items(const nlohmann::json&, const std::string&)
 *
 * Decode failures carry InvalidJson, MissingField, FieldTypeMismatch or
 * UnexpectedShape; semantic failures carry ValidationFailed.
 *
 * @threadsafety Stateless apart from the logger; safe to share.
 */
class StructuredDecoder {
public:
    explicit StructuredDecoder(std::shared_ptr<spdlog::logger> logger = nullptr)
        : logger_(log::or_default(std::move(logger))) {}

    /// Extract, decode and validate.
    template<typename T>
    Expected<T> decode(std::string_view text) const {
        auto value = decode_unvalidated<T>(text);
        if (!value) {
            return value;
        }
        auto valid = value->validate();
        if (!valid) {
            logger_->warn("Decoded reply failed validation: {}", valid.error().to_string());
            return tl::unexpected(valid.error());
        }
        return value;
    }

    /// Extract and decode without the validation gate.
    template<typename T>
    Expected<T> decode_unvalidated(std::string_view text) const {
        auto doc = JsonExtractor::extract(text);
        if (!doc) {
            logger_->debug("Reply is not JSON: {}", doc.error().to_string());
            return tl::unexpected(doc.error());
        }
        return decode_document<T>(*doc);
    }

    /**
     * @brief Decode an already parsed document
     *
     * For enveloped types a bare array is decoded directly into the
     * envelope's list when the object form does not apply.
     */
    template<typename T>
    Expected<T> decode_document(const nlohmann::json& doc) const {
        if constexpr (detail::has_envelope<T>::value) {
            auto result = T::from_json(doc);
            if (result || !doc.is_array()) {
                log_failure(result);
                return result;
            }
            logger_->debug("Reply is a bare array, decoding it as the envelope list");
            auto items = T::from_items(doc, std::string("$"));
            log_failure(items);
            return items;
        } else {
            auto result = T::from_json(doc);
            log_failure(result);
            return result;
        }
    }

private:
    template<typename T>
    void log_failure(const Expected<T>& result) const {
        if (!result) {
            logger_->debug("Reply did not decode: {}", result.error().to_string());
        }
    }

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace decode
} // namespace quarry
