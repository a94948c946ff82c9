#pragma once

#include <cctype>
#include <string_view>

namespace quarry {
namespace decode {

/**
 * @brief Syntactic UUID check
 *
 * Accepts the canonical 8-4-4-4-12 hexadecimal form, case-insensitive.
 * Version and variant bits are not inspected.
 */
[[nodiscard]] inline bool is_valid_uuid(std::string_view text) {
    if (text.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace decode
} // namespace quarry
