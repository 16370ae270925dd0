#pragma once

#include <string_view>

#include "core/result.hpp"

namespace keel::correctness {

/**
 * Whether a code point is whitespace in the sense used for string
 * validation: ASCII whitespace, the information separators U+001C..U+001F,
 * and the Unicode space separators and line/paragraph separators.
 */
[[nodiscard]] constexpr bool is_whitespace(char32_t cp) noexcept {
    switch (cp) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D:
        case 0x1C: case 0x1D: case 0x1E: case 0x1F:
        case 0x20:
        case 0x85:
        case 0xA0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

/**
 * True if `text` is non-empty and every code point in it is whitespace.
 * Bytes that do not form valid UTF-8 count as content.
 */
[[nodiscard]] bool is_whitespace_only(std::string_view text) noexcept;

/**
 * Check that `value` is usable as a ValidString payload.
 *
 * Returns `value` unchanged on success. On failure the error message names
 * `param` and the input class (empty or whitespace-only).
 */
[[nodiscard]] Validated<std::string_view> check_valid_string(std::string_view value,
                                                             std::string_view param = "value");

} // namespace keel::correctness
