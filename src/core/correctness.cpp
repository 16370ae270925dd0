#include "core/correctness.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace keel::correctness {

namespace {

struct Decoded {
    char32_t code_point;
    size_t length;
};

// Decodes one UTF-8 sequence at the front of `text`. Returns nullopt for
// truncated, overlong or otherwise invalid sequences.
std::optional<Decoded> decode_utf8(std::string_view text) noexcept {
    const auto lead = static_cast<uint8_t>(text[0]);
    if (lead < 0x80) {
        return Decoded{lead, 1};
    }

    size_t length = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2; cp = lead & 0x1F; min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; cp = lead & 0x0F; min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; cp = lead & 0x07; min = 0x10000;
    } else {
        return std::nullopt;
    }

    if (text.size() < length) {
        return std::nullopt;
    }
    for (size_t i = 1; i < length; ++i) {
        const auto cont = static_cast<uint8_t>(text[i]);
        if ((cont & 0xC0) != 0x80) {
            return std::nullopt;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return std::nullopt;
    }
    return Decoded{cp, length};
}

} // namespace

bool is_whitespace_only(std::string_view text) noexcept {
    if (text.empty()) {
        return false;
    }
    while (!text.empty()) {
        const auto decoded = decode_utf8(text);
        if (!decoded || !is_whitespace(decoded->code_point)) {
            return false;
        }
        text.remove_prefix(decoded->length);
    }
    return true;
}

Validated<std::string_view> check_valid_string(std::string_view value, std::string_view param) {
    if (value.empty()) {
        return Validated<std::string_view>::err(ValidationError{
            ValidationErrorKind::Empty,
            "invalid string for '" + std::string(param) + "': was empty"});
    }
    if (is_whitespace_only(value)) {
        return Validated<std::string_view>::err(ValidationError{
            ValidationErrorKind::WhitespaceOnly,
            "invalid string for '" + std::string(param) + "': was all whitespace ("
                + std::to_string(value.size()) + " bytes)"});
    }
    return Validated<std::string_view>::ok(value);
}

} // namespace keel::correctness
