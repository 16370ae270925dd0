#include "core/uuid.hpp"

#include <optional>
#include <random>
#include <type_traits>

namespace keel {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");

namespace {

constexpr std::string_view URN_PREFIX = "urn:uuid:";
constexpr char HEX_CHARS[] = "0123456789abcdef";

[[nodiscard]] std::optional<uint8_t> hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

[[nodiscard]] bool is_dash_position(size_t i) noexcept {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

[[nodiscard]] Validated<Uuid> malformed(std::string message) {
    return Validated<Uuid>::err(ValidationError{ValidationErrorKind::MalformedUuid,
                                                "malformed UUID text: " + std::move(message)});
}

} // namespace

Uuid Uuid::generate() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    Bytes bytes;
    const uint64_t hi = dist(gen);
    const uint64_t lo = dist(gen);
    for (size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
        bytes[i + 8] = static_cast<uint8_t>(lo >> (56 - 8 * i));
    }

    // Set version 4 (random)
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant (RFC 4122)
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return Uuid(bytes);
}

Validated<Uuid> Uuid::parse(std::string_view text) {
    if (text.starts_with(URN_PREFIX)) {
        text.remove_prefix(URN_PREFIX.size());
    } else if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
        text.remove_prefix(1);
        text.remove_suffix(1);
    }

    const bool dashed = text.size() == HEX_DIGITS + 4;
    if (!dashed && text.size() != HEX_DIGITS) {
        return malformed("expected 32 hex digits (optionally 8-4-4-4-12 with dashes), got "
                         + std::to_string(text.size()) + " characters");
    }

    Bytes bytes{};
    size_t digit = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (dashed && is_dash_position(i)) {
            if (c != '-') {
                return malformed("expected '-' at position " + std::to_string(i));
            }
            continue;
        }
        const auto value = hex_value(c);
        if (!value) {
            return malformed("invalid hex digit at position " + std::to_string(i));
        }
        auto& byte = bytes[digit / 2];
        byte = (digit % 2 == 0) ? static_cast<uint8_t>(*value << 4)
                                : static_cast<uint8_t>(byte | *value);
        ++digit;
    }

    return Validated<Uuid>::ok(Uuid(bytes));
}

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(HEX_DIGITS + 4);
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += HEX_CHARS[bytes_[i] >> 4];
        out += HEX_CHARS[bytes_[i] & 0x0F];
    }
    return out;
}

} // namespace keel
