#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace keel {

/**
 * UUID - Universally Unique Identifier.
 *
 * A 128-bit value stored as 16 bytes in RFC 4122 (big-endian) order.
 * Provides generation, strict parsing, and string conversion.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    static constexpr size_t HEX_DIGITS = BYTE_SIZE * 2;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    /**
     * RFC 4122 variant field (the top bits of byte 8).
     */
    enum class Variant {
        Ncs,
        Rfc4122,
        Microsoft,
        Future
    };

    /**
     * Create a nil (all zeros) UUID.
     */
    constexpr Uuid() noexcept : bytes_{} {}

    /**
     * Create a UUID from raw bytes.
     */
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new random UUID (version 4).
     */
    [[nodiscard]] static Uuid generate();

    /**
     * Parse a UUID from text.
     *
     * Accepts 32 hex digits, either undashed or dashed 8-4-4-4-12, in any
     * case, optionally wrapped in braces or prefixed with "urn:uuid:".
     * Fails with MalformedUuid.
     */
    [[nodiscard]] static Validated<Uuid> parse(std::string_view text);

    /**
     * Convert to string representation (hyphenated, lowercase).
     * Format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    /**
     * Version number from the high nibble of byte 6 (4 for random).
     */
    [[nodiscard]] constexpr int version() const noexcept {
        return bytes_[6] >> 4;
    }

    [[nodiscard]] constexpr Variant variant() const noexcept {
        const auto b = bytes_[8];
        if ((b & 0x80) == 0x00) return Variant::Ncs;
        if ((b & 0xC0) == 0x80) return Variant::Rfc4122;
        if ((b & 0xE0) == 0xC0) return Variant::Microsoft;
        return Variant::Future;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    // Byte-wise; an implementation convenience, not an identity property.
    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

} // namespace keel

namespace std {
    template<>
    struct hash<keel::Uuid> {
        size_t operator()(const keel::Uuid& uuid) const noexcept {
            const auto& bytes = uuid.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
