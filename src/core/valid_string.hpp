#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "core/capabilities.hpp"
#include "core/result.hpp"

namespace keel {

/**
 * ValidString - An immutable, non-empty, non-whitespace-only string.
 *
 * The payload is stored exactly as given. Equality, ordering and hashing
 * are all defined on the payload bytes alone, so instances are safe keys
 * for both ordered and hashed containers.
 */
class ValidString {
public:
    /**
     * Validate `text` and wrap it.
     * Fails with Empty or WhitespaceOnly.
     */
    [[nodiscard]] static Validated<ValidString> create(std::string text);

    /**
     * Same as create(text), naming `param` in the error message.
     */
    [[nodiscard]] static Validated<ValidString> create(std::string text, std::string_view param);

    /**
     * Throwing form of create(); throws ValidationFailure.
     */
    explicit ValidString(std::string text);

    [[nodiscard]] const std::string& value() const noexcept {
        return value_;
    }

    [[nodiscard]] size_t size() const noexcept {
        return value_.size();
    }

    /**
     * The payload verbatim.
     */
    [[nodiscard]] std::string to_string() const {
        return value_;
    }

    /**
     * Diagnostic rendering including the instance address. Not stable,
     * and never used for comparison.
     */
    [[nodiscard]] std::string debug_string() const;

    /**
     * Lexicographic comparison of the payload. std::string compares as
     * unsigned char, which for UTF-8 is code point order.
     */
    [[nodiscard]] std::strong_ordering compare(const ValidString& other) const noexcept {
        return value_.compare(other.value_) <=> 0;
    }

    /**
     * 64-bit FNV-1a of the payload. Stable across processes.
     */
    [[nodiscard]] size_t hash() const noexcept;

    bool operator==(const ValidString& other) const noexcept {
        return value_ == other.value_;
    }

    std::strong_ordering operator<=>(const ValidString& other) const noexcept {
        return compare(other);
    }

private:
    struct Unchecked {};
    ValidString(Unchecked, std::string text) noexcept : value_(std::move(text)) {}

    std::string value_;
};

std::ostream& operator<<(std::ostream& os, const ValidString& s);

} // namespace keel

namespace std {
    template<>
    struct hash<keel::ValidString> {
        size_t operator()(const keel::ValidString& s) const noexcept {
            return s.hash();
        }
    };
}

static_assert(keel::Hashable<keel::ValidString>);
