#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include "core/capabilities.hpp"
#include "core/result.hpp"
#include "core/uuid.hpp"

namespace keel {

/**
 * Guid - Globally unique identifier.
 *
 * Wraps a 128-bit value produced elsewhere (Uuid::generate, QUuid, a
 * message from a venue). Identity only: equal iff the bits are equal.
 * Guid never generates or alters the value it holds, so uniqueness is
 * exactly as good as the generator that produced it.
 *
 * Guid has no ordering. Order by value() if a sorted container is
 * needed; that order carries no meaning.
 */
class Guid {
public:
    explicit constexpr Guid(Uuid value) noexcept : value_(value) {}

    /**
     * Parse the textual form accepted by Uuid::parse.
     * Fails with MalformedUuid.
     */
    [[nodiscard]] static Validated<Guid> parse(std::string_view text);

    [[nodiscard]] constexpr const Uuid& value() const noexcept {
        return value_;
    }

    /**
     * Canonical lowercase 8-4-4-4-12 form. parse(to_string()) == *this.
     */
    [[nodiscard]] std::string to_string() const {
        return value_.to_string();
    }

    [[nodiscard]] std::string debug_string() const {
        return "Guid('" + value_.to_string() + "')";
    }

    [[nodiscard]] size_t hash() const noexcept {
        return std::hash<Uuid>{}(value_);
    }

    bool operator==(const Guid&) const = default;

private:
    Uuid value_;
};

std::ostream& operator<<(std::ostream& os, const Guid& guid);

} // namespace keel

namespace std {
    template<>
    struct hash<keel::Guid> {
        size_t operator()(const keel::Guid& guid) const noexcept {
            return guid.hash();
        }
    };
}

static_assert(keel::Hashable<keel::Guid>);
