#pragma once

#include <concepts>
#include <cstddef>
#include <functional>

namespace keel {

/**
 * Equatable - value equality that is reflexive, symmetric and transitive.
 */
template<typename T>
concept Equatable = std::equality_comparable<T>;

/**
 * Hashable - a `hash()` member and a matching std::hash specialization.
 * Equal values must produce equal hashes.
 */
template<typename T>
concept Hashable = Equatable<T> && requires(const T& value) {
    { value.hash() } -> std::same_as<std::size_t>;
    { std::hash<T>{}(value) } -> std::convertible_to<std::size_t>;
};

} // namespace keel
