#pragma once

#include <variant>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "core/validation_error.hpp"

namespace keel {

/**
 * Result<T, E> - Either a successfully constructed value (Ok) or the
 * reason construction was refused (Err).
 *
 * Every fallible factory in this library returns a Result so callers
 * decide how to surface the failure. Combinators let checks be chained
 * without unwrapping:
 *
 *   auto symbol = ValidString::create(text, "symbol")
 *       .map([](ValidString s) { return s.size(); });
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /**
     * Create a successful Result containing a value.
     */
    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /**
     * Create a failed Result containing an error.
     */
    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing if this is an error.
     * A ValidationError is rethrown as ValidationFailure.
     */
    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    /**
     * Get the error, throwing if this is a success.
     */
    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::logic_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * map_err : Result<T, E> -> (E -> G) -> Result<T, G>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using G = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, G>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
        }
        return Result<T, G>::ok(std::get<0>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    template<typename OnOk, typename OnErr>
    [[nodiscard]] auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) {
            return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(data_));
        }
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, ValidationError>) {
            throw ValidationFailure(std::get<1>(data_));
        } else {
            throw std::logic_error("Result::unwrap() called on error");
        }
    }

    // Index-based access keeps Result<X, X> usable.
    std::variant<T, E> data_;
};

/**
 * Validated<T> - Result of a construction that may violate T's invariant.
 */
template<typename T>
using Validated = Result<T, ValidationError>;

} // namespace keel
