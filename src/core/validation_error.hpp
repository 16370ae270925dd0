#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace keel {

/**
 * ValidationErrorKind - Which construction invariant was violated.
 */
enum class ValidationErrorKind {
    Empty,
    WhitespaceOnly,
    MalformedUuid
};

[[nodiscard]] constexpr std::string_view to_string(ValidationErrorKind kind) noexcept {
    switch (kind) {
        case ValidationErrorKind::Empty: return "empty";
        case ValidationErrorKind::WhitespaceOnly: return "whitespace_only";
        case ValidationErrorKind::MalformedUuid: return "malformed_uuid";
    }
    return "unknown";
}

/**
 * ValidationError - The single error kind of this library.
 *
 * Produced at a construction boundary when the input violates the
 * invariant of the type being built.
 */
struct ValidationError {
    ValidationErrorKind kind{ValidationErrorKind::Empty};
    std::string message;

    ValidationError() = default;
    ValidationError(ValidationErrorKind k, std::string msg)
        : kind(k), message(std::move(msg)) {}

    bool operator==(const ValidationError&) const = default;
};

/**
 * ValidationFailure - Exception form of ValidationError, thrown by the
 * throwing constructors and by Result::unwrap().
 */
class ValidationFailure : public std::invalid_argument {
public:
    explicit ValidationFailure(ValidationError error)
        : std::invalid_argument(error.message), error_(std::move(error)) {}

    [[nodiscard]] const ValidationError& error() const noexcept {
        return error_;
    }

    [[nodiscard]] ValidationErrorKind kind() const noexcept {
        return error_.kind;
    }

private:
    ValidationError error_;
};

} // namespace keel
