#include "core/valid_string.hpp"

#include <cstdint>
#include <sstream>

#include "core/correctness.hpp"

namespace keel {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

} // namespace

Validated<ValidString> ValidString::create(std::string text) {
    return create(std::move(text), "value");
}

Validated<ValidString> ValidString::create(std::string text, std::string_view param) {
    auto checked = correctness::check_valid_string(text, param);
    if (checked.is_err()) {
        return Validated<ValidString>::err(checked.unwrap_err());
    }
    return Validated<ValidString>::ok(ValidString(Unchecked{}, std::move(text)));
}

ValidString::ValidString(std::string text)
    : ValidString(create(std::move(text)).unwrap()) {}

std::string ValidString::debug_string() const {
    std::ostringstream oss;
    oss << "<ValidString(" << value_ << ") object at "
        << static_cast<const void*>(this) << '>';
    return oss.str();
}

size_t ValidString::hash() const noexcept {
    uint64_t h = FNV_OFFSET_BASIS;
    for (unsigned char c : value_) {
        h ^= c;
        h *= FNV_PRIME;
    }
    return static_cast<size_t>(h);
}

std::ostream& operator<<(std::ostream& os, const ValidString& s) {
    return os << s.value();
}

} // namespace keel
