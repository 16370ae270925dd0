#include "core/guid.hpp"

#include <type_traits>

namespace keel {

static_assert(sizeof(Guid) == sizeof(Uuid), "Guid adds no state to Uuid");
static_assert(std::is_trivially_copyable_v<Guid>, "Guid should be trivially copyable");

Validated<Guid> Guid::parse(std::string_view text) {
    return Uuid::parse(text).map([](const Uuid& uuid) { return Guid(uuid); });
}

std::ostream& operator<<(std::ostream& os, const Guid& guid) {
    return os << guid.to_string();
}

} // namespace keel
