#pragma once

#include <QString>
#include <QUuid>

#include "core/guid.hpp"
#include "core/valid_string.hpp"

namespace keel::qt {

// Byte-exact: QUuid's RFC 4122 byte order matches Uuid::bytes().
[[nodiscard]] Guid to_guid(const QUuid& uuid);
[[nodiscard]] QUuid to_quuid(const Guid& guid);

[[nodiscard]] Validated<ValidString> to_valid_string(const QString& text);
[[nodiscard]] QString to_qstring(const ValidString& text);
[[nodiscard]] QString to_qstring(const Guid& guid);

// Fresh identifier from QUuid::createUuid(), which draws on the system RNG.
[[nodiscard]] Guid create_random_guid();

} // namespace keel::qt
