#include "qt/conversions.hpp"

#include <QByteArray>

#include <algorithm>

namespace keel::qt {

Guid to_guid(const QUuid& uuid) {
    const QByteArray raw = uuid.toRfc4122();
    Uuid::Bytes bytes{};
    std::copy_n(reinterpret_cast<const uint8_t*>(raw.constData()),
                std::min<qsizetype>(raw.size(), Uuid::BYTE_SIZE),
                bytes.begin());
    return Guid(Uuid(bytes));
}

QUuid to_quuid(const Guid& guid) {
    const auto& bytes = guid.value().bytes();
    return QUuid::fromRfc4122(QByteArray(reinterpret_cast<const char*>(bytes.data()),
                                         static_cast<qsizetype>(bytes.size())));
}

Validated<ValidString> to_valid_string(const QString& text) {
    return ValidString::create(text.toStdString());
}

QString to_qstring(const ValidString& text) {
    return QString::fromStdString(text.value());
}

QString to_qstring(const Guid& guid) {
    return QString::fromStdString(guid.to_string());
}

Guid create_random_guid() {
    return to_guid(QUuid::createUuid());
}

} // namespace keel::qt
