#include "cli/ids.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "core/guid.hpp"
#include "core/valid_string.hpp"
#include "qt/conversions.hpp"
#include "qt/logging.hpp"

namespace keel::cli {

namespace {

struct Row {
    QString input;
    bool ok = false;
    QString value;
    QString kind;
    QString error;
};

[[nodiscard]] Row error_row(const QString& input, const ValidationError& error) {
    Row row;
    row.input = input;
    row.kind = QString::fromUtf8(to_string(error.kind).data(),
                                 static_cast<qsizetype>(to_string(error.kind).size()));
    row.error = QString::fromStdString(error.message);
    qCWarning(lcKeelIds).noquote() << "rejected" << row.kind << "input:" << row.error;
    return row;
}

[[nodiscard]] Row ok_row(const QString& input, const QString& value) {
    Row row;
    row.input = input;
    row.ok = true;
    row.value = value;
    return row;
}

[[nodiscard]] IdsReport render(const QList<Row>& rows, const IdsOptions& options) {
    IdsReport report;
    for (const auto& row : rows) {
        report.ok = report.ok && row.ok;
    }

    if (options.json) {
        QJsonArray arr;
        for (const auto& row : rows) {
            QJsonObject obj;
            obj.insert(QStringLiteral("input"), row.input);
            obj.insert(QStringLiteral("ok"), row.ok);
            if (row.ok) {
                obj.insert(QStringLiteral("value"), row.value);
            } else {
                obj.insert(QStringLiteral("kind"), row.kind);
                obj.insert(QStringLiteral("error"), row.error);
            }
            arr.append(obj);
        }
        report.output = QString::fromUtf8(QJsonDocument(arr).toJson(QJsonDocument::Indented));
        return report;
    }

    QStringList lines;
    lines.reserve(rows.size());
    for (const auto& row : rows) {
        lines.append(row.ok
            ? QStringLiteral("ok ") + row.value
            : QStringLiteral("error ") + row.kind + QStringLiteral(": ") + row.error);
    }
    report.output = lines.isEmpty() ? QString{} : lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
    return report;
}

} // namespace

IdsReport check_strings(const QStringList& inputs, const IdsOptions& options) {
    QList<Row> rows;
    rows.reserve(inputs.size());
    for (const auto& input : inputs) {
        const auto result = qt::to_valid_string(input);
        rows.append(result.match(
            [&input](const ValidString& s) { return ok_row(input, qt::to_qstring(s)); },
            [&input](const ValidationError& e) { return error_row(input, e); }));
    }
    return render(rows, options);
}

IdsReport normalize_guids(const QStringList& inputs, const IdsOptions& options) {
    QList<Row> rows;
    rows.reserve(inputs.size());
    for (const auto& input : inputs) {
        const auto result = Guid::parse(input.toStdString());
        rows.append(result.match(
            [&input](const Guid& g) { return ok_row(input, qt::to_qstring(g)); },
            [&input](const ValidationError& e) { return error_row(input, e); }));
    }
    return render(rows, options);
}

IdsReport generate_guids(const IdsOptions& options) {
    IdsReport report;
    QStringList ids;
    for (int i = 0; i < options.count; ++i) {
        ids.append(qt::to_qstring(qt::create_random_guid()));
    }
    qCDebug(lcKeelIds) << "generated" << ids.size() << "identifiers";

    if (options.json) {
        report.output = QString::fromUtf8(
            QJsonDocument(QJsonArray::fromStringList(ids)).toJson(QJsonDocument::Indented));
        return report;
    }
    report.output = ids.isEmpty() ? QString{} : ids.join(QLatin1Char('\n')) + QLatin1Char('\n');
    return report;
}

} // namespace keel::cli
