#pragma once

#include <QString>
#include <QStringList>

namespace keel::cli {

struct IdsOptions {
    bool json = false;
    int count = 1;
};

struct IdsReport {
    QString output;
    bool ok = true;
};

// One line per argument: "ok <text>" or "error <kind>: <message>".
// JSON output: [{ "input", "ok", "value"? , "kind"?, "error"? }]
[[nodiscard]] IdsReport check_strings(const QStringList& inputs, const IdsOptions& options = {});

// Same shape as check_strings, with the canonical GUID text as the value.
[[nodiscard]] IdsReport normalize_guids(const QStringList& inputs, const IdsOptions& options = {});

// options.count freshly generated GUIDs; JSON output is an array of strings.
[[nodiscard]] IdsReport generate_guids(const IdsOptions& options = {});

} // namespace keel::cli
