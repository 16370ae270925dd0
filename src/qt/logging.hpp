#pragma once

#include <QLoggingCategory>
#include <QString>
#include <QtGlobal>

Q_DECLARE_LOGGING_CATEGORY(lcKeelIds)

namespace keel::qt {

// Installs a Qt message handler that writes
// "<UTC ISO-8601 ms> <level> <category> <message>" lines to the log file
// and mirrors them to stderr. Returns the previously installed handler.
QtMessageHandler install_file_logging();

// KEEL_LOG_FILE if set, else <AppLocalDataLocation>/logs/keel.log.
// May be empty if neither is available.
QString default_log_file_path();

} // namespace keel::qt
