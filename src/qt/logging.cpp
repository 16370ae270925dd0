#include "qt/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>

#include <cstdio>

Q_LOGGING_CATEGORY(lcKeelIds, "keel.ids", QtInfoMsg)

namespace keel::qt {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

// Reopens when KEEL_LOG_FILE changed since the last message.
void ensure_open(LoggerState& s) {
    const auto path = default_log_file_path();
    if (s.file.isOpen() && s.file.fileName() == path) {
        return;
    }
    s.file.close();
    if (path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "keel: cannot open log file %s: %s\n",
                     qPrintable(path), qPrintable(s.file.errorString()));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto utf8 = line.toUtf8();

    if (s.file.isOpen()) {
        s.file.write(utf8);
        s.file.flush();
    }
    std::fwrite(utf8.constData(), 1, static_cast<size_t>(utf8.size()), stderr);
}

} // namespace

QtMessageHandler install_file_logging() {
    // Our handler stamps time/level/category itself.
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    return qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    if (qEnvironmentVariableIsSet("KEEL_LOG_FILE")) {
        return qEnvironmentVariable("KEEL_LOG_FILE");
    }
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/keel.log"));
}

} // namespace keel::qt
