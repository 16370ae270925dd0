#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QTextStream>

#include "cli/ids.hpp"
#include "qt/logging.hpp"

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("keel-ids");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Keel");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Validate strings, normalize and generate identifiers."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption countOption(
        QStringList{QStringLiteral("n"), QStringLiteral("count")},
        QStringLiteral("Number of identifiers for 'new' (default 1)."),
        QStringLiteral("count"),
        QStringLiteral("1"));
    parser.addOption(countOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Log file path (sets KEEL_LOG_FILE for this run)."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("verbose")},
        QStringLiteral("Enable debug logging for keel.ids."));
    parser.addOption(verboseOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("One of 'check', 'guid', 'new'."));
    parser.addPositionalArgument(QStringLiteral("inputs"),
                                 QStringLiteral("Texts to check or parse."),
                                 QStringLiteral("[inputs...]"));
    parser.process(app);

    if (parser.isSet(logFileOption)) {
        qputenv("KEEL_LOG_FILE", parser.value(logFileOption).toUtf8());
    }
    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("keel.ids.debug=true\n"));
    }

    keel::qt::install_file_logging();
    qCDebug(lcKeelIds) << "logging to" << keel::qt::default_log_file_path();

    auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const auto command = positional.takeFirst();

    keel::cli::IdsOptions options;
    options.json = parser.isSet(jsonOption);

    keel::cli::IdsReport report;
    if (command == QStringLiteral("check")) {
        report = keel::cli::check_strings(positional, options);
    } else if (command == QStringLiteral("guid")) {
        report = keel::cli::normalize_guids(positional, options);
    } else if (command == QStringLiteral("new")) {
        bool parsed = false;
        options.count = parser.value(countOption).toInt(&parsed);
        if (!parsed || options.count < 0) {
            qCCritical(lcKeelIds) << "invalid --count:" << parser.value(countOption);
            return 2;
        }
        report = keel::cli::generate_guids(options);
    } else {
        qCCritical(lcKeelIds) << "unknown command:" << command;
        return 2;
    }

    QTextStream(stdout) << report.output;
    return report.ok ? 0 : 1;
}
