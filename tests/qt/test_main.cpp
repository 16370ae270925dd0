#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>
#include <catch2/catch_session.hpp>

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("keel");
    QCoreApplication::setApplicationName("keel_qt_tests");
    const auto testHome = QDir::tempPath() + QStringLiteral("/keel_qt_tests_home");
    QDir().mkpath(testHome);
    qputenv("HOME", testHome.toUtf8());
    qunsetenv("KEEL_LOG_FILE");
    QStandardPaths::setTestModeEnabled(true);
    Catch::Session session;
    return session.run(argc, argv);
}
