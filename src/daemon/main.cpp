#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "daemon/rulecast_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("rulecast-daemon"));
    qInfo() << "Rulecast daemon starting...";

    rulecast::RulecastConfig config = rulecast::loadConfigFromEnvironment();
    const QStringList unknown = rulecast::applyCommandLine(config, app.arguments());
    for (const QString &arg : unknown) {
        qWarning() << "Ignoring unknown argument" << arg;
    }

    rulecast::logging::initLogging(QStringLiteral("rulecast-daemon"), config.traceEnabled);
    rulecast::logging::setMinimumLevel(config.logLevel);
    RLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("daemon_start"),
              QStringLiteral("user_start"),
              QStringLiteral("environment_config"),
              rulecast::logging::defaultWho(),
              QString(),
              nlohmann::json::object());

    // The daemon lives for the lifetime of the process.
    rulecast::RulecastDaemon daemon(config);
    if (!daemon.start()) {
        return 1;
    }

    const int rc = app.exec();
    rulecast::logging::shutdownLogging();
    return rc;
}
