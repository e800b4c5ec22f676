#include "common/config.hpp"

#include <QDebug>
#include <QStandardPaths>

#include <unistd.h>

#include <algorithm>
#include <limits>

namespace rulecast {

namespace {

// QTimer intervals are int milliseconds.
constexpr qint64 kMaxTimerIntervalMs = std::numeric_limits<int>::max();

bool readPositiveMs(const char *name,
                    std::chrono::milliseconds &out,
                    qint64 maxValue = std::numeric_limits<qint64>::max())
{
    if (!qEnvironmentVariableIsSet(name)) {
        return true;
    }
    bool ok = false;
    const qint64 value = qEnvironmentVariable(name).toLongLong(&ok);
    if (!ok || value <= 0) {
        qWarning() << "Rulecast: ignoring invalid" << name << "="
                   << qEnvironmentVariable(name);
        return false;
    }
    if (value > maxValue) {
        qWarning() << "Rulecast: clamping" << name << "to" << maxValue;
    }
    out = std::chrono::milliseconds(std::min(value, maxValue));
    return true;
}

} // namespace

RulecastConfig loadConfigFromEnvironment()
{
    RulecastConfig config;

    config.socketName = qEnvironmentVariable("RULECAST_SOCKET_NAME");
    config.traceEnabled = qEnvironmentVariableIntValue("RULECAST_TRACE") == 1;

    const QString level = qEnvironmentVariable("RULECAST_LOG_LEVEL");
    if (!level.isEmpty()) {
        if (const auto parsed = logging::parseLogLevel(level)) {
            config.logLevel = *parsed;
        } else {
            qWarning() << "Rulecast: unknown RULECAST_LOG_LEVEL" << level;
        }
    }

    readPositiveMs("RULECAST_HEARTBEAT_MS", config.heartbeatInterval, kMaxTimerIntervalMs);
    readPositiveMs("RULECAST_CLEANUP_INTERVAL_MS", config.cleanupInterval, kMaxTimerIntervalMs);
    readPositiveMs("RULECAST_SUBSCRIPTION_MAX_AGE_MS", config.subscriptionMaxAge);

    if (qEnvironmentVariableIsSet("RULECAST_SEND_QUEUE_CAPACITY")) {
        bool ok = false;
        const int capacity =
            qEnvironmentVariable("RULECAST_SEND_QUEUE_CAPACITY").toInt(&ok);
        if (ok && capacity > 0) {
            config.sendQueueCapacity = static_cast<std::size_t>(capacity);
        } else {
            qWarning() << "Rulecast: ignoring invalid RULECAST_SEND_QUEUE_CAPACITY";
        }
    }

    const QString overflow = qEnvironmentVariable("RULECAST_OVERFLOW_POLICY");
    if (overflow == QStringLiteral("drop-oldest")) {
        config.overflowPolicy = OverflowPolicy::DropOldest;
    } else if (!overflow.isEmpty() && overflow != QStringLiteral("disconnect")) {
        qWarning() << "Rulecast: unknown RULECAST_OVERFLOW_POLICY" << overflow;
    }

    const QString refresh = qEnvironmentVariable("RULECAST_AUTH_REFRESH");
    if (refresh == QStringLiteral("live")) {
        config.authRefresh = AuthRefreshPolicy::Live;
    } else if (!refresh.isEmpty() && refresh != QStringLiteral("snapshot")) {
        qWarning() << "Rulecast: unknown RULECAST_AUTH_REFRESH" << refresh;
    }

    return config;
}

QStringList applyCommandLine(RulecastConfig &config, const QStringList &args)
{
    QStringList unknown;
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--trace")) {
            config.traceEnabled = true;
        } else if (arg == QStringLiteral("--socket") && i + 1 < args.size()) {
            config.socketName = args.at(++i);
        } else if (arg == QStringLiteral("--log-level") && i + 1 < args.size()) {
            const QString value = args.at(++i);
            if (const auto parsed = logging::parseLogLevel(value)) {
                config.logLevel = *parsed;
            } else {
                unknown.push_back(arg + QLatin1Char('=') + value);
            }
        } else {
            unknown.push_back(arg);
        }
    }
    return unknown;
}

QString defaultSocketPath()
{
    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/rulecast.sock");
}

} // namespace rulecast
