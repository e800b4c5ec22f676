#pragma once

#include <chrono>
#include <cstddef>

#include <QString>
#include <QStringList>

#include "common/enums.hpp"
#include "common/logging.hpp"

namespace rulecast {

struct RulecastConfig {
    // Empty means $XDG_RUNTIME_DIR/rulecast.sock.
    QString socketName;
    std::chrono::milliseconds heartbeatInterval{30000};
    std::chrono::milliseconds cleanupInterval{60000};
    std::chrono::milliseconds subscriptionMaxAge{3600000};
    std::size_t sendQueueCapacity = 256;
    OverflowPolicy overflowPolicy = OverflowPolicy::Disconnect;
    AuthRefreshPolicy authRefresh = AuthRefreshPolicy::Snapshot;
    logging::LogLevel logLevel = logging::LogLevel::Info;
    bool traceEnabled = false;
};

// Reads RULECAST_* environment variables. Invalid values keep their defaults
// and are reported through qWarning().
RulecastConfig loadConfigFromEnvironment();

// Applies daemon command-line flags (--trace, --socket NAME, --log-level LEVEL)
// on top of config.
// args is the full argument list, program name first.
// Unrecognized arguments are returned for the caller to report.
QStringList applyCommandLine(RulecastConfig &config, const QStringList &args);

QString defaultSocketPath();

} // namespace rulecast
