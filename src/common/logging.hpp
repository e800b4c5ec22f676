#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace rulecast::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Tracing writes debug events and mirrors every line to <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

// Closes the cached log files. Later events reopen them.
void shutdownLogging();

bool isTraceEnabled();

// Events below the minimum level are dropped (default Info). Debug events
// are only written while tracing is on.
void setMinimumLevel(LogLevel level);
LogLevel minimumLevel();
std::optional<LogLevel> parseLogLevel(const QString &value);
bool isLevelEnabled(LogLevel level);

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();
QString logsDirPath();

} // namespace rulecast::logging

#define RLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::rulecast::logging::logEvent(::rulecast::logging::LogLevel::Debug, \
                                  ::rulecast::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define RLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::rulecast::logging::logEvent(::rulecast::logging::LogLevel::Info, \
                                  ::rulecast::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define RLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::rulecast::logging::logEvent(::rulecast::logging::LogLevel::Warn, \
                                  ::rulecast::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define RLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::rulecast::logging::logEvent(::rulecast::logging::LogLevel::Error, \
                                  ::rulecast::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
