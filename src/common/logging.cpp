#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>

namespace rulecast::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

// An append-only log file kept open between events. The size is tracked
// locally so rotation does not stat the file on every line.
class LogFile {
public:
    explicit LogFile(QString path)
        : m_path(std::move(path))
        , m_file(m_path)
    {
    }

    bool append(const QByteArray &line)
    {
        if (!m_file.isOpen() && !open()) {
            return false;
        }
        if (m_size > 0 && m_size + line.size() + 1 > kMaxLogSizeBytes) {
            rotate();
            if (!open()) {
                return false;
            }
        }

        const qint64 written = m_file.write(line + '\n');
        if (written < 0) {
            m_file.close();
            return false;
        }
        m_file.flush();
        m_size += written;
        return true;
    }

    void close()
    {
        m_file.close();
    }

private:
    bool open()
    {
        QDir().mkpath(QFileInfo(m_path).absolutePath());
        if (!m_file.open(QIODevice::WriteOnly | QIODevice::Append)) {
            return false;
        }
        m_size = m_file.size();
        return true;
    }

    void rotate()
    {
        m_file.close();
        const QString rotated = m_path + QStringLiteral(".1");
        QFile::remove(rotated);
        QFile::rename(m_path, rotated);
        m_size = 0;
    }

    QString m_path;
    QFile m_file;
    qint64 m_size = 0;
};

struct LoggerState {
    std::mutex mutex;
    QString processName;
    std::map<QString, std::unique_ptr<LogFile>> files;
    std::atomic<bool> traceEnabled{false};
    std::atomic<int> minimumLevel{static_cast<int>(LogLevel::Info)};
};

LoggerState &state()
{
    static LoggerState instance;
    return instance;
}

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("rulecast")
        : processName;
    return logsDirPath() + QDir::separator() + base + suffix;
}

// Caller holds the state mutex.
void writeLine(LoggerState &logger, const QString &path, const QByteArray &line)
{
    auto &slot = logger.files[path];
    if (!slot) {
        slot = std::make_unique<LogFile>(path);
    }
    if (!slot->append(line)) {
        std::fprintf(stderr, "%s\n", line.constData());
    }
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/rulecast/logs");
    }
    return home + QStringLiteral("/.local/share/rulecast/logs");
}

void initLogging(const QString &processName, bool traceEnabled)
{
    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    logger.processName = processName;
    logger.traceEnabled = traceEnabled;
}

void shutdownLogging()
{
    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    for (auto &entry : logger.files) {
        entry.second->close();
    }
    logger.files.clear();
}

bool isTraceEnabled()
{
    return state().traceEnabled;
}

void setMinimumLevel(LogLevel level)
{
    state().minimumLevel = static_cast<int>(level);
}

LogLevel minimumLevel()
{
    return static_cast<LogLevel>(state().minimumLevel.load());
}

std::optional<LogLevel> parseLogLevel(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QStringLiteral("debug")) {
        return LogLevel::Debug;
    }
    if (normalized == QStringLiteral("info")) {
        return LogLevel::Info;
    }
    if (normalized == QStringLiteral("warn") || normalized == QStringLiteral("warning")) {
        return LogLevel::Warn;
    }
    if (normalized == QStringLiteral("error")) {
        return LogLevel::Error;
    }
    return std::nullopt;
}

bool isLevelEnabled(LogLevel level)
{
    const LoggerState &logger = state();
    if (logger.traceEnabled) {
        return true;
    }
    // Debug always needs tracing, whatever the threshold says.
    if (level == LogLevel::Debug) {
        return false;
    }
    return static_cast<int>(level) >= logger.minimumLevel;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        LoggerState &logger = state();
        std::lock_guard<std::mutex> lock(logger.mutex);
        if (!logger.processName.isEmpty()) {
            return logger.processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("rulecast");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    if (!isLevelEnabled(level)) {
        return;
    }

    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    // Record payloads are client data; invalid UTF-8 must not throw here.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;

    LoggerState &logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    writeLine(logger, logFilePath(process, QStringLiteral(".log")), line);
    if (logger.traceEnabled) {
        writeLine(logger, logFilePath(process, QStringLiteral("-trace.log")), line);
    }
}

} // namespace rulecast::logging
