#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>
#include <QFileInfo>
#include <QDir>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugDroppedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testMinimumLevel();
    void testRotation();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
    static void writeEvent(rulecast::logging::LogLevel level,
                           const QString &process,
                           const QString &what);
};

void LoggingTests::writeEvent(rulecast::logging::LogLevel level,
                              const QString &process,
                              const QString &what)
{
    rulecast::logging::logEvent(level,
                                process,
                                QStringLiteral("Test"),
                                QStringLiteral("writeEvent"),
                                what,
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                rulecast::logging::defaultWho(),
                                QString(),
                                nlohmann::json::object());
}

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    rulecast::logging::shutdownLogging();
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/rulecast/logs/rulecast-test" + suffix;
}

void LoggingTests::testLogEventWrites()
{
    rulecast::logging::initLogging(QStringLiteral("rulecast-test"), false);

    rulecast::logging::logEvent(rulecast::logging::LogLevel::Info,
                                QStringLiteral("rulecast-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testLogEventWrites"),
                                QStringLiteral("test_log"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                rulecast::logging::defaultWho(),
                                QStringLiteral("corr-1"),
                                nlohmann::json{{"key", "value"}});

    QFile file(logPath(QStringLiteral(".log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
}

void LoggingTests::testDebugDroppedWithoutTrace()
{
    rulecast::logging::initLogging(QStringLiteral("rulecast-test"), false);
    QVERIFY(!rulecast::logging::isTraceEnabled());

    const QFileInfo info(logPath(QStringLiteral(".log")));
    const qint64 before = info.exists() ? info.size() : 0;

    rulecast::logging::logEvent(rulecast::logging::LogLevel::Debug,
                                QStringLiteral("rulecast-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testDebugDroppedWithoutTrace"),
                                QStringLiteral("test_debug"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                rulecast::logging::defaultWho(),
                                QString(),
                                nlohmann::json::object());

    const QFileInfo refreshed(logPath(QStringLiteral(".log")));
    const qint64 after = refreshed.exists() ? refreshed.size() : 0;
    QCOMPARE(after, before);
}

void LoggingTests::testTraceWrites()
{
    rulecast::logging::initLogging(QStringLiteral("rulecast-test"), true);

    rulecast::logging::logEvent(rulecast::logging::LogLevel::Debug,
                                QStringLiteral("rulecast-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testTraceWrites"),
                                QStringLiteral("test_trace"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                rulecast::logging::defaultWho(),
                                QStringLiteral("corr-2"),
                                nlohmann::json::object());

    QFile file(logPath(QStringLiteral("-trace.log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());
}

void LoggingTests::testCorrelationScope()
{
    QVERIFY(rulecast::logging::currentCorrelationId().isEmpty());
    {
        rulecast::logging::CorrelationScope outer(QStringLiteral("outer"));
        QCOMPARE(rulecast::logging::currentCorrelationId(), QStringLiteral("outer"));
        {
            rulecast::logging::CorrelationScope inner(QStringLiteral("inner"));
            QCOMPARE(rulecast::logging::currentCorrelationId(), QStringLiteral("inner"));
        }
        QCOMPARE(rulecast::logging::currentCorrelationId(), QStringLiteral("outer"));
    }
    QVERIFY(rulecast::logging::currentCorrelationId().isEmpty());
}

void LoggingTests::testMinimumLevel()
{
    rulecast::logging::initLogging(QStringLiteral("rulecast-test"), false);
    rulecast::logging::setMinimumLevel(rulecast::logging::LogLevel::Warn);
    QVERIFY(!rulecast::logging::isLevelEnabled(rulecast::logging::LogLevel::Info));
    QVERIFY(rulecast::logging::isLevelEnabled(rulecast::logging::LogLevel::Error));

    const qint64 before = QFileInfo(logPath(QStringLiteral(".log"))).size();
    writeEvent(rulecast::logging::LogLevel::Info, QStringLiteral("rulecast-test"),
               QStringLiteral("below_threshold"));
    QCOMPARE(QFileInfo(logPath(QStringLiteral(".log"))).size(), before);

    writeEvent(rulecast::logging::LogLevel::Error, QStringLiteral("rulecast-test"),
               QStringLiteral("above_threshold"));
    QVERIFY(QFileInfo(logPath(QStringLiteral(".log"))).size() > before);

    rulecast::logging::setMinimumLevel(rulecast::logging::LogLevel::Info);
    QVERIFY(rulecast::logging::parseLogLevel(QStringLiteral("Warning")).has_value());
    QVERIFY(!rulecast::logging::parseLogLevel(QStringLiteral("verbose")).has_value());
}

void LoggingTests::testRotation()
{
    rulecast::logging::initLogging(QStringLiteral("rulecast-test"), false);

    const QString path = m_tempDir.path() + "/.local/share/rulecast/logs/rulecast-rotate.log";
    QVERIFY(QDir().mkpath(QFileInfo(path).absolutePath()));
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        QVERIFY(file.write(QByteArray(5 * 1024 * 1024, 'x')) > 0);
    }

    writeEvent(rulecast::logging::LogLevel::Info, QStringLiteral("rulecast-rotate"),
               QStringLiteral("after_rotation"));

    QVERIFY(QFileInfo::exists(path + QStringLiteral(".1")));
    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readLine().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("after_rotation"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
