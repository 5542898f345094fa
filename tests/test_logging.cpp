#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace logging = timeledger::logging;

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testEventIsOneJsonLine();
    void testScopeSuppliesCorrelationId();
    void testDebugNeedsTrace();
    void testTraceMirrorsEvents();
    void testLevelFromEnvironment();
    void testParseLogLevel();
    void testLogDirOverride();
    void testRotation();
    void testInvalidUtf8ContextIsReplaced();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logFile(const QString &suffix = QStringLiteral(".log")) const;
    QList<nlohmann::json> readEvents(const QString &path) const;
    void emitEvent(logging::LogLevel level, const QString &what,
                   const QString &corr = QString()) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("TIMELEDGER_LOG_DIR");
    qunsetenv("TIMELEDGER_LOG_LEVEL");
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void LoggingTests::init()
{
    QDir(m_tempDir.path() + QStringLiteral("/.local/share/timeledger/logs")).removeRecursively();
    logging::initLogging(QStringLiteral("ledger-test"), false);
}

QString LoggingTests::logFile(const QString &suffix) const
{
    return m_tempDir.path() + QStringLiteral("/.local/share/timeledger/logs/ledger-test") + suffix;
}

QList<nlohmann::json> LoggingTests::readEvents(const QString &path) const
{
    QList<nlohmann::json> events;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return events;
    }
    for (const QByteArray &line : file.readAll().split('\n')) {
        if (!line.trimmed().isEmpty()) {
            events.push_back(nlohmann::json::parse(line.toStdString()));
        }
    }
    return events;
}

void LoggingTests::emitEvent(logging::LogLevel level, const QString &what,
                             const QString &corr) const
{
    logging::logEvent(level,
                      QStringLiteral("ledger-test"),
                      QStringLiteral("LoggingTests"),
                      QStringLiteral("emitEvent"),
                      what,
                      QStringLiteral("unit_test"),
                      QStringLiteral("direct_call"),
                      logging::defaultWho(),
                      corr,
                      nlohmann::json{{"entries", 3}});
}

void LoggingTests::testEventIsOneJsonLine()
{
    emitEvent(logging::LogLevel::Info, QStringLiteral("entries_loaded"),
              QStringLiteral("corr-1"));

    const auto events = readEvents(logFile());
    QCOMPARE(static_cast<int>(events.size()), 1);
    const auto &event = events.first();
    QCOMPARE(QString::fromStdString(event.value("what", "")), QStringLiteral("entries_loaded"));
    QCOMPARE(QString::fromStdString(event.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(event.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(event["context"].value("entries", 0), 3);
    for (const char *field : {"ts", "process", "thread", "component", "where", "why", "how", "who"}) {
        QVERIFY2(event.contains(field), field);
    }
}

void LoggingTests::testScopeSuppliesCorrelationId()
{
    logging::setCorrelationId(QStringLiteral("outer"));
    {
        logging::CorrelationScope scope(QStringLiteral("invocation-7"));
        QCOMPARE(logging::currentCorrelationId(), QStringLiteral("invocation-7"));
        emitEvent(logging::LogLevel::Warn, QStringLiteral("scoped"));
    }
    QCOMPARE(logging::currentCorrelationId(), QStringLiteral("outer"));
    logging::setCorrelationId(QString());

    const auto events = readEvents(logFile());
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(QString::fromStdString(events.first().value("corr", "")),
             QStringLiteral("invocation-7"));
}

void LoggingTests::testDebugNeedsTrace()
{
    QVERIFY(!logging::isTraceEnabled());
    emitEvent(logging::LogLevel::Debug, QStringLiteral("hidden"));
    QVERIFY(!QFile::exists(logFile()));
    QVERIFY(!QFile::exists(logFile(QStringLiteral("-trace.log"))));
}

void LoggingTests::testTraceMirrorsEvents()
{
    logging::initLogging(QStringLiteral("ledger-test"), true);
    QCOMPARE(logging::minimumLevel(), logging::LogLevel::Debug);

    emitEvent(logging::LogLevel::Debug, QStringLiteral("traced"));
    emitEvent(logging::LogLevel::Error, QStringLiteral("failed"));

    QCOMPARE(static_cast<int>(readEvents(logFile()).size()), 2);
    const auto traced = readEvents(logFile(QStringLiteral("-trace.log")));
    QCOMPARE(static_cast<int>(traced.size()), 2);
    QCOMPARE(QString::fromStdString(traced.first().value("what", "")), QStringLiteral("traced"));
}

void LoggingTests::testLevelFromEnvironment()
{
    qputenv("TIMELEDGER_LOG_LEVEL", "warn");
    logging::initLogging(QStringLiteral("ledger-test"), false);
    qunsetenv("TIMELEDGER_LOG_LEVEL");
    QCOMPARE(logging::minimumLevel(), logging::LogLevel::Warn);

    emitEvent(logging::LogLevel::Info, QStringLiteral("below_threshold"));
    emitEvent(logging::LogLevel::Warn, QStringLiteral("at_threshold"));

    const auto events = readEvents(logFile());
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(QString::fromStdString(events.first().value("what", "")),
             QStringLiteral("at_threshold"));
}

void LoggingTests::testParseLogLevel()
{
    QCOMPARE(logging::parseLogLevel(QStringLiteral(" DEBUG ")).value(), logging::LogLevel::Debug);
    QCOMPARE(logging::parseLogLevel(QStringLiteral("warning")).value(), logging::LogLevel::Warn);
    QVERIFY(!logging::parseLogLevel(QStringLiteral("verbose")).has_value());
    QCOMPARE(logging::logLevelName(logging::LogLevel::Error), QStringLiteral("ERROR"));
}

void LoggingTests::testLogDirOverride()
{
    const QString dir = m_tempDir.path() + QStringLiteral("/custom-logs");
    qputenv("TIMELEDGER_LOG_DIR", dir.toUtf8());
    QCOMPARE(logging::logsDirPath(), dir);
    emitEvent(logging::LogLevel::Info, QStringLiteral("elsewhere"));
    qunsetenv("TIMELEDGER_LOG_DIR");

    QCOMPARE(static_cast<int>(readEvents(dir + QStringLiteral("/ledger-test.log")).size()), 1);
    QVERIFY(!QFile::exists(logFile()));
}

void LoggingTests::testRotation()
{
    QVERIFY(QDir().mkpath(logging::logsDirPath()));
    {
        QFile big(logFile());
        QVERIFY(big.open(QIODevice::WriteOnly));
        big.write(QByteArray(5 * 1024 * 1024, 'x'));
    }

    emitEvent(logging::LogLevel::Info, QStringLiteral("after_rotation"));

    QCOMPARE(QFileInfo(logFile(QStringLiteral(".log.1"))).size(),
             static_cast<qint64>(5 * 1024 * 1024));
    const auto events = readEvents(logFile());
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(QString::fromStdString(events.first().value("what", "")),
             QStringLiteral("after_rotation"));
}

void LoggingTests::testInvalidUtf8ContextIsReplaced()
{
    logging::logEvent(logging::LogLevel::Error,
                      QStringLiteral("ledger-test"),
                      QStringLiteral("LoggingTests"),
                      QStringLiteral("testInvalidUtf8ContextIsReplaced"),
                      QStringLiteral("raw_bytes"),
                      QStringLiteral("unit_test"),
                      QStringLiteral("direct_call"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"message", std::string("caf\xff")}});

    const auto events = readEvents(logFile());
    QCOMPARE(static_cast<int>(events.size()), 1);
    const std::string message = events.first()["context"].value("message", "");
    QCOMPARE(QString::fromStdString(message), QStringLiteral("caf\uFFFD"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
