#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "common/settings.hpp"

class SettingsTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testDefaults();
    void testConfigFile();
    void testEnvironmentOverride();
    void testInvalidConfigFallsBack();
    void testExpandHome();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString writeConfig(const QByteArray &content) const;
};

void SettingsTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("TIMELEDGER_DATA_FILE");
}

void SettingsTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString SettingsTests::writeConfig(const QByteArray &content) const
{
    const QString path = m_tempDir.path() + QStringLiteral("/config.json");
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
    return path;
}

void SettingsTests::testDefaults()
{
    const auto settings = timeledger::Settings::load(m_tempDir.path() + "/missing.json");
    QCOMPARE(settings.dataFile,
             m_tempDir.path() + QStringLiteral("/.local/share/timeledger/entries.jsonl"));
    QVERIFY(!settings.autoInsertStop);
    QCOMPARE(settings.dailyGoal.hours, 8);
    QCOMPARE(settings.weeklyGoal.hours, 40);
}

void SettingsTests::testConfigFile()
{
    const QString path = writeConfig(
        "{\"dataFile\": \"~/tracking.jsonl\", \"autoInsertStop\": true,"
        " \"timeGoal\": {\"daily\": {\"hours\": 7, \"minutes\": 30},"
        " \"weekly\": {\"hours\": 37, \"minutes\": 30}}}");

    const auto settings = timeledger::Settings::load(path);
    QCOMPARE(settings.dataFile, m_tempDir.path() + QStringLiteral("/tracking.jsonl"));
    QVERIFY(settings.autoInsertStop);
    QCOMPARE(settings.dailyGoal.hours, 7);
    QCOMPARE(settings.dailyGoal.minutes, 30);
    QCOMPARE(settings.weeklyGoal.hours, 37);
    QVERIFY(settings.weeklyGoal.asMinutes() == std::chrono::minutes(37 * 60 + 30));
}

void SettingsTests::testEnvironmentOverride()
{
    const QString path = writeConfig("{\"dataFile\": \"/from/config.jsonl\"}");
    qputenv("TIMELEDGER_DATA_FILE", "/from/env.jsonl");
    const auto settings = timeledger::Settings::load(path);
    qunsetenv("TIMELEDGER_DATA_FILE");

    QCOMPARE(settings.dataFile, QStringLiteral("/from/env.jsonl"));
}

void SettingsTests::testInvalidConfigFallsBack()
{
    const QString path = writeConfig("{ not json");
    const auto settings = timeledger::Settings::load(path);
    QVERIFY(!settings.autoInsertStop);
    QCOMPARE(settings.dataFile, timeledger::Settings::defaultDataFile());
}

void SettingsTests::testExpandHome()
{
    QCOMPARE(timeledger::Settings::expandHome(QStringLiteral("~/a/b")),
             m_tempDir.path() + QStringLiteral("/a/b"));
    QCOMPARE(timeledger::Settings::expandHome(QStringLiteral("/abs")), QStringLiteral("/abs"));
}

QTEST_MAIN(SettingsTests)
#include "test_settings.moc"
