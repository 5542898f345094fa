#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testIso8601Format();
    void testIso8601RejectsMalformed();
    void testIso8601BeforeEpoch();
    void testFloorToSeconds();
    void testEntryJsonShape();
    void testEntryFromJsonRejectsBadRecords();
    void testTimeRangeHalfOpen();
    void testErrorKindStrings();
};

void ModelsJsonTests::testIso8601Format()
{
    const auto parsed = timeledger::parseIso8601Utc("2024-03-04T09:05:07Z");
    QVERIFY(parsed.has_value());
    QCOMPARE(timeledger::toEpochSeconds(*parsed), static_cast<std::int64_t>(1709543107));
    QCOMPARE(QString::fromStdString(timeledger::toIso8601Utc(*parsed)),
             QStringLiteral("2024-03-04T09:05:07Z"));
}

void ModelsJsonTests::testIso8601RejectsMalformed()
{
    QVERIFY(!timeledger::parseIso8601Utc("").has_value());
    QVERIFY(!timeledger::parseIso8601Utc("2024-03-04").has_value());
    QVERIFY(!timeledger::parseIso8601Utc("2024-02-30T00:00:00Z").has_value());
    QVERIFY(!timeledger::parseIso8601Utc("2024-03-04T09:05:07Z trailing").has_value());
    QVERIFY(!timeledger::parseIso8601Utc("yesterday").has_value());
}

void ModelsJsonTests::testIso8601BeforeEpoch()
{
    const auto lastSecond = timeledger::parseIso8601Utc("1969-12-31T23:59:59Z");
    QVERIFY(lastSecond.has_value());
    QCOMPARE(timeledger::toEpochSeconds(*lastSecond), static_cast<std::int64_t>(-1));

    const auto earlier = timeledger::parseIso8601Utc("1969-07-20T20:17:40Z");
    QVERIFY(earlier.has_value());
    QCOMPARE(QString::fromStdString(timeledger::toIso8601Utc(*earlier)),
             QStringLiteral("1969-07-20T20:17:40Z"));
}

void ModelsJsonTests::testFloorToSeconds()
{
    const auto base = *timeledger::parseIso8601Utc("2024-03-04T09:05:07Z");
    const auto withMillis = base + std::chrono::milliseconds(999);
    QVERIFY(timeledger::floorToSeconds(withMillis) == base);
}

void ModelsJsonTests::testEntryJsonShape()
{
    timeledger::Entry open{"open", *timeledger::parseIso8601Utc("2024-03-04T09:00:00Z"),
                           std::nullopt};
    const nlohmann::json j = open;
    QCOMPARE(QString::fromStdString(j.at("description").get<std::string>()),
             QStringLiteral("open"));
    QVERIFY(j.at("end").is_null());

    const auto parsed = j.get<timeledger::Entry>();
    QVERIFY(parsed == open);

    nlohmann::json withoutEnd = {{"description", "x"}, {"start", "2024-03-04T09:00:00Z"}};
    QVERIFY(!withoutEnd.get<timeledger::Entry>().end.has_value());
}

void ModelsJsonTests::testEntryFromJsonRejectsBadRecords()
{
    const nlohmann::json notObject = 42;
    QVERIFY_EXCEPTION_THROWN(notObject.get<timeledger::Entry>(), timeledger::LedgerError);

    const nlohmann::json badEnd = {{"description", "x"},
                                   {"start", "2024-03-04T09:00:00Z"},
                                   {"end", 17}};
    try {
        badEnd.get<timeledger::Entry>();
        QFAIL("expected CorruptStore");
    } catch (const timeledger::LedgerError &error) {
        QCOMPARE(error.kind(), timeledger::ErrorKind::CorruptStore);
    }
}

void ModelsJsonTests::testTimeRangeHalfOpen()
{
    const auto from = *timeledger::parseIso8601Utc("2024-03-04T00:00:00Z");
    const auto to = *timeledger::parseIso8601Utc("2024-03-05T00:00:00Z");
    timeledger::TimeRange range{from, to};
    QVERIFY(range.contains(from));
    QVERIFY(!range.contains(to));
    QVERIFY(range.contains(to - std::chrono::seconds(1)));

    const timeledger::TimeRange unbounded;
    QVERIFY(unbounded.contains(from));
}

void ModelsJsonTests::testErrorKindStrings()
{
    QCOMPARE(QString::fromStdString(
                 timeledger::toErrorKindString(timeledger::ErrorKind::AlreadyTracking)),
             QStringLiteral("already_tracking"));
    QCOMPARE(QString::fromStdString(
                 timeledger::toErrorKindString(timeledger::ErrorKind::CorruptStore)),
             QStringLiteral("corrupt_store"));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
