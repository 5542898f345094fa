#pragma once

#include <optional>

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>
#include <QTimeZone>

#include "common/models.hpp"

namespace timeledger {

// Resolves user-facing time arguments into concrete bounds before anything
// reaches ReportEngine. "today" and time-only values are relative to the
// reference instant given at construction.
class RangeParser
{
public:
    struct ParsedTime {
        QDate date;
        std::optional<QTime> time;
    };

    RangeParser(QTimeZone zone, QDateTime reference);

    // "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DD HH:MM", "YYYY-MM-DD HH", "YYYY-MM-DD",
    // "HH:MM:SS", "HH:MM", "HH".
    std::optional<ParsedTime> parse(const QString &value) const;

    // Instant for start/stop --at. A date without a time means midnight.
    std::optional<TimePoint> parseInstant(const QString &value) const;

    // filter: empty or "today", "week", "all", or a description fragment.
    // When defaultAll is set and neither bounds nor "today" are given, the
    // range stays unbounded.
    std::optional<ReportQuery> resolve(const QString &from,
                                       const QString &to,
                                       const QString &filter,
                                       bool defaultAll = false) const;

    TimePoint startOfDay(const QDate &date) const;
    QDate today() const;

private:
    TimePoint toTimePoint(const QDate &date, const QTime &time) const;

    QTimeZone m_zone;
    QDateTime m_reference;
};

} // namespace timeledger
