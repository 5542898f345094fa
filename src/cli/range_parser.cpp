#include "cli/range_parser.hpp"

#include <utility>

#include <QStringList>

#include "common/json_utils.hpp"

namespace timeledger {

namespace {

std::optional<QTime> parseTimeOfDay(const QString &value)
{
    const QStringList formats = {
        QStringLiteral("H:m:s"),
        QStringLiteral("H:m"),
        QStringLiteral("H"),
    };
    for (const QString &format : formats) {
        const QTime time = QTime::fromString(value, format);
        if (time.isValid()) {
            return time;
        }
    }
    return std::nullopt;
}

} // namespace

RangeParser::RangeParser(QTimeZone zone, QDateTime reference)
    : m_zone(std::move(zone))
    , m_reference(reference.toTimeZone(m_zone))
{
}

std::optional<RangeParser::ParsedTime> RangeParser::parse(const QString &value) const
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }

    const QStringList parts = trimmed.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.size() == 2) {
        const QDate date = QDate::fromString(parts.at(0), QStringLiteral("yyyy-MM-dd"));
        const auto time = parseTimeOfDay(parts.at(1));
        if (!date.isValid() || !time.has_value()) {
            return std::nullopt;
        }
        return ParsedTime{date, time};
    }
    if (parts.size() != 1) {
        return std::nullopt;
    }

    const QDate date = QDate::fromString(trimmed, QStringLiteral("yyyy-MM-dd"));
    if (date.isValid()) {
        return ParsedTime{date, std::nullopt};
    }

    const auto time = parseTimeOfDay(trimmed);
    if (time.has_value()) {
        return ParsedTime{today(), time};
    }
    return std::nullopt;
}

std::optional<TimePoint> RangeParser::parseInstant(const QString &value) const
{
    const auto parsed = parse(value);
    if (!parsed.has_value()) {
        return std::nullopt;
    }
    return toTimePoint(parsed->date, parsed->time.value_or(QTime(0, 0)));
}

std::optional<ReportQuery> RangeParser::resolve(const QString &from,
                                                const QString &to,
                                                const QString &filter,
                                                bool defaultAll) const
{
    ReportQuery query;

    if (filter == QStringLiteral("all")) {
        return query;
    }

    if (filter == QStringLiteral("week")) {
        const QDate monday = today().addDays(1 - today().dayOfWeek());
        query.range.from = startOfDay(monday);
        query.range.to = startOfDay(monday.addDays(7));
        return query;
    }

    if (!filter.isEmpty() && filter != QStringLiteral("today")) {
        query.descriptionFilter = filter.toStdString();
    }

    if (defaultAll && from.isEmpty() && to.isEmpty() && filter != QStringLiteral("today")) {
        return query;
    }

    ParsedTime fromValue{today(), std::nullopt};
    if (!from.isEmpty()) {
        const auto parsed = parse(from);
        if (!parsed.has_value()) {
            return std::nullopt;
        }
        fromValue = *parsed;
    }
    query.range.from = toTimePoint(fromValue.date, fromValue.time.value_or(QTime(0, 0)));

    if (to.isEmpty()) {
        query.range.to = startOfDay(fromValue.date.addDays(1));
    } else {
        const auto parsed = parse(to);
        if (!parsed.has_value()) {
            return std::nullopt;
        }
        if (parsed->time.has_value()) {
            query.range.to = toTimePoint(parsed->date, *parsed->time);
        } else {
            query.range.to = startOfDay(parsed->date.addDays(1));
        }
    }

    return query;
}

TimePoint RangeParser::startOfDay(const QDate &date) const
{
    return toTimePoint(date, QTime(0, 0));
}

QDate RangeParser::today() const
{
    return m_reference.date();
}

TimePoint RangeParser::toTimePoint(const QDate &date, const QTime &time) const
{
    return fromEpochSeconds(QDateTime(date, time, m_zone).toSecsSinceEpoch());
}

} // namespace timeledger
