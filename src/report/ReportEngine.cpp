#include "report/ReportEngine.hpp"

#include <map>
#include <utility>

#include <QDateTime>
#include <QStringList>

#include "common/json_utils.hpp"

namespace timeledger {

namespace {

TimePoint truncateToMinute(TimePoint timestamp)
{
    return std::chrono::time_point_cast<std::chrono::minutes>(timestamp);
}

bool matchesDescription(const Entry &entry, const ReportQuery &query)
{
    if (!query.descriptionFilter.has_value()) {
        return true;
    }
    return entry.description.find(*query.descriptionFilter) != std::string::npos;
}

QString padded(long long value)
{
    return QStringLiteral("%1").arg(value, 2, 10, QLatin1Char('0'));
}

} // namespace

ReportEngine::ReportEngine()
    : m_zone(QTimeZone::systemTimeZone())
{
}

ReportEngine::ReportEngine(QTimeZone zone)
    : m_zone(std::move(zone))
{
}

std::vector<Entry> ReportEngine::select(const std::vector<Entry> &entries,
                                        const ReportQuery &query) const
{
    std::vector<Entry> selected;
    for (const auto &entry : entries) {
        if (query.range.contains(entry.start) && matchesDescription(entry, query)) {
            selected.push_back(entry);
        }
    }
    return selected;
}

ShowReport ReportEngine::show(const std::vector<Entry> &entries,
                              const ReportQuery &query,
                              TimePoint now) const
{
    std::map<QDate, std::chrono::seconds> perDay;
    ShowReport report;

    for (const auto &entry : select(entries, query)) {
        const auto value = duration(entry, now, query.includeSeconds);
        perDay[dayOf(entry.start)] += value;
        report.grandTotal += value;
        ++report.entryCount;
    }

    report.days.reserve(perDay.size());
    for (const auto &[day, total] : perDay) {
        report.days.push_back(DayTotal{day, total});
    }
    return report;
}

nlohmann::json ReportEngine::exportEntries(const std::vector<Entry> &entries,
                                           const ReportQuery &query,
                                           TimePoint now) const
{
    nlohmann::json payload = nlohmann::json::array();
    for (const auto &entry : select(entries, query)) {
        nlohmann::json record = entry;
        record["durationSeconds"] =
            EntryStore::elapsed(entry, now).count();
        payload.push_back(std::move(record));
    }
    return payload;
}

QString ReportEngine::exportReadable(const std::vector<Entry> &entries,
                                     const ReportQuery &query) const
{
    QStringList lines;
    for (const auto &entry : select(entries, query)) {
        const QString end = entry.end.has_value()
            ? formatLocal(*entry.end)
            : QStringLiteral("running");
        lines << QStringLiteral("\"%1\" %2 -> %3")
                     .arg(QString::fromStdString(entry.description),
                          formatLocal(entry.start),
                          end);
    }
    return lines.join(QLatin1Char('\n'));
}

std::vector<ListRow> ReportEngine::list(const EntryStore &store,
                                        const ReportQuery &query,
                                        TimePoint now) const
{
    std::vector<ListRow> rows;
    for (auto &row : store.list(now)) {
        if (query.range.contains(row.entry.start) && matchesDescription(row.entry, query)) {
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

std::chrono::seconds ReportEngine::duration(const Entry &entry,
                                            TimePoint now,
                                            bool includeSeconds) const
{
    TimePoint start = entry.start;
    TimePoint end = entry.end.value_or(floorToSeconds(now));
    if (!includeSeconds) {
        start = truncateToMinute(start);
        end = truncateToMinute(end);
    }
    if (end < start) {
        return std::chrono::seconds{0};
    }
    return std::chrono::duration_cast<std::chrono::seconds>(end - start);
}

QDate ReportEngine::dayOf(TimePoint timestamp) const
{
    return QDateTime::fromSecsSinceEpoch(toEpochSeconds(timestamp), m_zone).date();
}

QString ReportEngine::formatLocal(TimePoint timestamp) const
{
    return QDateTime::fromSecsSinceEpoch(toEpochSeconds(timestamp), m_zone)
        .toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"));
}

std::chrono::seconds ReportEngine::remaining(std::chrono::seconds total, const TimeGoal &goal)
{
    return std::chrono::duration_cast<std::chrono::seconds>(goal.asMinutes()) - total;
}

QString ReportEngine::formatDuration(std::chrono::seconds value, const QString &pattern)
{
    const bool negative = value.count() < 0;
    const long long totalSeconds = negative ? -value.count() : value.count();
    const long long hours = totalSeconds / 3600;
    const long long minutes = (totalSeconds % 3600) / 60;
    const long long seconds = totalSeconds % 60;

    QString out = pattern;
    out.replace(QStringLiteral("{hh}"), padded(hours));
    out.replace(QStringLiteral("{mm}"), padded(minutes));
    out.replace(QStringLiteral("{ss}"), padded(seconds));
    out.replace(QStringLiteral("{h}"), QString::number(hours));
    out.replace(QStringLiteral("{m}"), QString::number(minutes));
    out.replace(QStringLiteral("{s}"), QString::number(seconds));
    if (negative) {
        out.prepend(QLatin1Char('-'));
    }
    return out;
}

} // namespace timeledger
