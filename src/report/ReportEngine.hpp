#pragma once

#include <chrono>
#include <vector>

#include <QDate>
#include <QString>
#include <QTimeZone>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "ledger/entry_store.hpp"

namespace timeledger {

// Read-only aggregation over an entry sequence. Entries are selected by
// their start time only; durations are never clipped to the range, and a
// session crossing midnight counts toward the day it started.
class ReportEngine
{
public:
    ReportEngine();
    explicit ReportEngine(QTimeZone zone);

    std::vector<Entry> select(const std::vector<Entry> &entries,
                              const ReportQuery &query) const;

    ShowReport show(const std::vector<Entry> &entries,
                    const ReportQuery &query,
                    TimePoint now) const;

    // Lossless structured export; loadable again by EntryLog.
    nlohmann::json exportEntries(const std::vector<Entry> &entries,
                                 const ReportQuery &query,
                                 TimePoint now) const;
    QString exportReadable(const std::vector<Entry> &entries,
                           const ReportQuery &query) const;

    std::vector<ListRow> list(const EntryStore &store,
                              const ReportQuery &query,
                              TimePoint now) const;

    std::chrono::seconds duration(const Entry &entry,
                                  TimePoint now,
                                  bool includeSeconds) const;

    QDate dayOf(TimePoint timestamp) const;
    QString formatLocal(TimePoint timestamp) const;

    // Negative when the goal is exceeded.
    static std::chrono::seconds remaining(std::chrono::seconds total, const TimeGoal &goal);

    // Placeholders: {hh} {mm} {ss} zero padded, {h} {m} {s} plain.
    static QString formatDuration(std::chrono::seconds value,
                                  const QString &pattern = QStringLiteral("{hh}:{mm}:{ss}"));

private:
    QTimeZone m_zone;
};

} // namespace timeledger
