#include "ledger/entry_store.hpp"

#include <utility>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace timeledger {

EntryStore::EntryStore(std::vector<Entry> entries)
{
    validate(entries);
    m_entries = std::move(entries);
}

TrackingState EntryStore::state() const
{
    if (!m_entries.empty() && m_entries.back().isOpen()) {
        return TrackingState::Tracking;
    }
    return TrackingState::Idle;
}

bool EntryStore::isTracking() const
{
    return state() == TrackingState::Tracking;
}

bool EntryStore::isModified() const
{
    return m_modified;
}

const std::vector<Entry> &EntryStore::entries() const
{
    return m_entries;
}

std::optional<Entry> EntryStore::last() const
{
    if (m_entries.empty()) {
        return std::nullopt;
    }
    return m_entries.back();
}

void EntryStore::start(const std::string &description, TimePoint now)
{
    if (isTracking()) {
        throw LedgerError(ErrorKind::AlreadyTracking,
                          "Time tracking is already running for \""
                              + m_entries.back().description + "\".");
    }
    requireNotBeforeLatest(now);

    m_entries.push_back(Entry{description, floorToSeconds(now), std::nullopt});
    m_modified = true;
}

std::chrono::seconds EntryStore::stop(TimePoint now)
{
    if (!isTracking()) {
        throw LedgerError(ErrorKind::NotTracking, "Time tracking is already stopped.");
    }

    Entry &open = m_entries.back();
    const TimePoint end = floorToSeconds(now);
    if (end < open.start) {
        throw LedgerError(ErrorKind::InvalidTimestamp,
                          "Stop time " + toIso8601Utc(end)
                              + " is before the session start "
                              + toIso8601Utc(open.start) + ".");
    }

    open.end = end;
    m_modified = true;
    return elapsed(open, end);
}

void EntryStore::continueLast(TimePoint now)
{
    if (m_entries.empty()) {
        throw LedgerError(ErrorKind::NothingToContinue,
                          "Time tracking couldn't be continued, because there are no "
                          "entries. Use the start command instead!");
    }
    if (isTracking()) {
        throw LedgerError(ErrorKind::AlreadyTracking,
                          "Time tracking is already running for \""
                              + m_entries.back().description + "\".");
    }

    const std::string description = m_entries.back().description;
    start(description, now);
}

std::optional<std::chrono::seconds> EntryStore::switchTo(const std::string &description,
                                                         TimePoint now)
{
    if (!isTracking()) {
        start(description, now);
        return std::nullopt;
    }

    if (m_entries.back().description == description) {
        throw LedgerError(ErrorKind::AlreadyTracking,
                          "Timetracking with the description \"" + description
                              + "\" is already running!");
    }

    // Both steps are checked up front so a rejected switch changes nothing.
    const TimePoint at = floorToSeconds(now);
    if (at < m_entries.back().start) {
        throw LedgerError(ErrorKind::InvalidTimestamp,
                          "Switch time " + toIso8601Utc(at)
                              + " is before the running session start.");
    }

    const auto closed = stop(at);
    m_entries.push_back(Entry{description, at, std::nullopt});
    return closed;
}

void EntryStore::replaceAll(std::vector<Entry> entries)
{
    validate(entries);
    m_entries = std::move(entries);
    m_modified = true;
}

std::vector<ListRow> EntryStore::list(TimePoint now) const
{
    std::vector<ListRow> rows;
    rows.reserve(m_entries.size());
    for (const auto &entry : m_entries) {
        rows.push_back(ListRow{entry, elapsed(entry, now), entry.isOpen()});
    }
    return rows;
}

void EntryStore::validate(const std::vector<Entry> &entries)
{
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const Entry &entry = entries[i];
        const std::string where = "entry " + std::to_string(i + 1);

        if (entry.end.has_value() && *entry.end < entry.start) {
            throw LedgerError(ErrorKind::CorruptStore, where + " ends before it starts");
        }
        if (entry.isOpen() && i + 1 != entries.size()) {
            throw LedgerError(ErrorKind::CorruptStore,
                              where + " is open but is not the last entry");
        }
        if (i > 0 && entry.start < entries[i - 1].start) {
            throw LedgerError(ErrorKind::CorruptStore,
                              where + " starts before the previous entry");
        }
    }
}

std::chrono::seconds EntryStore::elapsed(const Entry &entry, TimePoint now)
{
    const TimePoint end = entry.end.value_or(floorToSeconds(now));
    if (end < entry.start) {
        return std::chrono::seconds{0};
    }
    return std::chrono::duration_cast<std::chrono::seconds>(end - entry.start);
}

void EntryStore::requireNotBeforeLatest(TimePoint now) const
{
    if (m_entries.empty()) {
        return;
    }

    const Entry &latest = m_entries.back();
    const TimePoint bound = latest.end.value_or(latest.start);
    if (floorToSeconds(now) < bound) {
        throw LedgerError(ErrorKind::InvalidTimestamp,
                          "Start time " + toIso8601Utc(now)
                              + " is before the latest recorded time "
                              + toIso8601Utc(bound) + ".");
    }
}

} // namespace timeledger
