#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <QDate>

namespace timeledger {

using TimePoint = std::chrono::system_clock::time_point;

struct Entry {
    std::string description;
    TimePoint start;
    std::optional<TimePoint> end;

    bool isOpen() const
    {
        return !end.has_value();
    }

    bool operator==(const Entry &other) const
    {
        return description == other.description
            && start == other.start
            && end == other.end;
    }

    bool operator!=(const Entry &other) const
    {
        return !(*this == other);
    }
};

// Half-open interval [from, to). A missing bound is unbounded.
struct TimeRange {
    std::optional<TimePoint> from;
    std::optional<TimePoint> to;

    bool contains(TimePoint t) const
    {
        if (from.has_value() && t < *from) {
            return false;
        }
        if (to.has_value() && t >= *to) {
            return false;
        }
        return true;
    }
};

struct ReportQuery {
    TimeRange range;
    std::optional<std::string> descriptionFilter;
    bool includeSeconds = true;
};

struct DayTotal {
    QDate day;
    std::chrono::seconds total{0};
};

struct ShowReport {
    std::vector<DayTotal> days;
    std::chrono::seconds grandTotal{0};
    std::size_t entryCount = 0;
};

struct ListRow {
    Entry entry;
    std::chrono::seconds elapsed{0};
    bool running = false;
};

struct TimeGoal {
    int hours = 0;
    int minutes = 0;

    std::chrono::minutes asMinutes() const
    {
        return std::chrono::hours(hours) + std::chrono::minutes(minutes);
    }
};

} // namespace timeledger
