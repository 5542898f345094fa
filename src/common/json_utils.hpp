#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace timeledger {

// Entries are stored with second resolution; captured times are floored so
// that a persisted value reads back identical.
inline TimePoint floorToSeconds(TimePoint timestamp)
{
    return std::chrono::time_point_cast<std::chrono::seconds>(timestamp);
}

inline std::int64_t toEpochSeconds(TimePoint timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

inline TimePoint fromEpochSeconds(std::int64_t value)
{
    return TimePoint{std::chrono::seconds{value}};
}

inline std::string toIso8601Utc(TimePoint timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(floorToSeconds(timestamp));
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Strict parse: the value must be exactly "YYYY-MM-DDTHH:MM:SSZ" and name a
// real calendar instant.
inline std::optional<TimePoint> parseIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    // timegm() returns -1 for 1969-12-31T23:59:59Z too; the re-format check
    // below is what rejects out-of-range fields.
    const TimePoint parsed = std::chrono::system_clock::from_time_t(time);
    if (toIso8601Utc(parsed) != value) {
        return std::nullopt;
    }
    return parsed;
}

inline void to_json(nlohmann::json &j, const Entry &entry)
{
    j = nlohmann::json{
        {"description", entry.description},
        {"start", toIso8601Utc(entry.start)},
        {"end", entry.end.has_value() ? nlohmann::json(toIso8601Utc(*entry.end))
                                      : nlohmann::json(nullptr)}
    };
}

inline void from_json(const nlohmann::json &j, Entry &entry)
{
    if (!j.is_object()) {
        throw LedgerError(ErrorKind::CorruptStore, "entry record is not an object");
    }
    if (!j.contains("description") || !j.at("description").is_string()) {
        throw LedgerError(ErrorKind::CorruptStore, "entry record has no description");
    }
    if (!j.contains("start") || !j.at("start").is_string()) {
        throw LedgerError(ErrorKind::CorruptStore, "entry record has no start time");
    }

    const auto start = parseIso8601Utc(j.at("start").get<std::string>());
    if (!start.has_value()) {
        throw LedgerError(ErrorKind::CorruptStore,
                          "malformed start time: " + j.at("start").get<std::string>());
    }

    std::optional<TimePoint> end;
    if (j.contains("end") && !j.at("end").is_null()) {
        if (!j.at("end").is_string()) {
            throw LedgerError(ErrorKind::CorruptStore, "entry end time is not a string");
        }
        end = parseIso8601Utc(j.at("end").get<std::string>());
        if (!end.has_value()) {
            throw LedgerError(ErrorKind::CorruptStore,
                              "malformed end time: " + j.at("end").get<std::string>());
        }
    }

    entry.description = j.at("description").get<std::string>();
    entry.start = *start;
    entry.end = end;
}

} // namespace timeledger
