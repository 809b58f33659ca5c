#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace krishi {

using Days = std::chrono::duration<long long, std::ratio<86400>>;

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
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

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::chrono::system_clock::time_point startOfUtcDay(
    std::chrono::system_clock::time_point timestamp)
{
    const auto sinceEpoch = timestamp.time_since_epoch();
    auto days = std::chrono::duration_cast<Days>(sinceEpoch);
    // duration_cast truncates toward zero; pre-epoch instants belong to the
    // previous day.
    if (days > sinceEpoch) {
        days -= Days(1);
    }
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(days));
}

inline std::chrono::system_clock::time_point addDays(
    std::chrono::system_clock::time_point timestamp, long long days)
{
    return timestamp + std::chrono::duration_cast<std::chrono::system_clock::duration>(Days(days));
}

// Whole UTC days from the day of `from` to the day of `to`.
inline long long daysBetween(std::chrono::system_clock::time_point from,
                             std::chrono::system_clock::time_point to)
{
    return std::chrono::duration_cast<Days>(startOfUtcDay(to) - startOfUtcDay(from)).count();
}

inline std::string toIsoDate(std::chrono::system_clock::time_point day)
{
    return toIso8601Utc(day).substr(0, 10);
}

inline std::chrono::system_clock::time_point fromIsoDate(const std::string &value)
{
    if (value.size() > 10) {
        return startOfUtcDay(fromIso8601Utc(value));
    }
    return fromIso8601Utc(value + "T00:00:00Z");
}

inline long long toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochSeconds(long long value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

} // namespace krishi
