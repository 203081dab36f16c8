#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace util {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string current_iso8601();
    std::vector<std::string> split(const std::string& str, char delim);
    std::string trim(const std::string& str);

    // Local wall-clock time, ISO-8601 without zone ("2024-05-01T08:30:00.250000").
    // The fraction is omitted when it is zero.
    std::string format_local_iso8601(TimePoint tp);
    std::optional<TimePoint> parse_local_iso8601(const std::string& text);

    TimePoint make_local_time(int year, int month, int day,
                              int hour, int minute, int second = 0);
    int local_hour(TimePoint tp);
    int local_minute_of_day(TimePoint tp);
    int local_day_index(TimePoint tp);
}
