#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <cstdint>

namespace util {

namespace {

std::tm to_local_tm(TimePoint tp) {
    auto itt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&itt, &tm);
    return tm;
}

} // namespace

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&itt, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string trim(const std::string& str) {
    auto first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    auto last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

std::string format_local_iso8601(TimePoint tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    if (secs > tp) {
        secs -= std::chrono::seconds(1);
    }
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();

    std::tm tm = to_local_tm(secs);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (micros > 0) {
        ss << '.' << std::setw(6) << std::setfill('0') << micros;
    }
    return ss.str();
}

std::optional<TimePoint> parse_local_iso8601(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    int64_t micros = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        if (digits.empty()) return std::nullopt;
        digits = digits.substr(0, 6);
        while (digits.size() < 6) digits.push_back('0');
        micros = std::stoll(digits);
    }

    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    if (t == -1) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t) + std::chrono::microseconds(micros);
}

TimePoint make_local_time(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

int local_hour(TimePoint tp) {
    return to_local_tm(tp).tm_hour;
}

int local_minute_of_day(TimePoint tp) {
    auto tm = to_local_tm(tp);
    return tm.tm_hour * 60 + tm.tm_min;
}

int local_day_index(TimePoint tp) {
    auto tm = to_local_tm(tp);
    return (tm.tm_year + 1900) * 1000 + tm.tm_yday;
}

} // namespace util
