#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

struct TimeOfDay {
    int hour = 0;
    int minute = 0;

    int minute_of_day() const { return hour * 60 + minute; }
    bool operator==(const TimeOfDay& other) const {
        return hour == other.hour && minute == other.minute;
    }
};

// Named daily period with minute-precision bounds. Matching uses whole hours only.
struct PeakWindow {
    std::string name;
    TimeOfDay start;
    TimeOfDay end;

    bool contains_hour(int hour) const { return start.hour <= hour && hour <= end.hour; }
};

struct Config {
    // Router
    std::string router_ip;
    std::string router_username;
    std::string router_password;
    int request_timeout_ms;

    // Monitoring
    int measurement_interval_seconds;
    int band_test_duration_seconds;
    int band_test_sample_interval_seconds;
    double auto_switch_threshold;
    bool auto_switch_enabled;
    int switch_settle_seconds;
    int mask_settle_seconds;
    std::vector<PeakWindow> peak_windows;
    std::vector<TimeOfDay> optimize_times;

    // Metric log
    std::string csv_file;
    std::string json_file;
    int64_t max_log_size_bytes;
    std::string band_comparison_file;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;
    std::string log_file;

    static Config from_env();
    void validate() const;

    // "morning=07:00-09:00,evening=17:00-19:00"
    static std::vector<PeakWindow> parse_peak_windows(const std::string& text);
    // "07:00,17:00"
    static std::vector<TimeOfDay> parse_times(const std::string& text);
    static TimeOfDay parse_time_of_day(const std::string& text);

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static int64_t get_env_int64(const char* name, int64_t default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
