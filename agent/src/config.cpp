#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

int64_t Config::get_env_int64(const char* name, int64_t default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string s(val);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

TimeOfDay Config::parse_time_of_day(const std::string& text) {
    auto parts = util::split(text, ':');
    if (parts.size() != 2) {
        throw ConfigurationError("Invalid time of day '" + text + "', expected HH:MM");
    }

    TimeOfDay t;
    try {
        size_t used_h = 0, used_m = 0;
        t.hour = std::stoi(parts[0], &used_h);
        t.minute = std::stoi(parts[1], &used_m);
        if (used_h != parts[0].size() || used_m != parts[1].size()) {
            throw ConfigurationError("Invalid time of day '" + text + "'");
        }
    } catch (const std::logic_error&) {
        throw ConfigurationError("Invalid time of day '" + text + "'");
    }

    if (t.hour < 0 || t.hour > 23 || t.minute < 0 || t.minute > 59) {
        throw ConfigurationError("Time of day out of range: '" + text + "'");
    }
    return t;
}

std::vector<TimeOfDay> Config::parse_times(const std::string& text) {
    std::vector<TimeOfDay> times;
    for (const auto& token : util::split(text, ',')) {
        times.push_back(parse_time_of_day(token));
    }
    return times;
}

std::vector<PeakWindow> Config::parse_peak_windows(const std::string& text) {
    std::vector<PeakWindow> windows;
    for (const auto& token : util::split(text, ',')) {
        auto eq = token.find('=');
        auto dash = token.find('-', eq == std::string::npos ? 0 : eq);
        if (eq == std::string::npos || dash == std::string::npos) {
            throw ConfigurationError("Invalid peak window '" + token +
                                     "', expected name=HH:MM-HH:MM");
        }

        PeakWindow w;
        w.name = util::trim(token.substr(0, eq));
        w.start = parse_time_of_day(util::trim(token.substr(eq + 1, dash - eq - 1)));
        w.end = parse_time_of_day(util::trim(token.substr(dash + 1)));

        if (w.name.empty()) {
            throw ConfigurationError("Peak window '" + token + "' has no name");
        }
        if (w.end.minute_of_day() < w.start.minute_of_day()) {
            throw ConfigurationError("Peak window '" + w.name + "' ends before it starts");
        }
        windows.push_back(w);
    }
    return windows;
}

Config Config::from_env() {
    Config cfg;

    cfg.router_ip = get_env("ROUTER_IP", "192.168.8.1");
    cfg.router_username = get_env("ROUTER_USERNAME", "admin");
    cfg.router_password = get_env("ROUTER_PASSWORD", "admin");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 10000);

    cfg.measurement_interval_seconds = get_env_int("MEASUREMENT_INTERVAL_SECONDS", 30);
    cfg.band_test_duration_seconds = get_env_int("BAND_TEST_DURATION_SECONDS", 300);
    cfg.band_test_sample_interval_seconds = get_env_int("BAND_TEST_SAMPLE_INTERVAL_SECONDS", 30);
    cfg.auto_switch_threshold = get_env_double("AUTO_SWITCH_THRESHOLD", 0.8);
    cfg.auto_switch_enabled = get_env_bool("AUTO_SWITCH_ENABLED", true);
    cfg.switch_settle_seconds = get_env_int("SWITCH_SETTLE_SECONDS", 10);
    cfg.mask_settle_seconds = get_env_int("MASK_SETTLE_SECONDS", 15);
    cfg.peak_windows = parse_peak_windows(
        get_env("PEAK_WINDOWS", "morning=07:00-09:00,evening=17:00-19:00"));
    cfg.optimize_times = parse_times(get_env("OPTIMIZE_TIMES", "07:00,17:00,10:00,20:00"));

    cfg.csv_file = get_env("CSV_FILE", "lte_metrics.csv");
    cfg.json_file = get_env("JSON_FILE", "lte_metrics.json");
    cfg.max_log_size_bytes = get_env_int64("MAX_LOG_SIZE_BYTES", 1000000);
    cfg.band_comparison_file = get_env("BAND_COMPARISON_FILE", "band_comparison.csv");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "lteband");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    cfg.log_file = get_env("LOG_FILE", "lte_agent.log");

    return cfg;
}

void Config::validate() const {
    if (router_ip.empty()) {
        throw ConfigurationError("ROUTER_IP is required");
    }
    if (measurement_interval_seconds <= 0) {
        throw ConfigurationError("MEASUREMENT_INTERVAL_SECONDS must be positive");
    }
    if (band_test_duration_seconds < 0 || band_test_sample_interval_seconds <= 0) {
        throw ConfigurationError("Band test duration and sample interval must be positive");
    }
    if (auto_switch_threshold <= 0.0 || auto_switch_threshold > 1.0) {
        throw ConfigurationError("AUTO_SWITCH_THRESHOLD must be in (0, 1]");
    }
    if (switch_settle_seconds < 0 || mask_settle_seconds < 0) {
        throw ConfigurationError("Settle delays cannot be negative");
    }
    if (max_log_size_bytes < 0) {
        throw ConfigurationError("MAX_LOG_SIZE_BYTES cannot be negative");
    }
    if (csv_file.empty() || json_file.empty()) {
        throw ConfigurationError("CSV_FILE and JSON_FILE are required");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Router: {} (timeout {} ms)", router_ip, request_timeout_ms);
    spdlog::info("  Interval: {}s, band test: {}s per band",
                 measurement_interval_seconds, band_test_duration_seconds);
    spdlog::info("  Auto switch: {} (threshold {})",
                 auto_switch_enabled ? "on" : "off", auto_switch_threshold);
    for (const auto& w : peak_windows) {
        spdlog::info("  Peak window {}: {:02d}:{:02d}-{:02d}:{:02d}",
                     w.name, w.start.hour, w.start.minute, w.end.hour, w.end.minute);
    }
}
