#include "health.hpp"
#include "util.hpp"
#include <stdexcept>

HealthCheck::HealthCheck(const MetricStore& store,
                         const DecisionEngine& engine,
                         const MonitorLoop& monitor,
                         std::chrono::seconds stale_after)
    : store_(store), engine_(engine), monitor_(monitor), stale_after_(stale_after) {}

std::string HealthCheck::router_status() const {
    auto last = monitor_.last_sample_time();
    if (!last) return "unknown";
    auto age = std::chrono::system_clock::now() - *last;
    return age <= stale_after_ ? "up" : "stale";
}

nlohmann::json HealthCheck::get_status() const {
    auto last_sample = monitor_.last_sample_time();
    auto last_decision = engine_.last_decision_time();
    auto best = engine_.current_best_band();

    return {
        {"ok", is_healthy()},
        {"router", router_status()},
        {"loop", monitor_.is_running() ? "running" : "stopped"},
        {"engine", to_string(engine_.state())},
        {"auto_switch", engine_.auto_switch_enabled()},
        {"current_best_band", best ? nlohmann::json(*best) : nlohmann::json(nullptr)},
        {"last_sample_ts", last_sample ? util::format_local_iso8601(*last_sample) : ""},
        {"last_decision_ts", last_decision ? util::format_local_iso8601(*last_decision) : ""},
        {"records", store_.size()},
        {"failed_ticks", monitor_.failed_ticks()},
        {"ts", util::current_iso8601()}
    };
}

bool HealthCheck::is_healthy() const {
    return monitor_.is_running() && router_status() != "stale";
}

nlohmann::json HealthCheck::summary(int hours) const {
    if (hours <= 0 || hours > kMaxSummaryHours) {
        return nlohmann::json::object();
    }
    auto result = store_.summary(std::chrono::hours(hours));
    if (!result) {
        return nlohmann::json::object();
    }
    return result->to_json();
}

nlohmann::json HealthCheck::bands() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [band, perf] : store_.per_band_aggregate()) {
        out[band] = to_json(perf);
    }
    return out;
}

nlohmann::json to_json(const BandPerformance& perf) {
    return {
        {"band", perf.band},
        {"avg_rsrp", perf.avg_rsrp},
        {"avg_rsrq", perf.avg_rsrq},
        {"avg_sinr", perf.avg_sinr},
        {"avg_bandwidth_score", perf.avg_bandwidth_score},
        {"stability_score", perf.stability_score},
        {"peak_performance", perf.peak_performance},
        {"off_peak_performance", perf.off_peak_performance},
        {"samples", perf.sample_count}
    };
}

std::optional<int> parse_summary_hours(const std::string& text) {
    int hours = 0;
    try {
        size_t used = 0;
        hours = std::stoi(text, &used);
        if (used != text.size()) return std::nullopt;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    if (hours < 1 || hours > kMaxSummaryHours) {
        return std::nullopt;
    }
    return hours;
}
