#pragma once

#include "metric_store.hpp"
#include "decision_engine.hpp"
#include "monitor_loop.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

class HealthCheck {
public:
    HealthCheck(const MetricStore& store,
                const DecisionEngine& engine,
                const MonitorLoop& monitor,
                std::chrono::seconds stale_after);

    nlohmann::json get_status() const;
    bool is_healthy() const;

    nlohmann::json summary(int hours) const;
    nlohmann::json bands() const;

private:
    const MetricStore& store_;
    const DecisionEngine& engine_;
    const MonitorLoop& monitor_;
    std::chrono::seconds stale_after_;

    std::string router_status() const;
};

nlohmann::json to_json(const BandPerformance& perf);

// Longest summary window accepted from the CLI or HTTP, about a century
constexpr int kMaxSummaryHours = 876000;

// "24" -> 24; nullopt for non-numeric text or values outside 1..kMaxSummaryHours
std::optional<int> parse_summary_hours(const std::string& text);
