#include "decision_engine.hpp"
#include "scoring.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <thread>

// Counts an operation as in flight for its lifetime. Overlapping operations on
// different threads may finish in any order.
class StateScope {
public:
    StateScope(DecisionEngine& engine, EngineState state)
        : counter_(engine.active_[static_cast<size_t>(state)]) { ++counter_; }
    ~StateScope() { --counter_; }

    StateScope(const StateScope&) = delete;
    StateScope& operator=(const StateScope&) = delete;

private:
    std::atomic<int>& counter_;
};

namespace {

std::string format_mask(const BandMask& mask) {
    std::vector<std::string> enabled;
    for (const auto& [band, on] : mask) {
        if (on) enabled.push_back(to_string(band));
    }
    return fmt::format("[{}]", fmt::join(enabled, ", "));
}

} // namespace

std::string to_string(SwitchStatus status) {
    switch (status) {
        case SwitchStatus::NoData: return "no_data";
        case SwitchStatus::AlreadyActive: return "already_active";
        case SwitchStatus::Switched: return "switched";
        case SwitchStatus::Failed: return "failed";
    }
    return "unknown";
}

std::string to_string(EngineState state) {
    switch (state) {
        case EngineState::Idle: return "idle";
        case EngineState::TestingBand: return "testing_band";
        case EngineState::Monitoring: return "monitoring";
        case EngineState::Switching: return "switching";
    }
    return "unknown";
}

DecisionEngine::DecisionEngine(RouterClient& router, MetricStore& store, DecisionConfig config)
    : router_(router)
    , store_(store)
    , config_(std::move(config))
    , auto_switch_enabled_(config_.auto_switch_enabled)
{}

EngineState DecisionEngine::state() const {
    for (auto state : {EngineState::Switching, EngineState::TestingBand, EngineState::Monitoring}) {
        if (active_[static_cast<size_t>(state)] > 0) {
            return state;
        }
    }
    return EngineState::Idle;
}

void DecisionEngine::set_catalog(BandCatalog catalog) {
    catalog_ = std::move(catalog);
}

bool DecisionEngine::on_sample(const SignalSample& sample) {
    return on_sample(sample, std::chrono::system_clock::now());
}

bool DecisionEngine::on_sample(const SignalSample& sample, util::TimePoint now) {
    if (!auto_switch_enabled_) {
        return false;
    }

    StateScope scope(*this, EngineState::Monitoring);

    auto summary = store_.summary(config_.degradation_window, now);
    if (!summary) {
        return false;
    }

    double current_score = Scoring::bandwidth_score(sample);
    double historical_avg = summary->averages.bandwidth_score;

    if (current_score < historical_avg * config_.degradation_threshold) {
        spdlog::warn("Performance degradation detected on {} (score {:.3f} vs 1h mean {:.3f}), "
                     "considering band switch",
                     sample.band, current_score, historical_avg);
        smart_switch(now);
        return true;
    }
    return false;
}

SwitchOutcome DecisionEngine::smart_switch() {
    return smart_switch(std::chrono::system_clock::now());
}

SwitchOutcome DecisionEngine::smart_switch(util::TimePoint now) {
    auto aggregates = store_.per_band_aggregate(config_.switch_window, now);
    if (aggregates.empty()) {
        spdlog::info("No recent band data, skipping smart switch");
        return SwitchOutcome{};
    }

    const BandPerformance* best = nullptr;
    for (const auto& [band, perf] : aggregates) {
        if (!best || perf.avg_bandwidth_score > best->avg_bandwidth_score) {
            best = &perf;
        }
    }

    return switch_to(best->band, "smart switch");
}

SwitchOutcome DecisionEngine::switch_to(const std::string& band, const char* reason) {
    // Read, compare and apply under one lock so competing decisions see each other's switch
    std::lock_guard<std::mutex> lock(switch_mutex_);

    SwitchOutcome outcome;
    outcome.to_band = band;
    outcome.from_band = current_router_band();

    record_decision();

    if (outcome.from_band == band) {
        spdlog::info("{}: already on {}", reason, band);
        outcome.status = SwitchStatus::AlreadyActive;
        return outcome;
    }

    spdlog::info("{}: switching from {} to {}", reason,
                 outcome.from_band.empty() ? "unknown" : outcome.from_band, band);

    if (apply_band_locked(band)) {
        spdlog::info("Successfully switched to {}", band);
        outcome.status = SwitchStatus::Switched;
    } else {
        spdlog::error("Failed to switch to {}", band);
        outcome.status = SwitchStatus::Failed;
    }
    return outcome;
}

bool DecisionEngine::is_peak_hour(util::TimePoint now) const {
    // Window bounds are compared by hour only; the minutes are dropped
    int hour = util::local_hour(now);
    for (const auto& window : config_.peak_windows) {
        if (window.contains_hour(hour)) {
            return true;
        }
    }
    return false;
}

OptimizationResult DecisionEngine::optimize_for_peak_hours(util::TimePoint now) {
    OptimizationResult result;
    result.peak_hours = is_peak_hour(now);

    if (!config_.band_comparison_file.empty()) {
        result.comparison_exported = store_.export_band_comparison(config_.band_comparison_file);
    }

    std::optional<std::string> target;
    if (result.peak_hours) {
        spdlog::info("Peak hours detected, optimizing for bandwidth");
        result.criterion = OptimizationCriterion::PeakSinr;
        target = select_peak_band();
    } else {
        spdlog::info("Off-peak hours, optimizing for stability");
        result.criterion = OptimizationCriterion::Stability;
        target = select_stable_band();
    }

    if (!target) {
        spdlog::info("No band comparison data yet, nothing to optimize");
        return result;
    }

    result.outcome = switch_to(*target, result.peak_hours ? "peak optimization"
                                                          : "stability optimization");
    return result;
}

std::optional<std::string> DecisionEngine::select_peak_band() const {
    std::optional<std::string> best;
    double best_sinr = 0.0;

    for (const auto& [band, perf] : store_.per_band_aggregate()) {
        if (perf.peak_sample_count == 0) continue;
        if (!best || perf.peak_performance > best_sinr) {
            best = band;
            best_sinr = perf.peak_performance;
        }
    }
    return best;
}

std::optional<std::string> DecisionEngine::select_stable_band() const {
    std::optional<std::string> best;
    double best_std = 0.0;

    for (const auto& [band, stats] : store_.band_statistics()) {
        // A spread needs at least two samples
        if (stats.count < 2) continue;
        if (!best || stats.bandwidth_score.std < best_std) {
            best = band;
            best_std = stats.bandwidth_score.std;
        }
    }
    return best;
}

BandTestReport DecisionEngine::test_all_bands(const std::vector<std::string>& bands,
                                              std::chrono::milliseconds duration_per_band) {
    StateScope scope(*this, EngineState::TestingBand);
    BandTestReport report;

    spdlog::info("Testing {} bands for {} s each", bands.size(),
                 std::chrono::duration_cast<std::chrono::seconds>(duration_per_band).count());

    for (const auto& band : bands) {
        BandTestResult result;
        result.band = band;
        result.performance.band = band;

        spdlog::info("Testing {}...", band);

        bool selected = false;
        {
            std::lock_guard<std::mutex> lock(switch_mutex_);
            selected = apply_band_locked(band);
        }
        if (!selected) {
            result.error = "band switch failed";
            spdlog::error("{} failed: could not select band", band);
            report.results.push_back(result);
            continue;
        }

        auto samples = collect_samples(band, duration_per_band);
        if (samples.empty()) {
            result.error = "no samples collected";
            spdlog::error("{} failed to collect data", band);
            report.results.push_back(result);
            continue;
        }

        size_t logged = store_.append_batch(samples);
        if (logged < samples.size()) {
            spdlog::warn("Persisted {}/{} samples for {}", logged, samples.size(), band);
        }

        result.ok = true;
        result.performance = BandAnalyzer::analyze(band, samples);
        spdlog::info("{} completed - avg score {:.3f}, stability {:.3f}",
                     band, result.performance.avg_bandwidth_score,
                     result.performance.stability_score);
        report.results.push_back(result);
    }

    const BandTestResult* best = nullptr;
    for (const auto& r : report.results) {
        if (!r.ok) continue;
        if (!best || r.performance.avg_bandwidth_score > best->performance.avg_bandwidth_score) {
            best = &r;
        }
    }

    if (best) {
        report.best_band = best->band;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            current_best_band_ = best->band;
        }
        record_decision();
        spdlog::info("Best performing band: {}", best->band);
    } else {
        spdlog::warn("No band produced usable samples");
    }

    return report;
}

std::vector<SignalSample> DecisionEngine::collect_samples(const std::string& band,
                                                          std::chrono::milliseconds duration) {
    std::vector<SignalSample> samples;
    if (duration.count() <= 0) {
        return samples;
    }

    auto interval = config_.band_test_sample_interval;
    int64_t iterations = 1;
    if (interval.count() > 0) {
        iterations = (duration.count() + interval.count() - 1) / interval.count();
    }

    for (int64_t i = 0; i < iterations; ++i) {
        if (i > 0) {
            std::this_thread::sleep_for(interval);
        }

        auto sample = router_.get_signal_sample();
        if (!sample) {
            spdlog::warn("No sample from router while testing {}", band);
            continue;
        }
        // The router may still report the previous band while settling
        sample->band = band;
        if (!samples.empty() && sample->timestamp < samples.back().timestamp) {
            sample->timestamp = samples.back().timestamp;
        }
        samples.push_back(*sample);
    }
    return samples;
}

bool DecisionEngine::set_band_configuration(const BandMask& mask) {
    catalog_.validate(mask);

    std::lock_guard<std::mutex> lock(switch_mutex_);
    StateScope scope(*this, EngineState::Switching);

    spdlog::info("Setting LTE band configuration: {}", format_mask(mask));
    record_decision();

    if (!router_.set_band_mask(mask)) {
        spdlog::error("Failed to set band configuration");
        return false;
    }

    spdlog::info("Successfully set bands: {}", format_mask(mask));
    std::this_thread::sleep_for(config_.mask_settle);
    return true;
}

BandMask DecisionEngine::current_band_configuration() {
    auto mask = router_.get_current_band_config();
    if (!mask.empty()) {
        spdlog::info("Current band configuration: {}", format_mask(mask));
    }
    return mask;
}

std::optional<std::string> DecisionEngine::current_best_band() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return current_best_band_;
}

std::optional<util::TimePoint> DecisionEngine::last_decision_time() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_decision_ts_;
}

std::string DecisionEngine::current_router_band() {
    auto sample = router_.get_signal_sample();
    return sample ? sample->band : std::string();
}

bool DecisionEngine::apply_band_locked(const std::string& band) {
    StateScope scope(*this, EngineState::Switching);

    if (!router_.set_band(band)) {
        return false;
    }

    // Let the modem re-attach before the band is considered active
    std::this_thread::sleep_for(config_.band_settle);
    return true;
}

void DecisionEngine::record_decision() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_decision_ts_ = std::chrono::system_clock::now();
}
