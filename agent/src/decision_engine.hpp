#pragma once

#include "config.hpp"
#include "router_client.hpp"
#include "metric_store.hpp"
#include "band_analyzer.hpp"
#include "band_id.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct DecisionConfig {
    double degradation_threshold = 0.8;
    bool auto_switch_enabled = true;
    std::vector<PeakWindow> peak_windows;

    std::chrono::seconds degradation_window{3600};
    std::chrono::seconds switch_window{6 * 3600};

    std::chrono::milliseconds band_settle{10000};
    std::chrono::milliseconds mask_settle{15000};
    std::chrono::milliseconds band_test_sample_interval{30000};

    // Per-band comparison table refreshed on every optimization; empty disables it
    std::string band_comparison_file;
};

enum class SwitchStatus {
    NoData,
    AlreadyActive,
    Switched,
    Failed
};

std::string to_string(SwitchStatus status);

struct SwitchOutcome {
    SwitchStatus status = SwitchStatus::NoData;
    std::string from_band;  // empty when the router did not report one
    std::string to_band;

    bool switched() const { return status == SwitchStatus::Switched; }
};

enum class OptimizationCriterion {
    PeakSinr,
    Stability
};

struct OptimizationResult {
    bool peak_hours = false;
    OptimizationCriterion criterion = OptimizationCriterion::Stability;
    bool comparison_exported = false;
    SwitchOutcome outcome;
};

struct BandTestResult {
    std::string band;
    bool ok = false;
    std::string error;
    BandPerformance performance;
};

struct BandTestReport {
    std::vector<BandTestResult> results;
    std::optional<std::string> best_band;
};

enum class EngineState {
    Idle,
    TestingBand,
    Monitoring,
    Switching
};

std::string to_string(EngineState state);

// Scores incoming samples against recent history and decides when and where
// to move the router. Router-mutating calls are serialized on one lock; the
// remaining state is safe to read from any thread.
class DecisionEngine {
public:
    DecisionEngine(RouterClient& router, MetricStore& store, DecisionConfig config);

    DecisionEngine(const DecisionEngine&) = delete;
    DecisionEngine& operator=(const DecisionEngine&) = delete;

    void set_catalog(BandCatalog catalog);
    const BandCatalog& catalog() const { return catalog_; }

    // Returns true when the sample triggered a smart switch
    bool on_sample(const SignalSample& sample);
    bool on_sample(const SignalSample& sample, util::TimePoint now);

    SwitchOutcome smart_switch();
    SwitchOutcome smart_switch(util::TimePoint now);

    bool is_peak_hour(util::TimePoint now) const;
    OptimizationResult optimize_for_peak_hours(util::TimePoint now);

    BandTestReport test_all_bands(const std::vector<std::string>& bands,
                                  std::chrono::milliseconds duration_per_band);

    // Throws ConfigurationError before touching the router if the mask is invalid
    bool set_band_configuration(const BandMask& mask);
    BandMask current_band_configuration();

    SwitchOutcome switch_to(const std::string& band, const char* reason);

    void set_auto_switch(bool enabled) { auto_switch_enabled_ = enabled; }
    bool auto_switch_enabled() const { return auto_switch_enabled_; }

    std::optional<std::string> current_best_band() const;
    std::optional<util::TimePoint> last_decision_time() const;
    // Most significant operation in flight: switching, then testing, then monitoring
    EngineState state() const;

private:
    RouterClient& router_;
    MetricStore& store_;
    DecisionConfig config_;
    BandCatalog catalog_;

    std::mutex switch_mutex_;
    mutable std::mutex state_mutex_;
    std::optional<std::string> current_best_band_;
    std::optional<util::TimePoint> last_decision_ts_;
    std::atomic<bool> auto_switch_enabled_;

    // Operations in flight per state, indexed by EngineState
    std::array<std::atomic<int>, 4> active_{};

    friend class StateScope;

    std::string current_router_band();
    // Caller holds switch_mutex_
    bool apply_band_locked(const std::string& band);
    std::vector<SignalSample> collect_samples(const std::string& band,
                                              std::chrono::milliseconds duration);
    void record_decision();

    std::optional<std::string> select_peak_band() const;
    std::optional<std::string> select_stable_band() const;
};
