#pragma once

#include "signal_sample.hpp"
#include "band_analyzer.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <shared_mutex>
#include <cstdint>
#include <nlohmann/json.hpp>

struct MetricsSummary {
    size_t total_records = 0;
    std::chrono::seconds window{0};
    std::vector<std::string> bands_seen;  // in order of first appearance

    struct Averages {
        double rsrp = 0.0;
        double rsrq = 0.0;
        double sinr = 0.0;
        double rssi = 0.0;
        double bandwidth_score = 0.0;
    } averages;

    std::map<QualityClass, size_t> quality_distribution;
    std::string best_band;   // highest mean bandwidth score
    std::string worst_band;  // lowest mean bandwidth score

    nlohmann::json to_json() const;
};

struct MetricStoreOptions {
    std::string csv_path = "lte_metrics.csv";
    std::string json_path = "lte_metrics.json";
    uintmax_t max_log_size_bytes = 0;  // 0 disables rotation on append
};

// Append-only signal log kept as CSV plus a JSON array mirror. The CSV is the
// source of truth; both files hold the same samples after a successful append.
// Writers (append, rotate) are exclusive; queries read a shared snapshot.
class MetricStore {
public:
    explicit MetricStore(MetricStoreOptions options);

    MetricStore(const MetricStore&) = delete;
    MetricStore& operator=(const MetricStore&) = delete;

    bool append(const SignalSample& sample);
    size_t append_batch(const std::vector<SignalSample>& samples);

    // nullopt when no sample falls in [now - window, now]
    std::optional<MetricsSummary> summary(std::chrono::seconds window) const;
    std::optional<MetricsSummary> summary(std::chrono::seconds window,
                                          util::TimePoint now) const;

    std::map<std::string, BandPerformance> per_band_aggregate() const;
    std::map<std::string, BandPerformance> per_band_aggregate(std::chrono::seconds window,
                                                              util::TimePoint now) const;
    std::map<std::string, BandStatistics> band_statistics() const;

    bool export_band_comparison(const std::string& output_path) const;

    // Moves both files to their .backup paths and restarts an empty log when
    // the CSV is larger than max_size_bytes. Returns true if it rotated.
    bool rotate(uintmax_t max_size_bytes);

    std::vector<SampleRecord> snapshot() const;
    size_t size() const;
    size_t rotation_count() const;

    const std::string& csv_path() const { return options_.csv_path; }
    const std::string& json_path() const { return options_.json_path; }
    std::string csv_backup_path() const { return options_.csv_path + ".backup"; }
    std::string json_backup_path() const { return options_.json_path + ".backup"; }

private:
    MetricStoreOptions options_;
    mutable std::shared_mutex mutex_;
    std::vector<SampleRecord> records_;
    size_t rotations_ = 0;

    void load();
    bool load_csv();
    void recover_from_json();
    bool write_csv_header();
    bool write_json_mirror(const std::vector<SampleRecord>& records,
                           const std::string& path) const;
    bool append_locked(const SignalSample& sample);
    void truncate_csv(uintmax_t size);
    bool rotate_locked(uintmax_t max_size_bytes);

    std::vector<SampleRecord> records_in_window(std::chrono::seconds window,
                                                util::TimePoint now) const;
    static std::map<std::string, std::vector<SampleRecord>>
        group_by_band(const std::vector<SampleRecord>& records);
};
