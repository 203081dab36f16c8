#include "metric_store.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

nlohmann::json MetricsSummary::to_json() const {
    nlohmann::json distribution = nlohmann::json::object();
    for (const auto& [quality, count] : quality_distribution) {
        distribution[to_string(quality)] = count;
    }

    return {
        {"total_records", total_records},
        {"time_range", fmt::format("Last {} hours", window.count() / 3600.0)},
        {"bands_tested", bands_seen},
        {"average_metrics", {
            {"rsrp", averages.rsrp},
            {"rsrq", averages.rsrq},
            {"sinr", averages.sinr},
            {"rssi", averages.rssi},
            {"bandwidth_score", averages.bandwidth_score}
        }},
        {"signal_quality_distribution", distribution},
        {"best_performing_band", best_band},
        {"worst_performing_band", worst_band}
    };
}

MetricStore::MetricStore(MetricStoreOptions options)
    : options_(std::move(options))
{
    load();
}

void MetricStore::load() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::error_code ec;
    if (fs::exists(options_.csv_path, ec)) {
        if (!load_csv()) {
            records_.clear();
            return;
        }
    } else {
        recover_from_json();
        if (!write_csv_header()) {
            spdlog::error("Cannot initialize metric log {}", options_.csv_path);
            return;
        }
        if (!records_.empty()) {
            std::ofstream out(options_.csv_path, std::ios::app);
            for (const auto& r : records_) {
                out << sample_codec::to_csv_row(r) << '\n';
            }
            if (!out) {
                spdlog::error("Failed to rebuild {} from JSON mirror", options_.csv_path);
            }
        }
    }

    // Keep the JSON mirror in step with the CSV we just loaded
    if (!write_json_mirror(records_, options_.json_path)) {
        spdlog::warn("JSON mirror {} is out of step with {}", options_.json_path, options_.csv_path);
    }

    spdlog::info("Metric store opened: {} ({} records)", options_.csv_path, records_.size());
}

bool MetricStore::load_csv() {
    std::ifstream in(options_.csv_path);
    if (!in) {
        spdlog::error("Cannot read metric log {}", options_.csv_path);
        return false;
    }

    std::string line;
    size_t line_no = 0;
    size_t skipped = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (line_no == 1 && line.rfind("timestamp,", 0) == 0) {
            continue;
        }
        if (util::trim(line).empty()) {
            continue;
        }

        auto record = sample_codec::from_csv_row(line);
        if (!record) {
            ++skipped;
            continue;
        }
        if (!records_.empty() && record->sample.timestamp < records_.back().sample.timestamp) {
            ++skipped;
            continue;
        }
        records_.push_back(*record);
    }

    if (skipped > 0) {
        spdlog::warn("Skipped {} malformed rows in {}", skipped, options_.csv_path);
    }
    return true;
}

void MetricStore::recover_from_json() {
    std::ifstream in(options_.json_path);
    if (!in) {
        return;
    }

    try {
        auto data = nlohmann::json::parse(in);
        if (!data.is_array()) {
            spdlog::warn("JSON mirror {} is not an array, ignoring", options_.json_path);
            return;
        }
        for (const auto& item : data) {
            auto record = sample_codec::from_json(item);
            if (record) {
                records_.push_back(*record);
            }
        }
        spdlog::info("Recovered {} records from {}", records_.size(), options_.json_path);
    } catch (const std::exception& e) {
        spdlog::warn("JSON mirror {} is unreadable: {}", options_.json_path, e.what());
        records_.clear();
    }
}

bool MetricStore::write_csv_header() {
    std::ofstream out(options_.csv_path, std::ios::trunc);
    out << sample_codec::kCsvHeader << '\n';
    return static_cast<bool>(out);
}

bool MetricStore::write_json_mirror(const std::vector<SampleRecord>& records,
                                    const std::string& path) const {
    nlohmann::json data = nlohmann::json::array();
    for (const auto& r : records) {
        data.push_back(sample_codec::to_json(r));
    }

    std::ofstream out(path, std::ios::trunc);
    out << data.dump(2);
    out.flush();
    if (!out) {
        spdlog::error("Failed to write JSON mirror {}", path);
        return false;
    }
    return true;
}

bool MetricStore::append(const SignalSample& sample) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!append_locked(sample)) {
        return false;
    }

    if (options_.max_log_size_bytes > 0) {
        rotate_locked(options_.max_log_size_bytes);
    }
    return true;
}

size_t MetricStore::append_batch(const std::vector<SignalSample>& samples) {
    size_t written = 0;
    for (const auto& sample : samples) {
        if (append(sample)) {
            ++written;
        }
    }
    return written;
}

bool MetricStore::append_locked(const SignalSample& sample) {
    if (!records_.empty() && sample.timestamp < records_.back().sample.timestamp) {
        spdlog::error("Rejecting out-of-order sample at {} (last is {})",
                      util::format_local_iso8601(sample.timestamp),
                      util::format_local_iso8601(records_.back().sample.timestamp));
        return false;
    }

    auto record = SampleRecord::from_sample(sample);
    std::string tmp_path = options_.json_path + ".tmp";
    std::error_code ec;

    try {
        // Stage the new mirror first so a failed CSV write leaves both files untouched
        auto staged = records_;
        staged.push_back(record);
        if (!write_json_mirror(staged, tmp_path)) {
            fs::remove(tmp_path, ec);
            return false;
        }

        if (!fs::exists(options_.csv_path, ec) && !write_csv_header()) {
            spdlog::error("Cannot recreate metric log {}", options_.csv_path);
            fs::remove(tmp_path, ec);
            return false;
        }
        uintmax_t csv_size = fs::file_size(options_.csv_path, ec);
        if (ec) {
            spdlog::error("Cannot stat metric log {}: {}", options_.csv_path, ec.message());
            fs::remove(tmp_path, ec);
            return false;
        }

        {
            std::ofstream out(options_.csv_path, std::ios::app);
            out << sample_codec::to_csv_row(record) << '\n';
            out.flush();
            if (!out) {
                spdlog::error("Failed to append sample to {}", options_.csv_path);
                out.close();
                truncate_csv(csv_size);
                fs::remove(tmp_path, ec);
                return false;
            }
        }

        fs::rename(tmp_path, options_.json_path, ec);
        if (ec) {
            spdlog::error("Failed to publish JSON mirror {}: {}", options_.json_path, ec.message());
            truncate_csv(csv_size);
            fs::remove(tmp_path, ec);
            return false;
        }

        records_.push_back(record);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Error logging metrics: {}", e.what());
        fs::remove(tmp_path, ec);
        return false;
    }
}

void MetricStore::truncate_csv(uintmax_t size) {
    std::error_code ec;
    fs::resize_file(options_.csv_path, size, ec);
    if (ec) {
        spdlog::error("Could not roll back {} to {} bytes: {}",
                      options_.csv_path, size, ec.message());
    }
}

bool MetricStore::rotate(uintmax_t max_size_bytes) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return rotate_locked(max_size_bytes);
}

bool MetricStore::rotate_locked(uintmax_t max_size_bytes) {
    std::error_code ec;
    if (!fs::exists(options_.csv_path, ec)) {
        return false;
    }
    uintmax_t size = fs::file_size(options_.csv_path, ec);
    if (ec || size <= max_size_bytes) {
        return false;
    }

    // Move the mirror first; the CSV only moves once its mirror is out of the way
    bool json_moved = false;
    if (fs::exists(options_.json_path, ec)) {
        fs::rename(options_.json_path, json_backup_path(), ec);
        if (ec) {
            spdlog::error("Error rotating {}: {}", options_.json_path, ec.message());
            return false;
        }
        json_moved = true;
    }

    fs::rename(options_.csv_path, csv_backup_path(), ec);
    if (ec) {
        spdlog::error("Error rotating {}: {}", options_.csv_path, ec.message());
        if (json_moved) {
            fs::rename(json_backup_path(), options_.json_path, ec);
            if (ec) {
                spdlog::error("Could not restore {}: {}", options_.json_path, ec.message());
            }
        }
        return false;
    }

    records_.clear();
    if (!write_csv_header()) {
        spdlog::error("Failed to reinitialize {} after rotation", options_.csv_path);
    }
    if (!write_json_mirror(records_, options_.json_path)) {
        spdlog::error("Failed to reinitialize {} after rotation", options_.json_path);
    }

    ++rotations_;
    spdlog::info("Rotated metric log to {}", csv_backup_path());
    return true;
}

std::vector<SampleRecord> MetricStore::records_in_window(std::chrono::seconds window,
                                                         util::TimePoint now) const {
    // Windows reaching back past the epoch cover the whole log
    auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
    util::TimePoint cutoff{};
    if (window < since_epoch) {
        cutoff = now - window;
    }

    std::vector<SampleRecord> out;
    for (const auto& r : records_) {
        if (r.sample.timestamp >= cutoff && r.sample.timestamp <= now) {
            out.push_back(r);
        }
    }
    return out;
}

std::map<std::string, std::vector<SampleRecord>>
MetricStore::group_by_band(const std::vector<SampleRecord>& records) {
    std::map<std::string, std::vector<SampleRecord>> groups;
    for (const auto& r : records) {
        groups[r.sample.band].push_back(r);
    }
    return groups;
}

std::optional<MetricsSummary> MetricStore::summary(std::chrono::seconds window) const {
    return summary(window, std::chrono::system_clock::now());
}

std::optional<MetricsSummary> MetricStore::summary(std::chrono::seconds window,
                                                   util::TimePoint now) const {
    std::vector<SampleRecord> recent;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        recent = records_in_window(window, now);
    }

    if (recent.empty()) {
        return std::nullopt;
    }

    MetricsSummary summary;
    summary.total_records = recent.size();
    summary.window = window;

    double n = static_cast<double>(recent.size());
    for (const auto& r : recent) {
        const auto& s = r.sample;
        if (std::find(summary.bands_seen.begin(), summary.bands_seen.end(), s.band) ==
            summary.bands_seen.end()) {
            summary.bands_seen.push_back(s.band);
        }
        summary.averages.rsrp += s.rsrp / n;
        summary.averages.rsrq += s.rsrq / n;
        summary.averages.sinr += s.sinr / n;
        summary.averages.rssi += s.rssi / n;
        summary.averages.bandwidth_score += r.bandwidth_score / n;
        summary.quality_distribution[r.quality]++;
    }

    double best = -1.0;
    double worst = 2.0;
    for (const auto& [band, records] : group_by_band(recent)) {
        double mean = BandAnalyzer::statistics(band, records).bandwidth_score.mean;
        if (mean > best) {
            best = mean;
            summary.best_band = band;
        }
        if (mean < worst) {
            worst = mean;
            summary.worst_band = band;
        }
    }

    return summary;
}

std::map<std::string, BandPerformance> MetricStore::per_band_aggregate() const {
    std::map<std::string, BandPerformance> result;
    for (const auto& [band, records] : group_by_band(snapshot())) {
        result[band] = BandAnalyzer::analyze(band, records);
    }
    return result;
}

std::map<std::string, BandPerformance>
MetricStore::per_band_aggregate(std::chrono::seconds window, util::TimePoint now) const {
    std::vector<SampleRecord> recent;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        recent = records_in_window(window, now);
    }

    std::map<std::string, BandPerformance> result;
    for (const auto& [band, records] : group_by_band(recent)) {
        result[band] = BandAnalyzer::analyze(band, records);
    }
    return result;
}

std::map<std::string, BandStatistics> MetricStore::band_statistics() const {
    std::map<std::string, BandStatistics> result;
    for (const auto& [band, records] : group_by_band(snapshot())) {
        result[band] = BandAnalyzer::statistics(band, records);
    }
    return result;
}

bool MetricStore::export_band_comparison(const std::string& output_path) const {
    auto stats = band_statistics();
    if (stats.empty()) {
        spdlog::warn("No samples recorded yet, nothing to export");
        return false;
    }

    std::ofstream out(output_path, std::ios::trunc);
    out << "band";
    for (const char* field : {"rsrp", "rsrq", "sinr", "bandwidth_score"}) {
        out << fmt::format(",{0}_mean,{0}_std,{0}_min,{0}_max", field);
    }
    out << ",signal_quality_mode\n";

    for (const auto& [band, s] : stats) {
        out << band;
        for (const FieldStats* f : {&s.rsrp, &s.rsrq, &s.sinr, &s.bandwidth_score}) {
            out << fmt::format(",{:.2f},{:.2f},{:.2f},{:.2f}", f->mean, f->std, f->min, f->max);
        }
        out << ',' << to_string(s.modal_quality) << '\n';
    }

    out.flush();
    if (!out) {
        spdlog::error("Error exporting band comparison to {}", output_path);
        return false;
    }

    spdlog::info("Band comparison exported to {}", output_path);
    return true;
}

std::vector<SampleRecord> MetricStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_;
}

size_t MetricStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

size_t MetricStore::rotation_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rotations_;
}
