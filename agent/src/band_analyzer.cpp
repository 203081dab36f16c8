#include "band_analyzer.hpp"
#include "scoring.hpp"
#include <cmath>
#include <algorithm>
#include <map>

namespace {

double mean_of(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

double population_stddev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double mean = mean_of(values);
    double acc = 0.0;
    for (double v : values) acc += (v - mean) * (v - mean);
    return std::sqrt(acc / static_cast<double>(values.size()));
}

} // namespace

bool BandPerformance::operator==(const BandPerformance& other) const {
    return band == other.band &&
           avg_rsrp == other.avg_rsrp &&
           avg_rsrq == other.avg_rsrq &&
           avg_sinr == other.avg_sinr &&
           avg_bandwidth_score == other.avg_bandwidth_score &&
           stability_score == other.stability_score &&
           peak_performance == other.peak_performance &&
           off_peak_performance == other.off_peak_performance &&
           sample_count == other.sample_count &&
           peak_sample_count == other.peak_sample_count &&
           off_peak_sample_count == other.off_peak_sample_count;
}

bool FieldStats::operator==(const FieldStats& other) const {
    return mean == other.mean && std == other.std &&
           min == other.min && max == other.max;
}

bool BandStatistics::operator==(const BandStatistics& other) const {
    return band == other.band && count == other.count &&
           rsrp == other.rsrp && rsrq == other.rsrq && sinr == other.sinr &&
           bandwidth_score == other.bandwidth_score &&
           modal_quality == other.modal_quality;
}

const std::set<int>& BandAnalyzer::peak_hours() {
    static const std::set<int> hours = {7, 8, 9, 17, 18, 19};
    return hours;
}

BandPerformance BandAnalyzer::analyze(const std::string& band,
                                      const std::vector<SignalSample>& samples) {
    BandPerformance perf;
    perf.band = band;

    if (samples.empty()) {
        return perf;
    }

    std::vector<double> rsrp, rsrq, sinr, scores;
    std::vector<double> peak_sinr, off_peak_sinr;

    for (const auto& s : samples) {
        rsrp.push_back(s.rsrp);
        rsrq.push_back(s.rsrq);
        sinr.push_back(s.sinr);
        scores.push_back(Scoring::bandwidth_score(s.sinr, s.rsrp));

        if (peak_hours().count(util::local_hour(s.timestamp))) {
            peak_sinr.push_back(s.sinr);
        } else {
            off_peak_sinr.push_back(s.sinr);
        }
    }

    perf.avg_rsrp = mean_of(rsrp);
    perf.avg_rsrq = mean_of(rsrq);
    perf.avg_sinr = mean_of(sinr);
    perf.avg_bandwidth_score = mean_of(scores);

    // Lower spread means a more stable band; a spread above 1 goes negative
    perf.stability_score = 1.0 - population_stddev(scores);

    perf.peak_performance = mean_of(peak_sinr);
    perf.off_peak_performance = mean_of(off_peak_sinr);

    perf.sample_count = samples.size();
    perf.peak_sample_count = peak_sinr.size();
    perf.off_peak_sample_count = off_peak_sinr.size();

    return perf;
}

BandPerformance BandAnalyzer::analyze(const std::string& band,
                                      const std::vector<SampleRecord>& records) {
    std::vector<SignalSample> samples;
    samples.reserve(records.size());
    for (const auto& r : records) {
        samples.push_back(r.sample);
    }
    return analyze(band, samples);
}

FieldStats BandAnalyzer::field_stats(const std::vector<double>& values) {
    FieldStats stats;
    if (values.empty()) {
        return stats;
    }

    stats.mean = mean_of(values);
    stats.min = *std::min_element(values.begin(), values.end());
    stats.max = *std::max_element(values.begin(), values.end());

    if (values.size() > 1) {
        double acc = 0.0;
        for (double v : values) acc += (v - stats.mean) * (v - stats.mean);
        stats.std = std::sqrt(acc / static_cast<double>(values.size() - 1));
    }
    return stats;
}

BandStatistics BandAnalyzer::statistics(const std::string& band,
                                        const std::vector<SampleRecord>& records) {
    BandStatistics stats;
    stats.band = band;
    stats.count = records.size();

    if (records.empty()) {
        return stats;
    }

    std::vector<double> rsrp, rsrq, sinr, scores;
    std::map<QualityClass, size_t> counts;
    std::vector<QualityClass> first_seen;

    for (const auto& r : records) {
        rsrp.push_back(r.sample.rsrp);
        rsrq.push_back(r.sample.rsrq);
        sinr.push_back(r.sample.sinr);
        scores.push_back(r.bandwidth_score);

        if (counts[r.quality]++ == 0) {
            first_seen.push_back(r.quality);
        }
    }

    stats.rsrp = field_stats(rsrp);
    stats.rsrq = field_stats(rsrq);
    stats.sinr = field_stats(sinr);
    stats.bandwidth_score = field_stats(scores);

    // Most common class; ties go to the class seen first
    stats.modal_quality = first_seen.front();
    for (auto q : first_seen) {
        if (counts[q] > counts[stats.modal_quality]) {
            stats.modal_quality = q;
        }
    }

    return stats;
}
