#pragma once

#include "signal_sample.hpp"
#include <string>
#include <vector>
#include <set>

struct BandPerformance {
    std::string band;
    double avg_rsrp = 0.0;
    double avg_rsrq = 0.0;
    double avg_sinr = 0.0;
    double avg_bandwidth_score = 0.0;
    double stability_score = 0.0;      // 1 - stddev(bandwidth score), not clamped
    double peak_performance = 0.0;     // mean SINR during peak hours
    double off_peak_performance = 0.0; // mean SINR outside peak hours

    size_t sample_count = 0;
    size_t peak_sample_count = 0;
    size_t off_peak_sample_count = 0;

    bool operator==(const BandPerformance& other) const;
};

struct FieldStats {
    double mean = 0.0;
    double std = 0.0;   // sample stddev, 0 with fewer than two values
    double min = 0.0;
    double max = 0.0;

    bool operator==(const FieldStats& other) const;
};

// Per-band export row
struct BandStatistics {
    std::string band;
    size_t count = 0;
    FieldStats rsrp;
    FieldStats rsrq;
    FieldStats sinr;
    FieldStats bandwidth_score;
    QualityClass modal_quality = QualityClass::Poor;

    bool operator==(const BandStatistics& other) const;
};

class BandAnalyzer {
public:
    static const std::set<int>& peak_hours();  // 7,8,9,17,18,19

    // Empty input yields a zeroed BandPerformance carrying only the band name.
    static BandPerformance analyze(const std::string& band,
                                   const std::vector<SignalSample>& samples);
    static BandPerformance analyze(const std::string& band,
                                   const std::vector<SampleRecord>& records);

    static BandStatistics statistics(const std::string& band,
                                     const std::vector<SampleRecord>& records);

    static FieldStats field_stats(const std::vector<double>& values);
};
