#pragma once

#include "signal_sample.hpp"

// Weights for the [0,1] bandwidth proxy
struct BandwidthWeights {
    double w_sinr = 0.7;
    double w_rsrp = 0.3;
};

// Weights for the signal quality score
struct QualityWeights {
    double w_rsrp = 0.4;
    double w_rsrq = 0.3;
    double w_sinr = 0.3;
};

class Scoring {
public:
    // Both terms saturate to [0,1], so the result is always in [0,1].
    static double bandwidth_score(double sinr, double rsrp);
    static double bandwidth_score(const SignalSample& sample);

    // Terms are floored at 0 but have no upper bound; strong signals can exceed 1.
    static double quality_score(double rsrp, double rsrq, double sinr);

    // >=0.8 excellent, >=0.6 good, >=0.4 fair, else poor
    static QualityClass classify(double quality_score);
    static QualityClass classify(const SignalSample& sample);

private:
    static double normalize_rsrp(double rsrp);  // -140..-80 dBm
    static double normalize_rsrq(double rsrq);  // -25..-10 dB
    static double normalize_sinr(double sinr);  // -10..20 dB
};
