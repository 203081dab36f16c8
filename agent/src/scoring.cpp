#include "scoring.hpp"
#include <algorithm>

namespace {

const BandwidthWeights kBandwidthWeights;
const QualityWeights kQualityWeights;

double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

double clamp0(double v) {
    return std::max(0.0, v);
}

} // namespace

double Scoring::normalize_rsrp(double rsrp) {
    return (rsrp + 140.0) / 60.0;
}

double Scoring::normalize_rsrq(double rsrq) {
    return (rsrq + 25.0) / 15.0;
}

double Scoring::normalize_sinr(double sinr) {
    return (sinr + 10.0) / 30.0;
}

double Scoring::bandwidth_score(double sinr, double rsrp) {
    // Higher SINR means better utilization, RSRP affects stability
    return clamp01(normalize_sinr(sinr)) * kBandwidthWeights.w_sinr +
           clamp01(normalize_rsrp(rsrp)) * kBandwidthWeights.w_rsrp;
}

double Scoring::bandwidth_score(const SignalSample& sample) {
    return bandwidth_score(sample.sinr, sample.rsrp);
}

double Scoring::quality_score(double rsrp, double rsrq, double sinr) {
    return clamp0(normalize_rsrp(rsrp)) * kQualityWeights.w_rsrp +
           clamp0(normalize_rsrq(rsrq)) * kQualityWeights.w_rsrq +
           clamp0(normalize_sinr(sinr)) * kQualityWeights.w_sinr;
}

QualityClass Scoring::classify(double quality_score) {
    if (quality_score >= 0.8) return QualityClass::Excellent;
    if (quality_score >= 0.6) return QualityClass::Good;
    if (quality_score >= 0.4) return QualityClass::Fair;
    return QualityClass::Poor;
}

QualityClass Scoring::classify(const SignalSample& sample) {
    return classify(quality_score(sample.rsrp, sample.rsrq, sample.sinr));
}
