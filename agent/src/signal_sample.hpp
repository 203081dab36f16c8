#pragma once

#include "util.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

enum class QualityClass {
    Poor,
    Fair,
    Good,
    Excellent
};

std::string to_string(QualityClass quality);
std::optional<QualityClass> parse_quality_class(const std::string& text);

struct SignalSample {
    util::TimePoint timestamp;
    std::string band;
    double rsrp = 0.0;   // dBm
    double rsrq = 0.0;   // dB
    double sinr = 0.0;   // dB
    double rssi = 0.0;   // dBm
    std::string cell_id;
    std::string plmn;
};

// A sample as written to the metric log, with its derived scores cached.
struct SampleRecord {
    SignalSample sample;
    QualityClass quality = QualityClass::Poor;
    double bandwidth_score = 0.0;

    static SampleRecord from_sample(const SignalSample& sample);
};

namespace sample_codec {
    extern const char* const kCsvHeader;

    std::string to_csv_row(const SampleRecord& record);
    std::optional<SampleRecord> from_csv_row(const std::string& line);

    nlohmann::json to_json(const SampleRecord& record);
    std::optional<SampleRecord> from_json(const nlohmann::json& j);
}
