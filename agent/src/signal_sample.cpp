#include "signal_sample.hpp"
#include "scoring.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <vector>

std::string to_string(QualityClass quality) {
    switch (quality) {
        case QualityClass::Excellent: return "excellent";
        case QualityClass::Good: return "good";
        case QualityClass::Fair: return "fair";
        case QualityClass::Poor: return "poor";
    }
    return "poor";
}

std::optional<QualityClass> parse_quality_class(const std::string& text) {
    if (text == "excellent") return QualityClass::Excellent;
    if (text == "good") return QualityClass::Good;
    if (text == "fair") return QualityClass::Fair;
    if (text == "poor") return QualityClass::Poor;
    return std::nullopt;
}

SampleRecord SampleRecord::from_sample(const SignalSample& sample) {
    SampleRecord record;
    record.sample = sample;
    record.quality = Scoring::classify(
        Scoring::quality_score(sample.rsrp, sample.rsrq, sample.sinr));
    record.bandwidth_score = Scoring::bandwidth_score(sample.sinr, sample.rsrp);
    return record;
}

namespace sample_codec {

const char* const kCsvHeader =
    "timestamp,band,rsrp,rsrq,sinr,rssi,cell_id,plmn,signal_quality,bandwidth_score";

namespace {

std::string escape_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else if (c != '\r') {
            current += c;
        }
    }
    fields.push_back(current);
    return fields;
}

} // namespace

std::string to_csv_row(const SampleRecord& record) {
    const auto& s = record.sample;
    return fmt::format("{},{},{},{},{},{},{},{},{},{}",
                       util::format_local_iso8601(s.timestamp),
                       escape_field(s.band),
                       s.rsrp, s.rsrq, s.sinr, s.rssi,
                       escape_field(s.cell_id),
                       escape_field(s.plmn),
                       to_string(record.quality),
                       record.bandwidth_score);
}

std::optional<SampleRecord> from_csv_row(const std::string& line) {
    auto fields = split_fields(line);
    if (fields.size() != 10) {
        return std::nullopt;
    }

    auto ts = util::parse_local_iso8601(fields[0]);
    auto quality = parse_quality_class(fields[8]);
    if (!ts || !quality) {
        return std::nullopt;
    }

    try {
        SampleRecord record;
        record.sample.timestamp = *ts;
        record.sample.band = fields[1];
        record.sample.rsrp = std::stod(fields[2]);
        record.sample.rsrq = std::stod(fields[3]);
        record.sample.sinr = std::stod(fields[4]);
        record.sample.rssi = std::stod(fields[5]);
        record.sample.cell_id = fields[6];
        record.sample.plmn = fields[7];
        record.quality = *quality;
        record.bandwidth_score = std::stod(fields[9]);
        return record;
    } catch (const std::exception& e) {
        spdlog::debug("Unparseable metric row '{}': {}", line, e.what());
        return std::nullopt;
    }
}

nlohmann::json to_json(const SampleRecord& record) {
    const auto& s = record.sample;
    return {
        {"timestamp", util::format_local_iso8601(s.timestamp)},
        {"band", s.band},
        {"rsrp", s.rsrp},
        {"rsrq", s.rsrq},
        {"sinr", s.sinr},
        {"rssi", s.rssi},
        {"cell_id", s.cell_id},
        {"plmn", s.plmn},
        {"signal_quality", to_string(record.quality)},
        {"bandwidth_score", record.bandwidth_score}
    };
}

std::optional<SampleRecord> from_json(const nlohmann::json& j) {
    try {
        auto ts = util::parse_local_iso8601(j.at("timestamp").get<std::string>());
        auto quality = parse_quality_class(j.at("signal_quality").get<std::string>());
        if (!ts || !quality) return std::nullopt;

        SampleRecord record;
        record.sample.timestamp = *ts;
        record.sample.band = j.at("band").get<std::string>();
        record.sample.rsrp = j.at("rsrp").get<double>();
        record.sample.rsrq = j.at("rsrq").get<double>();
        record.sample.sinr = j.at("sinr").get<double>();
        record.sample.rssi = j.at("rssi").get<double>();
        record.sample.cell_id = j.at("cell_id").get<std::string>();
        record.sample.plmn = j.at("plmn").get<std::string>();
        record.quality = *quality;
        record.bandwidth_score = j.at("bandwidth_score").get<double>();
        return record;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Unparseable metric record: {}", e.what());
        return std::nullopt;
    }
}

} // namespace sample_codec
