#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/band_analyzer.hpp"
#include "../src/scoring.hpp"
#include "test_helpers.hpp"
#include <cmath>

using Catch::Approx;

TEST_CASE("Band performance analysis", "[band_analyzer]") {
    SECTION("Empty input yields zeroed performance") {
        auto perf = BandAnalyzer::analyze("B3", std::vector<SignalSample>{});
        REQUIRE(perf.band == "B3");
        REQUIRE(perf.sample_count == 0);
        REQUIRE(perf.avg_rsrp == 0.0);
        REQUIRE(perf.avg_sinr == 0.0);
        REQUIRE(perf.avg_bandwidth_score == 0.0);
        REQUIRE(perf.stability_score == 0.0);
        REQUIRE(perf.peak_performance == 0.0);
        REQUIRE(perf.off_peak_performance == 0.0);
    }

    SECTION("Splits peak and off-peak SINR by local hour") {
        std::vector<SignalSample> samples = {
            make_sample(util::make_local_time(2026, 10, 18, 7, 15), "B3", 20.0, -90.0),
            make_sample(util::make_local_time(2026, 10, 18, 9, 59), "B3", 10.0, -90.0),
            make_sample(util::make_local_time(2026, 10, 18, 12, 0), "B3", 4.0, -90.0),
            make_sample(util::make_local_time(2026, 10, 18, 18, 30), "B3", 15.0, -90.0),
            make_sample(util::make_local_time(2026, 10, 18, 23, 0), "B3", 2.0, -90.0),
        };

        auto perf = BandAnalyzer::analyze("B3", samples);
        REQUIRE(perf.sample_count == 5);
        REQUIRE(perf.peak_sample_count == 3);
        REQUIRE(perf.off_peak_sample_count == 2);
        REQUIRE(perf.peak_performance == Approx(15.0));
        REQUIRE(perf.off_peak_performance == Approx(3.0));
        REQUIRE(perf.avg_sinr == Approx(10.2));
        REQUIRE(perf.avg_rsrp == Approx(-90.0));
    }

    SECTION("Only off-peak samples leave peak performance at zero") {
        std::vector<SignalSample> samples = {
            make_sample(util::make_local_time(2026, 10, 18, 13, 0), "B7", 8.0, -95.0),
            make_sample(util::make_local_time(2026, 10, 18, 14, 0), "B7", 12.0, -95.0),
        };
        auto perf = BandAnalyzer::analyze("B7", samples);
        REQUIRE(perf.peak_sample_count == 0);
        REQUIRE(perf.peak_performance == 0.0);
        REQUIRE(perf.off_peak_performance == Approx(10.0));
    }

    SECTION("Stability is one minus the population deviation of scores") {
        auto t = util::make_local_time(2026, 10, 18, 12, 0);
        std::vector<SignalSample> samples = {
            make_sample(t, "B20", -10.0, -140.0),                           // score 0.0
            make_sample(t + std::chrono::minutes(1), "B20", 20.0, -80.0),   // score 1.0
        };
        auto perf = BandAnalyzer::analyze("B20", samples);
        REQUIRE(perf.avg_bandwidth_score == Approx(0.5));
        REQUIRE(perf.stability_score == Approx(0.5));
    }

    SECTION("Constant signal is perfectly stable") {
        auto t = util::make_local_time(2026, 10, 18, 12, 0);
        std::vector<SignalSample> samples;
        for (int i = 0; i < 4; ++i) {
            samples.push_back(make_sample(t + std::chrono::minutes(i), "B3", 12.0, -92.0));
        }
        auto perf = BandAnalyzer::analyze("B3", samples);
        REQUIRE(perf.stability_score == Approx(1.0));
        REQUIRE(perf.avg_bandwidth_score == Approx(Scoring::bandwidth_score(12.0, -92.0)));
    }

    SECTION("Record overload agrees with the sample overload") {
        auto t = util::make_local_time(2026, 10, 18, 8, 0);
        std::vector<SignalSample> samples = {
            make_sample(t, "B3", 5.0, -100.0),
            make_sample(t + std::chrono::hours(5), "B3", 15.0, -85.0),
        };
        std::vector<SampleRecord> records;
        for (const auto& s : samples) records.push_back(SampleRecord::from_sample(s));

        REQUIRE(BandAnalyzer::analyze("B3", samples) == BandAnalyzer::analyze("B3", records));
    }
}

TEST_CASE("Band statistics", "[band_analyzer]") {
    SECTION("Field stats use the sample deviation") {
        auto stats = BandAnalyzer::field_stats({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
        REQUIRE(stats.mean == Approx(5.0));
        REQUIRE(stats.std == Approx(std::sqrt(32.0 / 7.0)));
        REQUIRE(stats.min == 2.0);
        REQUIRE(stats.max == 9.0);
    }

    SECTION("A single value has zero deviation") {
        auto stats = BandAnalyzer::field_stats({3.5});
        REQUIRE(stats.mean == 3.5);
        REQUIRE(stats.std == 0.0);
    }

    SECTION("Modal quality breaks ties by first appearance") {
        auto t = util::make_local_time(2026, 10, 18, 12, 0);
        std::vector<SampleRecord> records = {
            SampleRecord::from_sample(make_sample(t, "B3", -5.0, -125.0, -22.0)),   // poor
            SampleRecord::from_sample(make_sample(t, "B3", 22.0, -75.0, -8.0)),     // excellent
            SampleRecord::from_sample(make_sample(t, "B3", 22.0, -75.0, -8.0)),     // excellent
            SampleRecord::from_sample(make_sample(t, "B3", -5.0, -125.0, -22.0)),   // poor
        };
        REQUIRE(records[0].quality == QualityClass::Poor);
        REQUIRE(records[1].quality == QualityClass::Excellent);

        auto stats = BandAnalyzer::statistics("B3", records);
        REQUIRE(stats.count == 4);
        REQUIRE(stats.modal_quality == QualityClass::Poor);
        REQUIRE(stats.sinr.min == -5.0);
        REQUIRE(stats.sinr.max == 22.0);
        REQUIRE(stats.rsrp.mean == Approx(-100.0));
    }
}
