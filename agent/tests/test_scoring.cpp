#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/scoring.hpp"

using Catch::Approx;

TEST_CASE("Bandwidth score", "[scoring]") {
    SECTION("Stays within [0,1] across and beyond the sensor range") {
        for (double sinr = -40.0; sinr <= 60.0; sinr += 2.5) {
            for (double rsrp = -180.0; rsrp <= -20.0; rsrp += 5.0) {
                double score = Scoring::bandwidth_score(sinr, rsrp);
                REQUIRE(score >= 0.0);
                REQUIRE(score <= 1.0);
            }
        }
    }

    SECTION("Non-decreasing in SINR and in RSRP") {
        for (double rsrp = -150.0; rsrp <= -60.0; rsrp += 10.0) {
            double previous = -1.0;
            for (double sinr = -20.0; sinr <= 30.0; sinr += 1.0) {
                double score = Scoring::bandwidth_score(sinr, rsrp);
                REQUIRE(score >= previous);
                previous = score;
            }
        }
        for (double sinr = -20.0; sinr <= 30.0; sinr += 5.0) {
            double previous = -1.0;
            for (double rsrp = -150.0; rsrp <= -60.0; rsrp += 2.0) {
                double score = Scoring::bandwidth_score(sinr, rsrp);
                REQUIRE(score >= previous);
                previous = score;
            }
        }
    }

    SECTION("RSRP term saturates above -80 dBm") {
        REQUIRE(Scoring::bandwidth_score(20.0, -60.0) == Scoring::bandwidth_score(20.0, -50.0));
        REQUIRE(Scoring::bandwidth_score(20.0, -60.0) == Approx(1.0));
    }

    SECTION("Weights SINR 70/30 over RSRP") {
        // SINR 5 -> 0.5, RSRP -110 -> 0.5
        REQUIRE(Scoring::bandwidth_score(5.0, -110.0) == Approx(0.5));
        // SINR floor, RSRP ceiling
        REQUIRE(Scoring::bandwidth_score(-30.0, -70.0) == Approx(0.3));
    }

    SECTION("Sample overload matches the raw form") {
        SignalSample s;
        s.sinr = 15.0;
        s.rsrp = -85.0;
        REQUIRE(Scoring::bandwidth_score(s) == Scoring::bandwidth_score(15.0, -85.0));
    }
}

TEST_CASE("Quality score", "[scoring]") {
    SECTION("Lower bound clamps to zero") {
        REQUIRE(Scoring::quality_score(-200.0, -40.0, -30.0) == 0.0);
    }

    SECTION("Upper bound is not clamped") {
        // 0.4*1.5 + 0.3*(25/15) + 0.3*(50/30)
        REQUIRE(Scoring::quality_score(-50.0, 0.0, 40.0) == Approx(1.6));
        REQUIRE(Scoring::quality_score(-50.0, 0.0, 40.0) > 1.0);
    }

    SECTION("Nominal mid-range values") {
        // RSRP -110 -> 0.5, RSRQ -17.5 -> 0.5, SINR 5 -> 0.5
        REQUIRE(Scoring::quality_score(-110.0, -17.5, 5.0) == Approx(0.5));
    }
}

TEST_CASE("Quality classification", "[scoring]") {
    SECTION("Threshold boundaries") {
        REQUIRE(Scoring::classify(0.8) == QualityClass::Excellent);
        REQUIRE(Scoring::classify(0.7999) == QualityClass::Good);
        REQUIRE(Scoring::classify(0.6) == QualityClass::Good);
        REQUIRE(Scoring::classify(0.5999) == QualityClass::Fair);
        REQUIRE(Scoring::classify(0.4) == QualityClass::Fair);
        REQUIRE(Scoring::classify(0.3999) == QualityClass::Poor);
        REQUIRE(Scoring::classify(0.0) == QualityClass::Poor);
    }

    SECTION("Scores above 1 are still excellent") {
        REQUIRE(Scoring::classify(1.6) == QualityClass::Excellent);
    }

    SECTION("Classifies a sample through its quality score") {
        SignalSample strong;
        strong.rsrp = -75.0;
        strong.rsrq = -8.0;
        strong.sinr = 22.0;
        REQUIRE(Scoring::classify(strong) == QualityClass::Excellent);

        SignalSample weak;
        weak.rsrp = -125.0;
        weak.rsrq = -22.0;
        weak.sinr = -5.0;
        REQUIRE(Scoring::classify(weak) == QualityClass::Poor);
    }

    SECTION("Class names") {
        REQUIRE(to_string(QualityClass::Good) == "good");
        REQUIRE(parse_quality_class("fair") == QualityClass::Fair);
        REQUIRE_FALSE(parse_quality_class("great").has_value());
    }
}
