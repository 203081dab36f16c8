#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/config.hpp"
#include "../src/errors.hpp"
#include <cstdlib>

using Catch::Approx;

namespace {

// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~EnvGuard() { unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST_CASE("Time of day parsing", "[config]") {
    SECTION("Valid times") {
        auto t = Config::parse_time_of_day("07:30");
        REQUIRE(t.hour == 7);
        REQUIRE(t.minute == 30);
        REQUIRE(t.minute_of_day() == 450);
        REQUIRE(Config::parse_time_of_day("23:59").minute_of_day() == 1439);
    }

    SECTION("Invalid times throw") {
        REQUIRE_THROWS_AS(Config::parse_time_of_day("7"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parse_time_of_day("24:00"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parse_time_of_day("12:60"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parse_time_of_day("ab:cd"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parse_time_of_day("12:3x"), ConfigurationError);
    }

    SECTION("Time lists") {
        auto times = Config::parse_times("07:00, 17:00,10:00");
        REQUIRE(times.size() == 3);
        REQUIRE(times[1] == TimeOfDay{17, 0});
        REQUIRE(Config::parse_times("").empty());
    }
}

TEST_CASE("Peak window parsing", "[config]") {
    SECTION("Default windows") {
        auto windows = Config::parse_peak_windows("morning=07:00-09:00,evening=17:00-19:00");
        REQUIRE(windows.size() == 2);
        REQUIRE(windows[0].name == "morning");
        REQUIRE(windows[0].start == TimeOfDay{7, 0});
        REQUIRE(windows[0].end == TimeOfDay{9, 0});
        REQUIRE(windows[1].name == "evening");
    }

    SECTION("Hour matching includes the whole end hour") {
        auto windows = Config::parse_peak_windows("morning=07:00-09:00");
        REQUIRE(windows[0].contains_hour(7));
        REQUIRE(windows[0].contains_hour(9));
        REQUIRE_FALSE(windows[0].contains_hour(6));
        REQUIRE_FALSE(windows[0].contains_hour(10));
    }

    SECTION("Malformed windows throw") {
        REQUIRE_THROWS_AS(Config::parse_peak_windows("07:00-09:00"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parse_peak_windows("morning=07:00"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parse_peak_windows("=07:00-09:00"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parse_peak_windows("late=19:00-17:00"), ConfigurationError);
    }
}

TEST_CASE("Configuration from environment", "[config]") {
    SECTION("Overrides are read") {
        EnvGuard ip("ROUTER_IP", "10.0.0.1");
        EnvGuard threshold("AUTO_SWITCH_THRESHOLD", "0.7");
        EnvGuard enabled("AUTO_SWITCH_ENABLED", "false");
        EnvGuard rotate("MAX_LOG_SIZE_BYTES", "2048");

        auto cfg = Config::from_env();
        REQUIRE(cfg.router_ip == "10.0.0.1");
        REQUIRE(cfg.auto_switch_threshold == Approx(0.7));
        REQUIRE_FALSE(cfg.auto_switch_enabled);
        REQUIRE(cfg.max_log_size_bytes == 2048);
        REQUIRE_NOTHROW(cfg.validate());
    }

    SECTION("Unparseable values fall back to defaults") {
        EnvGuard interval("MEASUREMENT_INTERVAL_SECONDS", "often");
        EnvGuard enabled("AUTO_SWITCH_ENABLED", "maybe");

        auto cfg = Config::from_env();
        REQUIRE(cfg.measurement_interval_seconds == 30);
        REQUIRE(cfg.auto_switch_enabled);
    }

    SECTION("Validation rejects bad values") {
        EnvGuard ip("ROUTER_IP", "10.0.0.1");
        auto cfg = Config::from_env();

        auto bad = cfg;
        bad.auto_switch_threshold = 1.5;
        REQUIRE_THROWS_AS(bad.validate(), ConfigurationError);

        bad = cfg;
        bad.measurement_interval_seconds = 0;
        REQUIRE_THROWS_AS(bad.validate(), ConfigurationError);

        bad = cfg;
        bad.router_ip.clear();
        REQUIRE_THROWS_AS(bad.validate(), ConfigurationError);

        bad = cfg;
        bad.max_log_size_bytes = -1;
        REQUIRE_THROWS_AS(bad.validate(), ConfigurationError);
    }
}
