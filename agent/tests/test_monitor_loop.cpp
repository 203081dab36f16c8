#include <catch2/catch_test_macros.hpp>
#include "../src/monitor_loop.hpp"
#include "fake_router_client.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <thread>

using namespace std::chrono_literals;

namespace {

MetricStoreOptions options_in(const TempDir& dir) {
    MetricStoreOptions opts;
    opts.csv_path = dir.file("lte_metrics.csv");
    opts.json_path = dir.file("lte_metrics.json");
    return opts;
}

DecisionConfig quiet_config() {
    DecisionConfig cfg;
    cfg.band_settle = 0ms;
    cfg.mask_settle = 0ms;
    return cfg;
}

} // namespace

TEST_CASE("Monitor loop ticks", "[monitor_loop]") {
    TempDir dir;
    MetricStore store(options_in(dir));
    FakeRouterClient router;
    DecisionEngine engine(router, store, quiet_config());
    MonitorLoop loop(router, store, engine, 1s);

    SECTION("Successful tick persists the sample") {
        REQUIRE(loop.tick());
        REQUIRE(store.size() == 1);
        REQUIRE(loop.ticks() == 1);
        REQUIRE(loop.failed_ticks() == 0);
        REQUIRE(loop.last_sample_time().has_value());
        REQUIRE(router.set_band_calls.empty());
    }

    SECTION("Unreachable router skips the tick") {
        router.reachable = false;
        REQUIRE_FALSE(loop.tick());
        REQUIRE(store.size() == 0);
        REQUIRE(loop.failed_ticks() == 1);
        REQUIRE_FALSE(loop.last_sample_time().has_value());
    }

    SECTION("A sample the store rejects is dropped") {
        auto now = std::chrono::system_clock::now();
        REQUIRE(store.append(make_sample(now + 1h, "B3", 10.0, -90.0)));
        router.queue_sample(make_sample(now, "B7", 10.0, -90.0));

        REQUIRE_FALSE(loop.tick());
        REQUIRE(store.size() == 1);
        REQUIRE(loop.failed_ticks() == 1);
    }

    SECTION("Write failure drops the sample and the loop keeps going") {
        std::filesystem::remove(store.json_path());
        std::filesystem::create_directory(store.json_path());

        REQUIRE_FALSE(loop.tick());
        REQUIRE(loop.failed_ticks() == 1);
        REQUIRE(store.size() == 0);
        REQUIRE_FALSE(loop.last_sample_time().has_value());

        std::filesystem::remove(store.json_path());
        REQUIRE(loop.tick());
        REQUIRE(loop.ticks() == 2);
        REQUIRE(loop.failed_ticks() == 1);
        REQUIRE(store.size() == 1);
    }

    SECTION("Loop recovers after the router comes back") {
        router.reachable = false;
        REQUIRE_FALSE(loop.tick());
        router.reachable = true;
        REQUIRE(loop.tick());
        REQUIRE(loop.ticks() == 2);
        REQUIRE(store.size() == 1);
    }
}

TEST_CASE("Monitor loop lifecycle", "[monitor_loop]") {
    TempDir dir;
    MetricStore store(options_in(dir));
    FakeRouterClient router;
    DecisionEngine engine(router, store, quiet_config());

    SECTION("Polls repeatedly until stopped") {
        MonitorLoop loop(router, store, engine, 10ms);
        loop.start();
        REQUIRE(loop.is_running());

        for (int i = 0; i < 200 && loop.ticks() < 3; ++i) {
            std::this_thread::sleep_for(10ms);
        }

        REQUIRE(loop.stop(2s));
        REQUIRE_FALSE(loop.is_running());
        REQUIRE(loop.ticks() >= 3);
        REQUIRE(store.size() >= 1);
    }

    SECTION("Stop interrupts a long wait") {
        MonitorLoop loop(router, store, engine, 1h);
        loop.start();
        for (int i = 0; i < 200 && loop.ticks() < 1; ++i) {
            std::this_thread::sleep_for(5ms);
        }

        auto begin = std::chrono::steady_clock::now();
        REQUIRE(loop.stop(2s));
        REQUIRE(std::chrono::steady_clock::now() - begin < 2s);
        REQUIRE(loop.ticks() == 1);
    }

    SECTION("Stop without start is a no-op") {
        MonitorLoop loop(router, store, engine, 10ms);
        REQUIRE(loop.stop());
        REQUIRE_FALSE(loop.is_running());
    }
}
