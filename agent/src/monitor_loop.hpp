#pragma once

#include "router_client.hpp"
#include "metric_store.hpp"
#include "decision_engine.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

// Polls the router on a fixed interval, persists each sample and hands it to
// the decision engine. A failed tick is logged and the loop waits the full
// interval before trying again.
class MonitorLoop {
public:
    MonitorLoop(RouterClient& router,
                MetricStore& store,
                DecisionEngine& engine,
                std::chrono::milliseconds interval);
    ~MonitorLoop();

    MonitorLoop(const MonitorLoop&) = delete;
    MonitorLoop& operator=(const MonitorLoop&) = delete;

    void start();

    // Returns false if the loop did not confirm shutdown within the grace period
    bool stop(std::chrono::milliseconds grace = std::chrono::seconds(5));

    bool is_running() const { return running_; }

    // One poll iteration; true when a sample was fetched and persisted
    bool tick();

    uint64_t ticks() const { return ticks_; }
    uint64_t failed_ticks() const { return failed_ticks_; }
    std::optional<util::TimePoint> last_sample_time() const;

private:
    RouterClient& router_;
    MetricStore& store_;
    DecisionEngine& engine_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::thread monitor_thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool exited_ = true;

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> failed_ticks_{0};
    std::optional<util::TimePoint> last_sample_ts_;

    void monitor_loop();
};
