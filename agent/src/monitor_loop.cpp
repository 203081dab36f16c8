#include "monitor_loop.hpp"
#include "scoring.hpp"
#include <spdlog/spdlog.h>

MonitorLoop::MonitorLoop(RouterClient& router,
                         MetricStore& store,
                         DecisionEngine& engine,
                         std::chrono::milliseconds interval)
    : router_(router)
    , store_(store)
    , engine_(engine)
    , interval_(interval)
{}

MonitorLoop::~MonitorLoop() {
    stop();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
}

void MonitorLoop::start() {
    if (running_) {
        spdlog::warn("Monitor loop already running");
        return;
    }
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        exited_ = false;
    }
    running_ = true;
    monitor_thread_ = std::thread(&MonitorLoop::monitor_loop, this);
    spdlog::info("Started continuous monitoring every {} ms", interval_.count());
}

bool MonitorLoop::stop(std::chrono::milliseconds grace) {
    if (!monitor_thread_.joinable()) {
        return true;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    stop_requested_ = true;
    cv_.notify_all();

    bool confirmed = cv_.wait_for(lock, grace, [this] { return exited_; });
    lock.unlock();

    if (!confirmed) {
        // A router call is still in flight; the thread is joined on destruction
        spdlog::warn("Monitor loop did not stop within {} ms", grace.count());
        return false;
    }

    monitor_thread_.join();
    spdlog::info("Continuous monitoring stopped");
    return true;
}

std::optional<util::TimePoint> MonitorLoop::last_sample_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sample_ts_;
}

bool MonitorLoop::tick() {
    ++ticks_;

    auto sample = router_.get_signal_sample();
    if (!sample) {
        ++failed_ticks_;
        spdlog::warn("No signal sample from router, skipping tick");
        return false;
    }

    auto quality = Scoring::classify(*sample);
    spdlog::info("Band: {} | RSRP: {:.1f} dBm | SINR: {:.1f} dB | Quality: {}",
                 sample->band, sample->rsrp, sample->sinr, to_string(quality));

    if (!store_.append(*sample)) {
        ++failed_ticks_;
        spdlog::error("Dropping sample from {}: metric log write failed", sample->band);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_sample_ts_ = sample->timestamp;
    }

    engine_.on_sample(*sample);
    return true;
}

void MonitorLoop::monitor_loop() {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) break;
        }

        try {
            tick();
        } catch (const std::exception& e) {
            ++failed_ticks_;
            spdlog::error("Error in monitoring loop: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, interval_, [this] { return stop_requested_; });
    }

    running_ = false;
    std::lock_guard<std::mutex> lock(mutex_);
    exited_ = true;
    cv_.notify_all();
}
