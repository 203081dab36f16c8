#include "optimization_scheduler.hpp"
#include <spdlog/spdlog.h>

OptimizationScheduler::OptimizationScheduler(std::vector<TimeOfDay> times,
                                             OptimizationHandler handler,
                                             std::chrono::milliseconds check_interval)
    : times_(std::move(times))
    , handler_(std::move(handler))
    , check_interval_(check_interval)
{}

OptimizationScheduler::~OptimizationScheduler() {
    stop();
    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }
}

void OptimizationScheduler::prime(util::TimePoint now) {
    int today = util::local_day_index(now);
    int minute = util::local_minute_of_day(now);

    last_fired_day_.clear();
    for (const auto& t : times_) {
        if (t.minute_of_day() <= minute) {
            last_fired_day_[t.minute_of_day()] = today;
        }
    }
}

int OptimizationScheduler::poll(util::TimePoint now) {
    int today = util::local_day_index(now);
    int minute = util::local_minute_of_day(now);
    int fired = 0;

    for (const auto& t : times_) {
        if (t.minute_of_day() > minute) continue;

        auto it = last_fired_day_.find(t.minute_of_day());
        if (it != last_fired_day_.end() && it->second == today) continue;

        last_fired_day_[t.minute_of_day()] = today;
        ++fired;

        spdlog::info("Running scheduled optimization ({:02d}:{:02d})", t.hour, t.minute);
        try {
            handler_(now);
        } catch (const std::exception& e) {
            spdlog::error("Scheduled optimization failed: {}", e.what());
        }
    }
    return fired;
}

void OptimizationScheduler::start() {
    if (running_) {
        spdlog::warn("Optimization scheduler already running");
        return;
    }
    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }

    prime(std::chrono::system_clock::now());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        exited_ = false;
    }
    running_ = true;
    scheduler_thread_ = std::thread(&OptimizationScheduler::scheduler_loop, this);

    for (const auto& t : times_) {
        spdlog::info("Optimization scheduled daily at {:02d}:{:02d}", t.hour, t.minute);
    }
}

bool OptimizationScheduler::stop(std::chrono::milliseconds grace) {
    if (!scheduler_thread_.joinable()) {
        return true;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    stop_requested_ = true;
    cv_.notify_all();

    bool confirmed = cv_.wait_for(lock, grace, [this] { return exited_; });
    lock.unlock();

    if (!confirmed) {
        spdlog::warn("Optimization scheduler did not stop within {} ms", grace.count());
        return false;
    }

    scheduler_thread_.join();
    spdlog::info("Optimization scheduler stopped");
    return true;
}

void OptimizationScheduler::scheduler_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, check_interval_, [this] { return stop_requested_; })) {
                break;
            }
        }

        try {
            poll(std::chrono::system_clock::now());
        } catch (const std::exception& e) {
            spdlog::error("Scheduler loop error: {}", e.what());
        }
    }

    running_ = false;
    std::lock_guard<std::mutex> lock(mutex_);
    exited_ = true;
    cv_.notify_all();
}
