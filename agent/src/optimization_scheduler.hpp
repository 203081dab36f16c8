#pragma once

#include "config.hpp"
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

using OptimizationHandler = std::function<void(util::TimePoint now)>;

// Fires a handler once per day at each configured time of day. Times that
// already passed when the scheduler is primed wait for the next day.
class OptimizationScheduler {
public:
    OptimizationScheduler(std::vector<TimeOfDay> times,
                          OptimizationHandler handler,
                          std::chrono::milliseconds check_interval = std::chrono::seconds(60));
    ~OptimizationScheduler();

    OptimizationScheduler(const OptimizationScheduler&) = delete;
    OptimizationScheduler& operator=(const OptimizationScheduler&) = delete;

    void start();
    bool stop(std::chrono::milliseconds grace = std::chrono::seconds(5));
    bool is_running() const { return running_; }

    void prime(util::TimePoint now);

    // Runs every time that came due at `now`; returns how many fired
    int poll(util::TimePoint now);

    const std::vector<TimeOfDay>& times() const { return times_; }

private:
    std::vector<TimeOfDay> times_;
    OptimizationHandler handler_;
    std::chrono::milliseconds check_interval_;

    std::map<int, int> last_fired_day_;  // minute of day -> day index

    std::atomic<bool> running_{false};
    std::thread scheduler_thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool exited_ = true;

    void scheduler_loop();
};
