#pragma once

#include "../src/router_client.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>

// Scripted router: returns queued samples (or a fixed one) and records every
// band change it is asked to make.
class FakeRouterClient : public RouterClient {
public:
    std::string current_band = "B7";
    bool reachable = true;
    bool accept_switch = true;
    std::vector<std::string> available = {"B3", "B7", "B20"};

    std::vector<std::string> set_band_calls;
    std::vector<BandMask> set_mask_calls;
    std::atomic<int> sample_calls{0};

    // Runs before every sample request, outside the fake's lock
    std::function<void()> before_sample;

    SignalSample base_sample() const {
        SignalSample s;
        s.timestamp = std::chrono::system_clock::now();
        s.band = current_band;
        s.rsrp = -90.0;
        s.rsrq = -10.0;
        s.sinr = 10.0;
        s.rssi = -65.0;
        s.cell_id = "12345";
        s.plmn = "26201";
        return s;
    }

    void queue_sample(const SignalSample& s) {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_.push_back(s);
    }

    bool authenticate() override { return reachable; }

    std::optional<SignalSample> get_signal_sample() override {
        if (before_sample) before_sample();
        std::lock_guard<std::mutex> lock(mutex_);
        ++sample_calls;
        if (!reachable) return std::nullopt;
        if (!queued_.empty()) {
            auto s = queued_.front();
            queued_.pop_front();
            return s;
        }
        return base_sample();
    }

    std::vector<std::string> get_available_bands() override { return available; }

    bool set_band(const std::string& band) override {
        std::lock_guard<std::mutex> lock(mutex_);
        set_band_calls.push_back(band);
        if (!accept_switch) return false;
        current_band = band;
        return true;
    }

    bool set_band_mask(const BandMask& mask) override {
        std::lock_guard<std::mutex> lock(mutex_);
        set_mask_calls.push_back(mask);
        mask_ = mask;
        return accept_switch;
    }

    BandMask get_current_band_config() override { return mask_; }

    nlohmann::json get_connection_status() override {
        return {{"DeviceName", "FakeRouter"}};
    }

    void close() override {}

private:
    std::mutex mutex_;
    std::deque<SignalSample> queued_;
    BandMask mask_;
};
