#pragma once

#include "signal_sample.hpp"
#include "band_id.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

// Boundary to the router's management API. Implementations own transport,
// session and authentication; callers only see results.
class RouterClient {
public:
    virtual ~RouterClient() = default;

    virtual bool authenticate() = 0;

    // nullopt on transport failure
    virtual std::optional<SignalSample> get_signal_sample() = 0;

    virtual std::vector<std::string> get_available_bands() = 0;
    virtual bool set_band(const std::string& band) = 0;
    virtual bool set_band_mask(const BandMask& mask) = 0;
    virtual BandMask get_current_band_config() = 0;
    virtual nlohmann::json get_connection_status() = 0;

    virtual void close() = 0;
};
