#pragma once

#include "router_client.hpp"
#include <curl/curl.h>
#include <mutex>
#include <string>

struct RouterCredentials {
    std::string ip;
    std::string username;
    std::string password;
};

// JSON-over-HTTP client for Huawei LTE routers. One easy handle with an
// in-memory cookie jar holds the session; requests are serialized.
class HuaweiRouterClient : public RouterClient {
public:
    HuaweiRouterClient(RouterCredentials credentials, int timeout_ms);
    ~HuaweiRouterClient() override;

    HuaweiRouterClient(const HuaweiRouterClient&) = delete;
    HuaweiRouterClient& operator=(const HuaweiRouterClient&) = delete;

    bool authenticate() override;
    std::optional<SignalSample> get_signal_sample() override;
    std::vector<std::string> get_available_bands() override;
    bool set_band(const std::string& band) override;
    bool set_band_mask(const BandMask& mask) override;
    BandMask get_current_band_config() override;
    nlohmann::json get_connection_status() override;
    void close() override;

private:
    struct Response {
        long status = 0;
        nlohmann::json body;
        bool ok() const { return status >= 200 && status < 300; }
    };

    RouterCredentials credentials_;
    std::string base_url_;
    int timeout_ms_;
    CURL* curl_;
    std::mutex mutex_;

    // Throws TransportError when the router cannot be reached
    Response make_request(const std::string& method, const std::string& path,
                          const nlohmann::json& payload = nullptr);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static double read_number(const nlohmann::json& data, const char* key);
    static std::string read_string(const nlohmann::json& data, const char* key);
};
