#include "huawei_router_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

HuaweiRouterClient::HuaweiRouterClient(RouterCredentials credentials, int timeout_ms)
    : credentials_(std::move(credentials))
    , base_url_("http://" + credentials_.ip)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_COOKIEFILE, "");
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 0L);
}

HuaweiRouterClient::~HuaweiRouterClient() {
    close();
}

size_t HuaweiRouterClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HuaweiRouterClient::Response HuaweiRouterClient::make_request(const std::string& method,
                                                              const std::string& path,
                                                              const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!curl_) {
        throw TransportError("Router session is closed");
    }

    std::string url = base_url_ + path;
    std::string response_string;
    std::string body;
    struct curl_slist* headers = nullptr;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

    if (method == "POST") {
        body = payload.is_null() ? "{}" : payload.dump();
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, static_cast<struct curl_slist*>(nullptr));
    }

    CURLcode res = curl_easy_perform(curl_);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, static_cast<struct curl_slist*>(nullptr));
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        throw TransportError(std::string("Router request ") + path + " failed: " +
                             curl_easy_strerror(res));
    }

    Response response;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);

    if (!response_string.empty()) {
        try {
            response.body = nlohmann::json::parse(response_string);
        } catch (const nlohmann::json::exception& e) {
            spdlog::debug("Non-JSON router response from {}: {}", path, e.what());
        }
    }
    return response;
}

double HuaweiRouterClient::read_number(const nlohmann::json& data, const char* key) {
    if (!data.contains(key)) return 0.0;
    const auto& v = data[key];
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        // Firmware reports values like "-95dBm"
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

std::string HuaweiRouterClient::read_string(const nlohmann::json& data, const char* key) {
    if (!data.contains(key)) return "Unknown";
    const auto& v = data[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "Unknown";
    return v.dump();
}

bool HuaweiRouterClient::authenticate() {
    try {
        auto response = make_request("POST", "/api/user/login", {
            {"username", credentials_.username},
            {"password", credentials_.password}
        });

        if (response.ok()) {
            spdlog::info("Authentication successful");
            return true;
        }
        spdlog::error("Authentication failed: {}", response.status);
        return false;

    } catch (const std::exception& e) {
        spdlog::error("Authentication error: {}", e.what());
        return false;
    }
}

std::optional<SignalSample> HuaweiRouterClient::get_signal_sample() {
    try {
        auto response = make_request("GET", "/api/device/signal");
        if (!response.ok() || !response.body.is_object()) {
            spdlog::error("Failed to get signal metrics: {}", response.status);
            return std::nullopt;
        }

        const auto& data = response.body;
        SignalSample sample;
        sample.timestamp = std::chrono::system_clock::now();
        sample.band = read_string(data, "band");
        sample.rsrp = read_number(data, "rsrp");
        sample.rsrq = read_number(data, "rsrq");
        sample.sinr = read_number(data, "sinr");
        sample.rssi = read_number(data, "rssi");
        sample.cell_id = read_string(data, "cell_id");
        sample.plmn = read_string(data, "plmn");
        return sample;

    } catch (const std::exception& e) {
        spdlog::error("Error getting signal metrics: {}", e.what());
        return std::nullopt;
    }
}

std::vector<std::string> HuaweiRouterClient::get_available_bands() {
    std::vector<std::string> defaults;
    for (auto id : all_band_ids()) {
        defaults.push_back(to_string(id));
    }

    try {
        auto response = make_request("GET", "/api/device/band");
        if (!response.ok() || !response.body.contains("bands")) {
            spdlog::warn("Could not retrieve available bands, using default list");
            return defaults;
        }

        std::vector<std::string> bands;
        const auto& list = response.body["bands"];
        if (list.is_array()) {
            for (const auto& b : list) {
                if (b.is_string()) bands.push_back(b.get<std::string>());
            }
        } else if (list.is_object()) {
            for (const auto& [name, _] : list.items()) {
                bands.push_back(name);
            }
        }
        return bands.empty() ? defaults : bands;

    } catch (const std::exception& e) {
        spdlog::error("Error getting available bands: {}", e.what());
        return defaults;
    }
}

bool HuaweiRouterClient::set_band(const std::string& band) {
    try {
        auto response = make_request("POST", "/api/device/band", {
            {"band", band},
            {"action", "set"}
        });

        if (response.ok()) {
            spdlog::info("Successfully set LTE band to {}", band);
            return true;
        }
        spdlog::error("Failed to set band {}: {}", band, response.status);
        return false;

    } catch (const std::exception& e) {
        spdlog::error("Error setting band {}: {}", band, e.what());
        return false;
    }
}

bool HuaweiRouterClient::set_band_mask(const BandMask& mask) {
    nlohmann::json bands = nlohmann::json::object();
    for (const auto& [band, enabled] : mask) {
        bands["Band" + std::to_string(band_info(band).number)] = enabled;
    }

    try {
        auto response = make_request("POST", "/api/device/band", {
            {"action", "set_bands"},
            {"bands", bands}
        });

        if (response.ok()) {
            return true;
        }
        spdlog::error("Failed to set bands configuration: {}", response.status);
        return false;

    } catch (const std::exception& e) {
        spdlog::error("Error setting bands configuration: {}", e.what());
        return false;
    }
}

BandMask HuaweiRouterClient::get_current_band_config() {
    BandMask mask;
    try {
        auto response = make_request("GET", "/api/device/band");
        if (!response.ok()) {
            spdlog::error("Failed to get band configuration: {}", response.status);
            return mask;
        }
        if (!response.body.contains("bands") || !response.body["bands"].is_object()) {
            return mask;
        }

        for (const auto& [name, enabled] : response.body["bands"].items()) {
            auto id = parse_band_id(name);
            if (id && enabled.is_boolean()) {
                mask[*id] = enabled.get<bool>();
            }
        }

    } catch (const std::exception& e) {
        spdlog::error("Error getting band configuration: {}", e.what());
    }
    return mask;
}

nlohmann::json HuaweiRouterClient::get_connection_status() {
    try {
        auto response = make_request("GET", "/api/device/information");
        if (response.ok() && response.body.is_object()) {
            return response.body;
        }
    } catch (const std::exception& e) {
        spdlog::error("Error getting connection status: {}", e.what());
    }
    return nlohmann::json::object();
}

void HuaweiRouterClient::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}
