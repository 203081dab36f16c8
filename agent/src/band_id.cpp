#include "band_id.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace {

const std::map<BandId, BandInfo>& band_table() {
    static const std::map<BandId, BandInfo> table = {
        {BandId::B1,  {1,  "2100 MHz", "20 MHz"}},
        {BandId::B3,  {3,  "1800 MHz", "20 MHz"}},
        {BandId::B7,  {7,  "2600 MHz", "20 MHz"}},
        {BandId::B8,  {8,  "900 MHz",  "10 MHz"}},
        {BandId::B20, {20, "800 MHz",  "10 MHz"}},
        {BandId::B28, {28, "700 MHz",  "10 MHz"}},
        {BandId::B38, {38, "2600 MHz", "20 MHz"}},
        {BandId::B40, {40, "2300 MHz", "20 MHz"}},
    };
    return table;
}

} // namespace

const std::vector<BandId>& all_band_ids() {
    static const std::vector<BandId> ids = [] {
        std::vector<BandId> v;
        for (const auto& [id, _] : band_table()) {
            v.push_back(id);
        }
        return v;
    }();
    return ids;
}

const BandInfo& band_info(BandId band) {
    return band_table().at(band);
}

std::string to_string(BandId band) {
    return "B" + std::to_string(band_info(band).number);
}

std::optional<BandId> parse_band_id(const std::string& text) {
    std::string s;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    if (s.rfind("band", 0) == 0) {
        s = s.substr(4);
    } else if (s.rfind("b", 0) == 0) {
        s = s.substr(1);
    }

    if (s.empty() || s.size() > 3 || !std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return std::nullopt;
    }

    int number = std::stoi(s);
    for (const auto& [id, info] : band_table()) {
        if (info.number == number) return id;
    }
    return std::nullopt;
}

BandCatalog::BandCatalog(const std::vector<std::string>& reported_bands) {
    for (const auto& name : reported_bands) {
        auto id = parse_band_id(name);
        if (id) {
            bands_.insert(*id);
        } else {
            spdlog::warn("Router reported unknown band '{}', ignoring", name);
        }
    }
}

bool BandCatalog::contains(BandId band) const {
    return bands_.count(band) > 0;
}

std::vector<BandId> BandCatalog::bands() const {
    return std::vector<BandId>(bands_.begin(), bands_.end());
}

std::vector<std::string> BandCatalog::band_names() const {
    std::vector<std::string> names;
    for (auto id : bands_) {
        names.push_back(to_string(id));
    }
    return names;
}

void BandCatalog::validate(const BandMask& mask) const {
    if (mask.empty()) {
        throw ConfigurationError("Band mask is empty");
    }

    bool any_enabled = false;
    for (const auto& [band, enabled] : mask) {
        if (!contains(band)) {
            throw ConfigurationError("Band " + to_string(band) + " is not available on this router");
        }
        any_enabled = any_enabled || enabled;
    }

    if (!any_enabled) {
        throw ConfigurationError("Band mask must enable at least one band");
    }
}

BandMask BandCatalog::parse_mask(const std::string& enabled_list) const {
    BandMask mask;
    for (auto id : bands_) {
        mask[id] = false;
    }

    for (const auto& token : util::split(enabled_list, ',')) {
        auto id = parse_band_id(token);
        if (!id) {
            throw ConfigurationError("Unknown band '" + token + "'");
        }
        mask[*id] = true;
    }
    return mask;
}
