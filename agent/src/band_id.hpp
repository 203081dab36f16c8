#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>

enum class BandId {
    B1,
    B3,
    B7,
    B8,
    B20,
    B28,
    B38,
    B40
};

using BandMask = std::map<BandId, bool>;

struct BandInfo {
    int number;
    std::string frequency;   // e.g. "1800 MHz"
    std::string bandwidth;   // e.g. "20 MHz"
};

const std::vector<BandId>& all_band_ids();
const BandInfo& band_info(BandId band);

// Canonical form is "B3"
std::string to_string(BandId band);

// Accepts "B3", "b3", "Band3", "Band 3" and "3"
std::optional<BandId> parse_band_id(const std::string& text);

// Bands the router reported at startup. Masks are validated against it
// before they reach the decision engine.
class BandCatalog {
public:
    BandCatalog() = default;
    explicit BandCatalog(const std::vector<std::string>& reported_bands);

    bool contains(BandId band) const;
    bool empty() const { return bands_.empty(); }
    std::vector<BandId> bands() const;
    std::vector<std::string> band_names() const;

    // Throws ConfigurationError for unknown bands or a mask with nothing enabled
    void validate(const BandMask& mask) const;

    // "B3,B7" -> {B3: true, B7: true, every other catalog band: false}
    BandMask parse_mask(const std::string& enabled_list) const;

private:
    std::set<BandId> bands_;
};
