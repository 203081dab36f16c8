#include <catch2/catch_test_macros.hpp>
#include "../src/band_id.hpp"
#include "../src/errors.hpp"

TEST_CASE("Band identifiers", "[band_id]") {
    SECTION("Accepts common spellings") {
        REQUIRE(parse_band_id("B3") == BandId::B3);
        REQUIRE(parse_band_id("b20") == BandId::B20);
        REQUIRE(parse_band_id("Band7") == BandId::B7);
        REQUIRE(parse_band_id("Band 28") == BandId::B28);
        REQUIRE(parse_band_id("40") == BandId::B40);
    }

    SECTION("Rejects unknown bands") {
        REQUIRE_FALSE(parse_band_id("B2").has_value());
        REQUIRE_FALSE(parse_band_id("").has_value());
        REQUIRE_FALSE(parse_band_id("Bx").has_value());
    }

    SECTION("Canonical names and band info") {
        REQUIRE(to_string(BandId::B3) == "B3");
        REQUIRE(band_info(BandId::B3).number == 3);
        REQUIRE(band_info(BandId::B3).frequency == "1800 MHz");
        REQUIRE(all_band_ids().size() == 8);
    }
}

TEST_CASE("Band catalog", "[band_id]") {
    BandCatalog catalog({"B3", "Band7", "B20", "B99"});

    SECTION("Keeps only recognised bands") {
        REQUIRE(catalog.contains(BandId::B3));
        REQUIRE(catalog.contains(BandId::B7));
        REQUIRE_FALSE(catalog.contains(BandId::B1));
        REQUIRE(catalog.band_names() == std::vector<std::string>{"B3", "B7", "B20"});
    }

    SECTION("Parsed masks cover every catalog band") {
        auto mask = catalog.parse_mask("B3, B20");
        REQUIRE(mask.size() == 3);
        REQUIRE(mask.at(BandId::B3));
        REQUIRE_FALSE(mask.at(BandId::B7));
        REQUIRE(mask.at(BandId::B20));
        REQUIRE_NOTHROW(catalog.validate(mask));
    }

    SECTION("Unknown names in a mask list throw") {
        REQUIRE_THROWS_AS(catalog.parse_mask("B3,B99"), ConfigurationError);
    }

    SECTION("Invalid masks throw") {
        REQUIRE_THROWS_AS(catalog.validate(BandMask{}), ConfigurationError);
        REQUIRE_THROWS_AS(catalog.validate({{BandId::B1, true}}), ConfigurationError);
        REQUIRE_THROWS_AS(catalog.validate({{BandId::B3, false}}), ConfigurationError);
    }

    SECTION("Empty catalog reports itself") {
        REQUIRE(BandCatalog().empty());
        REQUIRE_FALSE(catalog.empty());
    }
}
