#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/regulation/ZoneTable.hpp"
#include <set>

using namespace site::regulation;

TEST_CASE("Zone table covers every zone", "[zone]") {
    const auto& zones = allZoneTypes();
    REQUIRE(zones.size() == 20);

    std::set<std::string_view> names;
    for (auto zone : zones) {
        const auto& reg = zoneRegulation(zone);
        INFO(zoneTypeName(zone));

        REQUIRE(reg.maxCoverageRatio > 0.0);
        REQUIRE(reg.maxFloorAreaRatio > 0.0);
        REQUIRE(reg.maxHeight >= 0.0);
        REQUIRE(reg.maxFloors >= 0);
        REQUIRE(reg.setbackFront >= 0.0);
        REQUIRE(reg.setbackRear >= 0.0);
        REQUIRE(reg.setbackLeft >= 0.0);
        REQUIRE(reg.setbackRight >= 0.0);
        REQUIRE_FALSE(reg.nameKo.empty());

        names.insert(zoneTypeName(zone));
    }
    REQUIRE(names.size() == 20);
}

TEST_CASE("Zone table values", "[zone]") {
    SECTION("Second-class general residential") {
        const auto& reg = zoneRegulation(ZoneType::R2General);
        REQUIRE(reg.nameKo == "제2종일반주거지역");
        REQUIRE(reg.maxCoverageRatio == 60.0);
        REQUIRE(reg.maxFloorAreaRatio == 250.0);
        REQUIRE(reg.maxHeight == 21.0);
        REQUIRE(reg.maxFloors == 7);
        REQUIRE(reg.setbackFront == 2.0);
        REQUIRE(reg.setbackRear == 1.5);
        REQUIRE(reg.hasHeightCap());
        REQUIRE(reg.hasFloorLimit());
    }

    SECTION("Central commercial has no height cap") {
        const auto& reg = zoneRegulation(ZoneType::CCentral);
        REQUIRE(reg.maxCoverageRatio == 90.0);
        REQUIRE(reg.maxFloorAreaRatio == 1500.0);
        REQUIRE_FALSE(reg.hasHeightCap());
        REQUIRE(reg.maxFloors == 50);
    }

    SECTION("Industrial zones are unlimited in height and floors") {
        for (auto zone : {ZoneType::IExclusive, ZoneType::IGeneral, ZoneType::ISemi}) {
            const auto& reg = zoneRegulation(zone);
            REQUIRE_FALSE(reg.hasHeightCap());
            REQUIRE_FALSE(reg.hasFloorLimit());
        }
    }
}

TEST_CASE("Zone type names", "[zone]") {
    SECTION("Name and parse are inverse") {
        for (auto zone : allZoneTypes()) {
            auto parsed = parseZoneType(zoneTypeName(zone));
            REQUIRE(parsed.has_value());
            REQUIRE(*parsed == zone);
        }
    }

    SECTION("Known names") {
        REQUIRE(zoneTypeName(ZoneType::R2General) == "ZONE_R2_GENERAL");
        REQUIRE(zoneTypeName(ZoneType::Agriculture) == "ZONE_AGRICULTURE");
        REQUIRE(parseZoneType("ZONE_R_SEMI") == ZoneType::RSemi);
    }

    SECTION("Unknown names are rejected") {
        auto parsed = parseZoneType("ZONE_UNKNOWN");
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error() == RegulationError::InvalidZoneType);

        REQUIRE_FALSE(parseZoneType("").has_value());
        REQUIRE_FALSE(parseZoneType("zone_r2_general").has_value());
    }

    SECTION("Error names") {
        REQUIRE(regulationErrorName(RegulationError::InvalidZoneType) == "InvalidZoneType");
        REQUIRE(regulationErrorName(RegulationError::InvalidParcelArea) == "InvalidParcelArea");
    }
}
