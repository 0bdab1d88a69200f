#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/regulation/SolarAccess.hpp"
#include <algorithm>
#include <cmath>

using namespace site::regulation;
using site::core::Polygon;

TEST_CASE("Solar access slope", "[solar]") {
    SECTION("Base height at the north line") {
        REQUIRE(solarMaxHeight(0.0) == 9.0);
        REQUIRE(solarMaxHeight(-5.0) == 9.0);
    }

    SECTION("Two metres up per metre south") {
        REQUIRE(solarMaxHeight(3.0) == Catch::Approx(15.0));
        REQUIRE(solarMaxHeight(0.5) == Catch::Approx(10.0));
    }

    SECTION("Monotone in distance") {
        double previous = solarMaxHeight(0.0);
        for (double d = 0.25; d < 20.0; d += 0.25) {
            const double h = solarMaxHeight(d);
            REQUIRE(h >= previous);
            previous = h;
        }
    }

    SECTION("Slope distance is the inverse above the base") {
        REQUIRE(solarSlopeDistance(9.0) == 0.0);
        REQUIRE(solarSlopeDistance(6.0) == 0.0);
        REQUIRE(solarSlopeDistance(15.0) == Catch::Approx(3.0));
        REQUIRE(solarMaxHeight(solarSlopeDistance(21.0)) == Catch::Approx(21.0));
    }
}

TEST_CASE("Solar access zones", "[solar]") {
    REQUIRE(isSolarAccessZone(ZoneType::R1Exclusive));
    REQUIRE(isSolarAccessZone(ZoneType::R2Exclusive));
    REQUIRE(isSolarAccessZone(ZoneType::R1General));
    REQUIRE(isSolarAccessZone(ZoneType::R2General));
    REQUIRE(isSolarAccessZone(ZoneType::R3General));

    REQUIRE_FALSE(isSolarAccessZone(ZoneType::RSemi));
    REQUIRE_FALSE(isSolarAccessZone(ZoneType::CCentral));
    REQUIRE_FALSE(isSolarAccessZone(ZoneType::IGeneral));
    REQUIRE_FALSE(isSolarAccessZone(ZoneType::Agriculture));
}

TEST_CASE("North clip line per floor", "[solar]") {
    SECTION("Floors at or below the base height are not clipped") {
        REQUIRE(std::isinf(solarClipNorthZ(10.0, 9.0)));
        REQUIRE(std::isinf(solarClipNorthZ(10.0, 3.0)));
    }

    SECTION("Higher floors move south") {
        REQUIRE(solarClipNorthZ(10.0, 12.0) == Catch::Approx(8.5));
        REQUIRE(solarClipNorthZ(10.0, 15.0) == Catch::Approx(7.0));
        REQUIRE(solarClipNorthZ(10.0, 21.0) < solarClipNorthZ(10.0, 15.0));
    }
}

TEST_CASE("Solar envelope sections", "[solar]") {
    const Polygon square{{0, 0}, {10, 0}, {10, 10}, {0, 10}};

    SECTION("Sections step south until the height cap") {
        auto sections = solarEnvelopeSections(square, 15.0);
        REQUIRE_FALSE(sections.empty());

        double previousH = 0.0;
        double previousZ = 10.0;
        for (const auto& section : sections) {
            REQUIRE(section.z < previousZ);
            REQUIRE(section.h >= previousH);
            REQUIRE(section.h <= 15.0);
            REQUIRE(section.h == Catch::Approx(std::min(solarMaxHeight(10.0 - section.z), 15.0)));
            REQUIRE(section.xMin == Catch::Approx(0.0));
            REQUIRE(section.xMax == Catch::Approx(10.0));
            previousH = section.h;
            previousZ = section.z;
        }

        REQUIRE(sections.back().h == Catch::Approx(15.0));
        REQUIRE(sections.back().z >= 6.5);
    }

    SECTION("Sampling stops at the south edge of a shallow parcel") {
        const Polygon shallow{{0, 0}, {10, 0}, {10, 2}, {0, 2}};
        auto sections = solarEnvelopeSections(shallow, 30.0);
        REQUIRE_FALSE(sections.empty());
        for (const auto& section : sections) {
            REQUIRE(section.z >= 0.0 - 1e-9);
            REQUIRE(section.h < 30.0);
        }
    }

    SECTION("No slope below the base height") {
        REQUIRE(solarEnvelopeSections(square, 9.0).empty());
        REQUIRE(solarEnvelopeSections(square, 6.0).empty());
    }

    SECTION("Degenerate input") {
        REQUIRE(solarEnvelopeSections(Polygon{{0, 0}, {1, 1}}, 15.0).empty());
        REQUIRE(solarEnvelopeSections(square, 15.0, 0.0).empty());
    }

    SECTION("Tiny step is capped at the section limit") {
        const Polygon southOfOrigin{{0, -10}, {10, -10}, {10, 0}, {0, 0}};
        auto sections = solarEnvelopeSections(southOfOrigin, 15.0, 1e-20);
        // 北边线本身不与多边形内部相交，首个采样被跳过
        REQUIRE(sections.size() == kMaxSolarSections - 1);
        REQUIRE(sections.front().z < 0.0);
        REQUIRE(sections.back().z > -1e-15);
    }
}
