#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/regulation/Envelope.hpp"
#include "../src/regulation/SolarAccess.hpp"

using namespace site::regulation;
using namespace site::core;

namespace {

ParcelGeometry parcel10x20(ZoneType zone, std::string id = {}) {
    return {std::move(id), {{0, 0}, {10, 0}, {10, 20}, {0, 20}}, 200.0, zone};
}

} // namespace

TEST_CASE("Per-side setback rectangle", "[envelope]") {
    const Polygon polygon{{0, 0}, {10, 0}, {10, 20}, {0, 20}};
    const ZoneRegulation reg{"테스트", 90, 1000, 0, 0, 3, 2, 1, 1};

    SECTION("Front, rear, left and right map to the cardinal sides") {
        auto rect = setbackRectangle(polygon, reg);
        REQUIRE(rect.size() == 4);
        auto bounds = polygonBounds(rect);
        REQUIRE(bounds->minX == Catch::Approx(1.0));
        REQUIRE(bounds->maxX == Catch::Approx(9.0));
        REQUIRE(bounds->minZ == Catch::Approx(3.0));
        REQUIRE(bounds->maxZ == Catch::Approx(18.0));
        REQUIRE(polygonArea(rect) == Catch::Approx(120.0));
    }

    SECTION("Setbacks exceeding the parcel give nothing") {
        const ZoneRegulation wide{"테스트", 90, 1000, 0, 0, 3, 2, 6, 6};
        REQUIRE(setbackRectangle(polygon, wide).empty());
    }

    SECTION("Raster of the setback area") {
        const ParcelInput input{200.0, ZoneType::CGeneral};
        const auto regulation = calculateRegulations(input, reg);

        EnvelopeConfig config;
        config.setbackMode = SetbackMode::PerSide;
        auto envelope = computeBuildableEnvelope(parcel10x20(ZoneType::CGeneral), regulation, config);

        REQUIRE_FALSE(envelope.empty());
        REQUIRE(envelope.regulationArea == Catch::Approx(120.0));

        // 栅格面积与退让面积相差不超过 5%
        const double rasterArea = static_cast<double>(envelope.cells.size()) * 0.6 * 0.6;
        REQUIRE(rasterArea == Catch::Approx(120.0).epsilon(0.05));
        REQUIRE(envelope.cells.size() == 325);

        // 最大建筑面积 180 > 120，不缩放
        REQUIRE(envelope.footprintArea == Catch::Approx(120.0));
        REQUIRE(envelope.footprintPolygon == envelope.regulationPolygon);
        REQUIRE_FALSE(envelope.solarApplied);
    }
}

TEST_CASE("Envelope floors", "[envelope]") {
    REQUIRE(envelopeFloors(500.0, 120.0, zoneRegulation(ZoneType::R2General)) == 4);
    REQUIRE(envelopeFloors(5000.0, 100.0, zoneRegulation(ZoneType::R2General)) == 7);
    REQUIRE(envelopeFloors(15000.0, 100.0, zoneRegulation(ZoneType::CCentral)) == 50);
    REQUIRE(envelopeFloors(3000.0, 100.0, zoneRegulation(ZoneType::IGeneral)) == 30);
    REQUIRE(envelopeFloors(500.0, 0.0, zoneRegulation(ZoneType::R2General)) == 0);
    REQUIRE(envelopeFloors(500.0, 120.0, zoneRegulation(ZoneType::R2General), 0.0) == 0);

    SECTION("Zones without caps are bounded") {
        REQUIRE(envelopeFloors(12.0, 1e-14, zoneRegulation(ZoneType::IExclusive)) == kMaxEnvelopeFloors);
        REQUIRE(envelopeFloors(1e300, 1e-300, zoneRegulation(ZoneType::IExclusive)) == kMaxEnvelopeFloors);
        REQUIRE(envelopeFloors(3000.0, 100.0, zoneRegulation(ZoneType::IExclusive)) == 30);
    }
}

TEST_CASE("Buildable envelope", "[envelope]") {
    const auto regulation = calculateRegulations(ParcelInput{200.0, ZoneType::R2General});

    SECTION("Footprint is scaled down to the coverage limit") {
        auto envelope = computeBuildableEnvelope(parcel10x20(ZoneType::R2General), regulation);

        REQUIRE(envelope.regulationArea == Catch::Approx(144.0));
        REQUIRE(envelope.footprintArea == Catch::Approx(120.0));
        REQUIRE(polygonArea(envelope.footprintPolygon) == Catch::Approx(120.0));

        // 缩放保持形心
        auto centroid = polygonCentroid(envelope.footprintPolygon);
        REQUIRE(centroid.x == Catch::Approx(5.0));
        REQUIRE(centroid.z == Catch::Approx(10.0));

        REQUIRE(envelope.floors == 4);
        REQUIRE(envelope.volumeHeight == Catch::Approx(12.0));
    }

    SECTION("Solar access steps back the top floor") {
        auto envelope = computeBuildableEnvelope(parcel10x20(ZoneType::R2General), regulation);

        REQUIRE(envelope.solarApplied);
        REQUIRE(envelope.floorEnvelopes.size() == 4);

        for (int i = 0; i < 3; ++i) {
            const auto& level = envelope.floorEnvelopes[i];
            REQUIRE(level.floor == i + 1);
            REQUIRE_FALSE(level.solarClipped);
            REQUIRE(level.area == Catch::Approx(120.0));
            REQUIRE(level.cells.size() == envelope.cells.size());
        }

        const auto& top = envelope.floorEnvelopes[3];
        REQUIRE(top.solarClipped);
        // 北边 19，顶高 12m 需向南退 1.5m
        REQUIRE(top.maxZ == Catch::Approx(17.5));
        REQUIRE(top.area < 120.0);
        REQUIRE(top.depth < envelope.floorEnvelopes[0].depth);
        REQUIRE(top.cells.size() < envelope.cells.size());
        REQUIRE_FALSE(top.cells.empty());
    }

    SECTION("Non-residential zones skip the solar slope") {
        auto semi = calculateRegulations(ParcelInput{200.0, ZoneType::RSemi});
        auto envelope = computeBuildableEnvelope(parcel10x20(ZoneType::RSemi), semi);

        REQUIRE_FALSE(envelope.solarApplied);
        for (const auto& level : envelope.floorEnvelopes) {
            REQUIRE_FALSE(level.solarClipped);
        }
    }

    SECTION("Cache reuses the inset polygon") {
        InsetCache cache;
        auto first = computeBuildableEnvelope(parcel10x20(ZoneType::R2General, "parcel-1"), regulation, {}, &cache);
        auto second = computeBuildableEnvelope(parcel10x20(ZoneType::R2General, "parcel-1"), regulation, {}, &cache);

        REQUIRE(cache.misses() == 1);
        REQUIRE(cache.hits() == 1);
        REQUIRE(first.regulationPolygon == second.regulationPolygon);
        REQUIRE(first.cells == second.cells);
    }

    SECTION("Anonymous parcels bypass the cache") {
        InsetCache cache;
        (void)computeBuildableEnvelope(parcel10x20(ZoneType::R2General), regulation, {}, &cache);
        REQUIRE(cache.size() == 0);
    }

    SECTION("Raster limit keeps the polygon but drops the cells") {
        EnvelopeConfig config;
        config.limits.maxCells = 10;
        auto envelope = computeBuildableEnvelope(parcel10x20(ZoneType::R2General), regulation, config);

        REQUIRE_FALSE(envelope.empty());
        REQUIRE(envelope.cells.empty());
        REQUIRE(envelope.regulationArea == Catch::Approx(144.0));
    }

    SECTION("Degenerate parcel") {
        ParcelGeometry line{"", {{0, 0}, {10, 0}}, 0.0, ZoneType::R2General};
        auto envelope = computeBuildableEnvelope(line, regulation);
        REQUIRE(envelope.empty());
        REQUIRE(envelope.floorEnvelopes.empty());
    }

    SECTION("Uniform setback swallowing the parcel") {
        ParcelGeometry small{"", {{0, 0}, {1.5, 0}, {1.5, 1.5}, {0, 1.5}}, 2.25, ZoneType::IExclusive};
        const auto industrial = calculateRegulations(ParcelInput{2.25, ZoneType::IExclusive});

        auto envelope = computeBuildableEnvelope(small, industrial);
        REQUIRE(envelope.empty());
        REQUIRE(envelope.cells.empty());
        REQUIRE(envelope.floors == 0);
        REQUIRE(envelope.floorEnvelopes.empty());

        InsetCache cache;
        small.id = "small";
        REQUIRE(computeBuildableEnvelope(small, industrial, {}, &cache).empty());
    }

    SECTION("Uniform setback leaving a small core") {
        ParcelGeometry square{"", {{0, 0}, {3, 0}, {3, 3}, {0, 3}}, 9.0, ZoneType::IExclusive};
        auto envelope = computeBuildableEnvelope(square, calculateRegulations(ParcelInput{9.0, ZoneType::IExclusive}));
        REQUIRE_FALSE(envelope.empty());
        REQUIRE(envelope.regulationArea == Catch::Approx(1.0));
        REQUIRE(envelope.floors == 27);
        REQUIRE(envelope.floorEnvelopes.size() == 27);
    }

    SECTION("Sliver footprint below one grid cell") {
        const double side = 2.0005;
        ParcelGeometry sliver{"", {{0, 0}, {side, 0}, {side, side}, {0, side}}, side * side, ZoneType::IExclusive};
        auto envelope = computeBuildableEnvelope(sliver, calculateRegulations(ParcelInput{side * side, ZoneType::IExclusive}));

        REQUIRE(envelope.empty());
        REQUIRE(envelope.floors == 0);
        REQUIRE(envelope.floorEnvelopes.empty());
    }

    SECTION("Setback swallowing the parcel") {
        ParcelGeometry tiny{"", {{0, 0}, {2, 0}, {2, 2}, {0, 2}}, 4.0, ZoneType::GNatural};
        EnvelopeConfig config;
        config.setbackMode = SetbackMode::PerSide;
        auto envelope = computeBuildableEnvelope(tiny, calculateRegulations(ParcelInput{4.0, ZoneType::GNatural}), config);
        REQUIRE(envelope.empty());
    }
}
