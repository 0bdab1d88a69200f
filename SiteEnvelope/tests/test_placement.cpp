#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/regulation/Placement.hpp"
#include <vector>

using namespace site::regulation;
using namespace site::core;

namespace {

StaticModuleCatalog makeCatalog() {
    return StaticModuleCatalog{{
        {"A", "Unit A", 3.6, 2.4, 3.0, 6, 4},
        {"B", "Core B", 1.2, 1.2, 3.0, 2, 2},
    }};
}

ModulePlacement place(std::string id, std::string moduleId, int gx, int gz, int floor = 1,
                      Rotation rotation = Rotation::Deg0) {
    return {std::move(id), std::move(moduleId), gx, gz, rotation, floor};
}

const Polygon kBoundary{{0, 0}, {12, 0}, {12, 12}, {0, 12}};

} // namespace

TEST_CASE("Module catalog", "[placement]") {
    auto catalog = makeCatalog();

    REQUIRE(catalog.size() == 2);
    REQUIRE(catalog.find("A") != nullptr);
    REQUIRE(catalog.find("A")->footprintArea() == Catch::Approx(8.64));
    REQUIRE(catalog.find("missing") == nullptr);

    // 同 id 覆盖
    catalog.add({"A", "Unit A v2", 6.0, 3.0, 3.0, 10, 5});
    REQUIRE(catalog.size() == 2);
    REQUIRE(catalog.find("A")->name == "Unit A v2");
}

TEST_CASE("Placement rectangle", "[placement]") {
    const auto catalog = makeCatalog();
    const GridFrame frame{0.6, 0.0, 0.0};
    const auto& module = *catalog.find("A");

    auto rect = placementRect(place("p", "A", 1, 2), module, frame);
    REQUIRE(rect.minX == Catch::Approx(0.6));
    REQUIRE(rect.maxX == Catch::Approx(4.2));
    REQUIRE(rect.minZ == Catch::Approx(1.2));
    REQUIRE(rect.maxZ == Catch::Approx(3.6));

    auto rotated = placementRect(place("p", "A", 0, 0, 1, Rotation::Deg90), module, frame);
    REQUIRE(rotated.width() == Catch::Approx(2.4));
    REQUIRE(rotated.depth() == Catch::Approx(3.6));
}

TEST_CASE("Placement summary", "[placement]") {
    const auto catalog = makeCatalog();
    const GridFrame frame{0.6, 0.0, 0.0};

    SECTION("Footprint is the largest floor and floor area is the sum") {
        const std::vector<ModulePlacement> placements{
            place("p1", "A", 1, 1, 1),
            place("p2", "A", 1, 1, 2),
            place("p3", "B", 10, 10, 1),
            place("p4", "ghost", 2, 2, 1),
        };

        auto summary = summarizePlacements(placements, catalog, kBoundary, 144.0, frame);

        REQUIRE(summary.totalFootprintArea == Catch::Approx(8.64 + 1.44));
        REQUIRE(summary.totalFloorArea == Catch::Approx(8.64 * 2 + 1.44));
        REQUIRE(summary.maxHeight == Catch::Approx(6.0));
        REQUIRE(summary.maxFloor == 2);
        REQUIRE(summary.allWithinBoundary);
        REQUIRE(summary.parcelArea == 144.0);
        REQUIRE(summary.placementCount == 4);
        REQUIRE(summary.skippedPlacements == 1);
    }

    SECTION("Module outside the boundary") {
        const std::vector<ModulePlacement> placements{
            place("p1", "A", 1, 1),
            place("edge", "B", 19, 1),
        };
        auto summary = summarizePlacements(placements, catalog, kBoundary, 144.0, frame);
        REQUIRE_FALSE(summary.allWithinBoundary);
    }

    SECTION("No placements") {
        auto summary = summarizePlacements({}, catalog, kBoundary, 144.0, frame);
        REQUIRE(summary.totalFootprintArea == 0.0);
        REQUIRE(summary.maxFloor == 0);
        REQUIRE(summary.allWithinBoundary);
    }
}

TEST_CASE("Occupancy and collision detection", "[placement]") {
    const auto catalog = makeCatalog();
    const std::vector<ModulePlacement> existing{place("p1", "A", 1, 1, 1)};
    const OccupancyMap occupancy{existing, catalog};
    const auto allowed = gridCellsInPolygon(kBoundary, 0.6, 0.0, 0.0);

    SECTION("Occupied cells") {
        REQUIRE(occupancy.occupiedCount() == 24);
        REQUIRE(occupancy.occupant(1, 1, 1) == "p1");
        REQUIRE(occupancy.occupant(1, 6, 4) == "p1");
        REQUIRE_FALSE(occupancy.occupant(1, 7, 1).has_value());
        REQUIRE_FALSE(occupancy.occupant(2, 1, 1).has_value());
    }

    SECTION("Overlap on the same floor") {
        const auto& module = *catalog.find("B");
        REQUIRE(occupancy.conflicts(place("c", "B", 6, 4), module) == std::vector<std::string>{"p1"});
        REQUIRE(occupancy.conflicts(place("c", "B", 6, 4), module, "p1").empty());
        REQUIRE(occupancy.conflicts(place("c", "B", 6, 4, 2), module).empty());
    }

    SECTION("Valid placement") {
        auto result = validatePlacement(place("new", "B", 10, 10), catalog, occupancy, allowed);
        REQUIRE(result.valid);
        REQUIRE_FALSE(result.reason.has_value());
    }

    SECTION("Unknown module") {
        auto result = validatePlacement(place("new", "ghost", 10, 10), catalog, occupancy, allowed);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.reason == "unknown module: ghost");
    }

    SECTION("Outside the buildable cells") {
        auto result = validatePlacement(place("new", "B", 19, 0), catalog, occupancy, allowed);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.reason == "outside buildable cells");
    }

    SECTION("Overlap is rejected with the conflicting ids") {
        auto result = validatePlacement(place("new", "B", 6, 4), catalog, occupancy, allowed);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.reason == "overlaps existing placement");
        REQUIRE(result.conflictingIds == std::vector<std::string>{"p1"});
    }

    SECTION("Moving a placement ignores its own cells") {
        auto result = validatePlacement(place("p1", "A", 2, 1), catalog, occupancy, allowed);
        REQUIRE(result.valid);
    }

    SECTION("Empty module footprint is never inside") {
        ModuleDefinition empty{"E", "Empty", 0.0, 0.0, 0.0, 0, 0};
        REQUIRE_FALSE(isPlacementInCells(place("e", "E", 1, 1), empty, allowed));
    }
}
