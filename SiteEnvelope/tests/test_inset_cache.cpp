#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/core/InsetCache.hpp"

using namespace site::core;

TEST_CASE("Inset cache memoizes by polygon id and distance", "[inset-cache]") {
    InsetCache cache;
    const Polygon square{{0, 0}, {10, 0}, {10, 10}, {0, 10}};

    SECTION("Second lookup is a hit") {
        const auto& first = cache.inset("parcel-1", square, 1.0);
        REQUIRE(cache.misses() == 1);
        REQUIRE(cache.hits() == 0);
        REQUIRE(polygonArea(first) == Catch::Approx(64.0));

        const auto& second = cache.inset("parcel-1", square, 1.0);
        REQUIRE(cache.hits() == 1);
        REQUIRE(&first == &second);
        REQUIRE(cache.size() == 1);
    }

    SECTION("Cached result equals a fresh computation") {
        REQUIRE(cache.inset("parcel-1", square, 2.0) == polygonInset(square, 2.0));
    }

    SECTION("Different distances are separate entries") {
        (void)cache.inset("parcel-1", square, 1.0);
        (void)cache.inset("parcel-1", square, 2.0);
        (void)cache.inset("parcel-2", square, 1.0);
        REQUIRE(cache.size() == 3);
        REQUIRE(cache.contains("parcel-1", 2.0));
        REQUIRE_FALSE(cache.contains("parcel-1", 3.0));
    }

    SECTION("Non-positive distances share the identity entry") {
        const auto& zero = cache.inset("parcel-1", square, 0.0);
        REQUIRE(zero == square);
        (void)cache.inset("parcel-1", square, -1.0);
        REQUIRE(cache.size() == 1);
        REQUIRE(cache.hits() == 1);
        REQUIRE(cache.contains("parcel-1", -5.0));
    }

    SECTION("Invalidate drops only the given polygon") {
        (void)cache.inset("parcel-1", square, 1.0);
        (void)cache.inset("parcel-1", square, 2.0);
        (void)cache.inset("parcel-2", square, 1.0);

        cache.invalidate("parcel-1");
        REQUIRE(cache.size() == 1);
        REQUIRE_FALSE(cache.contains("parcel-1", 1.0));
        REQUIRE(cache.contains("parcel-2", 1.0));

        // 失效后重新计算
        (void)cache.inset("parcel-1", square, 1.0);
        REQUIRE(cache.misses() == 4);
    }

    SECTION("Clear resets counters") {
        (void)cache.inset("parcel-1", square, 1.0);
        (void)cache.inset("parcel-1", square, 1.0);
        cache.clear();
        REQUIRE(cache.size() == 0);
        REQUIRE(cache.hits() == 0);
        REQUIRE(cache.misses() == 0);
    }
}
