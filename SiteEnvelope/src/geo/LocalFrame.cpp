#define _USE_MATH_DEFINES
#include "geo/LocalFrame.hpp"
#include <cmath>
#include <algorithm>

namespace site::geo {

namespace {
    constexpr double toRadians(double degrees) {
        return degrees * M_PI / 180.0;
    }

    // 去掉与首点相同的闭合点
    std::span<const GeoPoint> openRing(std::span<const GeoPoint> ring) noexcept {
        if (ring.size() > 1 && ring.front() == ring.back()) {
            return ring.first(ring.size() - 1);
        }
        return ring;
    }
}

std::optional<GeoBBox> computeBounds(std::span<const GeoPoint> points) noexcept {
    if (points.empty()) {
        return std::nullopt;
    }

    GeoBBox bbox{points[0].longitude, points[0].latitude, points[0].longitude, points[0].latitude};
    for (const auto& point : points) {
        bbox.minLon = std::min(bbox.minLon, point.longitude);
        bbox.maxLon = std::max(bbox.maxLon, point.longitude);
        bbox.minLat = std::min(bbox.minLat, point.latitude);
        bbox.maxLat = std::max(bbox.maxLat, point.latitude);
    }
    return bbox;
}

core::LocalPoint wgs84ToLocal(const GeoPoint& point, const GeoPoint& origin) noexcept {
    const double lonScale = std::cos(toRadians(origin.latitude)) * kMetersPerDegreeLon;
    return {(point.longitude - origin.longitude) * lonScale,
            (point.latitude - origin.latitude) * kMetersPerDegreeLat};
}

GeoPoint localToWgs84(const core::LocalPoint& local, const GeoPoint& origin) noexcept {
    const double lonScale = std::cos(toRadians(origin.latitude)) * kMetersPerDegreeLon;
    return {local.x / lonScale + origin.longitude,
            local.z / kMetersPerDegreeLat + origin.latitude};
}

core::Polygon ringToLocal(std::span<const GeoPoint> ring, const GeoPoint& origin) {
    const auto points = openRing(ring);

    core::Polygon polygon;
    polygon.reserve(points.size());
    for (const auto& point : points) {
        polygon.push_back(wgs84ToLocal(point, origin));
    }
    return polygon;
}

std::optional<GeoPoint> ringCentroid(std::span<const GeoPoint> ring) noexcept {
    const auto points = openRing(ring);
    if (points.empty()) {
        return std::nullopt;
    }

    GeoPoint sum;
    for (const auto& point : points) {
        sum.longitude += point.longitude;
        sum.latitude += point.latitude;
    }
    const auto n = static_cast<double>(points.size());
    return GeoPoint{sum.longitude / n, sum.latitude / n};
}

} // namespace site::geo
