#pragma once

#include "core/Types.hpp"
#include <optional>
#include <span>
#include <vector>

namespace site::geo {

// 等距圆柱近似的每度米数（经度需乘 cos(纬度)）
inline constexpr double kMetersPerDegreeLon = 111320.0;
inline constexpr double kMetersPerDegreeLat = 110540.0;

// WGS84 地理坐标点
struct GeoPoint {
    double longitude{0.0};
    double latitude{0.0};

    constexpr GeoPoint() = default;
    constexpr GeoPoint(double lon, double lat) : longitude(lon), latitude(lat) {}

    constexpr bool operator==(const GeoPoint&) const = default;
};

// WGS84 地理坐标包围盒
struct GeoBBox {
    double minLon{0.0};
    double minLat{0.0};
    double maxLon{0.0};
    double maxLat{0.0};

    constexpr double width() const noexcept { return maxLon - minLon; }
    constexpr double height() const noexcept { return maxLat - minLat; }
    constexpr GeoPoint center() const noexcept {
        return {(minLon + maxLon) * 0.5, (minLat + maxLat) * 0.5};
    }
    constexpr bool empty() const noexcept { return width() <= 0.0 || height() <= 0.0; }

    constexpr bool contains(const GeoPoint& p) const noexcept {
        return p.longitude >= minLon && p.longitude <= maxLon &&
               p.latitude >= minLat && p.latitude <= maxLat;
    }
};

// 纯函数：从点集合计算包围盒
[[nodiscard]] std::optional<GeoBBox> computeBounds(std::span<const GeoPoint> points) noexcept;

// 纯函数：相对 origin 的局部米坐标（适用于 10km 以内）
[[nodiscard]] core::LocalPoint wgs84ToLocal(const GeoPoint& point, const GeoPoint& origin) noexcept;

// 纯函数：wgs84ToLocal 的逆变换
[[nodiscard]] GeoPoint localToWgs84(const core::LocalPoint& local, const GeoPoint& origin) noexcept;

// 纯函数：GeoJSON 闭合环转局部多边形，首尾重复点被去掉
[[nodiscard]] core::Polygon ringToLocal(std::span<const GeoPoint> ring, const GeoPoint& origin);

// 纯函数：环的顶点平均（不计闭合点），空环返回 nullopt
[[nodiscard]] std::optional<GeoPoint> ringCentroid(std::span<const GeoPoint> ring) noexcept;

} // namespace site::geo
