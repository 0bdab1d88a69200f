#pragma once
#include <vector>
#include <cstddef>

namespace site::core {

// 基本类型
struct Vec3 {
    double x, y, z;
};

// 地块局部坐标（米），x 向东，z 向北
struct LocalPoint {
    double x{0.0};
    double z{0.0};

    constexpr bool operator==(const LocalPoint&) const = default;
};

// 简单多边形，顶点顺序任意（由有向面积判断）
using Polygon = std::vector<LocalPoint>;

// 轴对齐矩形
struct Rect {
    double minX{0.0};
    double maxX{0.0};
    double minZ{0.0};
    double maxZ{0.0};

    constexpr double width() const noexcept { return maxX - minX; }
    constexpr double depth() const noexcept { return maxZ - minZ; }
    constexpr double area() const noexcept { return empty() ? 0.0 : width() * depth(); }
    constexpr bool empty() const noexcept { return minX >= maxX || minZ >= maxZ; }

    constexpr bool operator==(const Rect&) const = default;
};

// 一维区间（裁剪结果）
struct Interval {
    double start{0.0};
    double end{0.0};

    constexpr double length() const noexcept { return end - start; }
};

// 三维线段（线框输出）
struct Segment3 {
    Vec3 a;
    Vec3 b;
};

// 多边形判定的最小边数
inline constexpr std::size_t kMinPolygonPoints = 3;

} // namespace site::core
