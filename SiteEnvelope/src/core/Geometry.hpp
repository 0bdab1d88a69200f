#pragma once

#include "Types.hpp"
#include <optional>
#include <span>
#include <vector>

namespace site::core {

// 多边形包围盒
struct PolygonBounds {
    double minX{0.0};
    double maxX{0.0};
    double minZ{0.0};
    double maxZ{0.0};

    constexpr double width() const noexcept { return maxX - minX; }
    constexpr double depth() const noexcept { return maxZ - minZ; }
    constexpr bool empty() const noexcept { return minX >= maxX || minZ >= maxZ; }

    constexpr bool contains(const LocalPoint& p) const noexcept {
        return p.x >= minX && p.x <= maxX && p.z >= minZ && p.z <= maxZ;
    }

    constexpr Rect toRect() const noexcept { return Rect{minX, maxX, minZ, maxZ}; }
};

// maxInscribedRect 采样行数上限
inline constexpr int kMaxInscribedRectSteps = 512;

// 平行判定阈值（叉积）
inline constexpr double kParallelEpsilon = 1e-10;

// 纯函数：有向面积（正值 = 逆时针）
[[nodiscard]] double polygonSignedArea(std::span<const LocalPoint> polygon) noexcept;

// 纯函数：面积绝对值
[[nodiscard]] double polygonArea(std::span<const LocalPoint> polygon) noexcept;

// 纯函数：包围盒，空多边形返回 nullopt
[[nodiscard]] std::optional<PolygonBounds> polygonBounds(std::span<const LocalPoint> polygon) noexcept;

// 纯函数：顶点平均值
[[nodiscard]] LocalPoint polygonCentroid(std::span<const LocalPoint> polygon) noexcept;

// 纯函数：以 origin 为中心缩放
[[nodiscard]] Polygon scalePolygon(std::span<const LocalPoint> polygon, const LocalPoint& origin, double factor);

// 纯函数：向内偏移（退让线）
// 相邻偏移边平行时取两偏移点的中点，对锐角或强凹形状只是近似
[[nodiscard]] Polygon polygonInset(std::span<const LocalPoint> polygon, double distance);

// 纯函数：偏移结果的每条边与对应原边同向
// 退让超过半宽时偏移线交叉，得到反向的多边形
[[nodiscard]] bool insetPreservesEdges(std::span<const LocalPoint> polygon,
                                       std::span<const LocalPoint> inset) noexcept;

// 纯函数：射线法点包含测试（半开规则）
[[nodiscard]] bool pointInPolygon(const LocalPoint& point, std::span<const LocalPoint> polygon) noexcept;

// 纯函数：矩形四角均在多边形内
// 不检测凹口穿越；矩形来自栅格，栅格本身已遵守边界
[[nodiscard]] bool isRectInPolygon(const Rect& rect, std::span<const LocalPoint> polygon) noexcept;

// 纯函数：水平线 z 与多边形内部的交段，裁剪到 [xMin, xMax]
[[nodiscard]] std::vector<Interval>
clipHorizontalLine(double z, double xMin, double xMax, std::span<const LocalPoint> polygon);

// 纯函数：竖直线 x 与多边形内部的交段，裁剪到 [zMin, zMax]
[[nodiscard]] std::vector<Interval>
clipVerticalLine(double x, double zMin, double zMax, std::span<const LocalPoint> polygon);

// 纯函数：最大内接轴对齐矩形（按行采样的启发式，O(rows²)）
[[nodiscard]] Rect maxInscribedRect(std::span<const LocalPoint> polygon, int steps = 60);

// 纯函数：Sutherland-Hodgman 裁剪，保留 z <= maxZ 部分
[[nodiscard]] Polygon clipPolygonNorth(std::span<const LocalPoint> polygon, double maxZ);

} // namespace site::core
