#pragma once

#include "Types.hpp"
#include "Geometry.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_set>
#include <utility>
#include <vector>

namespace site::core {

// 模数网格尺寸（米），3M/6M 体系
inline constexpr double kDefaultGridSize = 0.6;

// 标准层高（米）
inline constexpr double kDefaultFloorHeight = 3.0;

// 网格单元键：两个 32 位坐标打包成一个 64 位整数
using CellKey = std::uint64_t;
using CellSet = std::unordered_set<CellKey>;

[[nodiscard]] constexpr CellKey packCell(std::int32_t gx, std::int32_t gz) noexcept {
    return (static_cast<CellKey>(static_cast<std::uint32_t>(gx)) << 32) |
           static_cast<CellKey>(static_cast<std::uint32_t>(gz));
}

[[nodiscard]] constexpr std::int32_t cellX(CellKey key) noexcept {
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(key >> 32));
}

[[nodiscard]] constexpr std::int32_t cellZ(CellKey key) noexcept {
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(key & 0xFFFFFFFFu));
}

// 网格坐标系：单元 (gx, gz) 的世界原点为 (gx*gridSize+offsetX, gz*gridSize+offsetZ)
struct GridFrame {
    double gridSize{kDefaultGridSize};
    double offsetX{0.0};
    double offsetZ{0.0};

    constexpr bool valid() const noexcept { return gridSize > 0.0; }
};

// 栅格化资源上限，防止异常多边形（如公里级）耗尽内存
struct RasterLimits {
    size_t maxCells{1'000'000};  // 0.6m 网格下约 600m x 600m
};

// 一行中连续单元的区间
struct RowSpan {
    std::int32_t gz{0};
    std::int32_t minGx{0};
    std::int32_t maxGx{0};
    double z{0.0};     // 行的南边
    double minX{0.0};  // 首个单元西边
    double maxX{0.0};  // 末个单元东边
};

// 单元集合的整数包围盒
struct CellBounds {
    std::int32_t minGx{0};
    std::int32_t maxGx{0};
    std::int32_t minGz{0};
    std::int32_t maxGz{0};
};

struct GridPosition {
    std::int32_t gridX{0};
    std::int32_t gridZ{0};

    constexpr bool operator==(const GridPosition&) const = default;
};

// 模块旋转（度）
enum class Rotation {
    Deg0,
    Deg90,
    Deg180,
    Deg270
};

// 地块网格线（每 majorEvery 条为主线）
struct GridLines {
    std::vector<Segment3> minor;
    std::vector<Segment3> major;
};

// 纯函数：包围盒外扩一格后的单元数估计，退化输入返回 0
[[nodiscard]] size_t estimateCellCount(std::span<const LocalPoint> polygon, double gridSize) noexcept;

// 纯函数：中心点落在多边形内的单元集合
// 超出 limits 或网格尺寸非法时返回空集合
[[nodiscard]] CellSet gridCellsInPolygon(std::span<const LocalPoint> polygon,
                                         double gridSize, double offsetX, double offsetZ,
                                         const RasterLimits& limits = {});

// 纯函数：按 (gz, gx) 排序的单元键
[[nodiscard]] std::vector<CellKey> sortedCells(const CellSet& cells);

// 纯函数：按行合并连续单元，行按 gz 升序
[[nodiscard]] std::vector<RowSpan> cellsToRowSpans(const CellSet& cells,
                                                   double gridSize, double offsetX, double offsetZ);

// 纯函数：暴露面的线框边，高度 y
[[nodiscard]] std::vector<Segment3> cellsBoundaryEdges(const CellSet& cells,
                                                       double gridSize, double offsetX, double offsetZ,
                                                       double y);

// 纯函数：单元包围盒，空集合返回 nullopt
[[nodiscard]] std::optional<CellBounds> cellsBounds(const CellSet& cells) noexcept;

// 纯函数：去掉中心 z 大于 maxZ 的单元（日照斜线逐层退台）
[[nodiscard]] CellSet clipCellsNorth(const CellSet& cells, double gridSize, double offsetZ, double maxZ);

// 纯函数：网格线裁剪到多边形内部
[[nodiscard]] GridLines gridLinesInPolygon(std::span<const LocalPoint> polygon, const GridFrame& frame,
                                           int majorEvery = 6, double y = 0.0,
                                           const RasterLimits& limits = {});

// 网格与世界坐标换算
[[nodiscard]] GridPosition worldToGrid(const LocalPoint& world, const GridFrame& frame) noexcept;
[[nodiscard]] LocalPoint gridToWorld(const GridPosition& grid, const GridFrame& frame) noexcept;
[[nodiscard]] LocalPoint snapToGrid(const LocalPoint& world, const GridFrame& frame) noexcept;

// 楼层底面高度（1 层 = 0）
[[nodiscard]] double floorToWorldY(int floor, double floorHeight = kDefaultFloorHeight) noexcept;

// 旋转
[[nodiscard]] std::optional<Rotation> parseRotation(int degrees) noexcept;
[[nodiscard]] int rotationDegrees(Rotation rotation) noexcept;

// 旋转后的 (宽, 深)
[[nodiscard]] std::pair<double, double> rotatedDimensions(double width, double depth, Rotation rotation) noexcept;

// 模块占用的网格单元
[[nodiscard]] std::vector<GridPosition> occupiedCells(const GridPosition& origin,
                                                      int gridWidth, int gridDepth,
                                                      Rotation rotation);

} // namespace site::core
