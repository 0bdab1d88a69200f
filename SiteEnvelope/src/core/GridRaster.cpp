#include "core/GridRaster.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace site::core {

namespace {

// 外扩一格后的网格索引范围
struct IndexRange {
    std::int64_t gxMin, gxMax;
    std::int64_t gzMin, gzMax;

    double count() const noexcept {
        return static_cast<double>(gxMax - gxMin + 1) * static_cast<double>(gzMax - gzMin + 1);
    }
};

std::optional<IndexRange> indexRange(std::span<const LocalPoint> polygon,
                                     double gridSize, double offsetX, double offsetZ) noexcept {
    if (polygon.size() < kMinPolygonPoints || !(gridSize > 0.0) || !std::isfinite(gridSize)) {
        return std::nullopt;
    }

    const auto bounds = polygonBounds(polygon);
    if (!bounds || bounds->empty()) {
        return std::nullopt;
    }

    const double lo[2] = {std::floor((bounds->minX - offsetX) / gridSize) - 1.0,
                          std::floor((bounds->minZ - offsetZ) / gridSize) - 1.0};
    const double hi[2] = {std::ceil((bounds->maxX - offsetX) / gridSize) + 1.0,
                          std::ceil((bounds->maxZ - offsetZ) / gridSize) + 1.0};

    constexpr double kMin = std::numeric_limits<std::int32_t>::min();
    constexpr double kMax = std::numeric_limits<std::int32_t>::max();
    for (int axis = 0; axis < 2; ++axis) {
        if (!std::isfinite(lo[axis]) || !std::isfinite(hi[axis]) || lo[axis] < kMin || hi[axis] > kMax) {
            return std::nullopt;
        }
    }

    return IndexRange{static_cast<std::int64_t>(lo[0]), static_cast<std::int64_t>(hi[0]),
                      static_cast<std::int64_t>(lo[1]), static_cast<std::int64_t>(hi[1])};
}

bool zThenX(CellKey a, CellKey b) noexcept {
    const auto az = cellZ(a);
    const auto bz = cellZ(b);
    return az != bz ? az < bz : cellX(a) < cellX(b);
}

} // namespace

size_t estimateCellCount(std::span<const LocalPoint> polygon, double gridSize) noexcept {
    const auto range = indexRange(polygon, gridSize, 0.0, 0.0);
    if (!range) {
        return 0;
    }

    const double count = range->count();
    if (count >= static_cast<double>(std::numeric_limits<size_t>::max())) {
        return std::numeric_limits<size_t>::max();
    }
    return static_cast<size_t>(count);
}

CellSet gridCellsInPolygon(std::span<const LocalPoint> polygon,
                           double gridSize, double offsetX, double offsetZ,
                           const RasterLimits& limits) {
    CellSet cells;

    const auto range = indexRange(polygon, gridSize, offsetX, offsetZ);
    if (!range || range->count() > static_cast<double>(limits.maxCells)) {
        return cells;
    }

    const double half = gridSize / 2.0;
    for (auto gz = range->gzMin; gz <= range->gzMax; ++gz) {
        const double cz = static_cast<double>(gz) * gridSize + offsetZ + half;
        for (auto gx = range->gxMin; gx <= range->gxMax; ++gx) {
            const double cx = static_cast<double>(gx) * gridSize + offsetX + half;
            if (pointInPolygon({cx, cz}, polygon)) {
                cells.insert(packCell(static_cast<std::int32_t>(gx), static_cast<std::int32_t>(gz)));
            }
        }
    }

    return cells;
}

std::vector<CellKey> sortedCells(const CellSet& cells) {
    std::vector<CellKey> keys(cells.begin(), cells.end());
    std::sort(keys.begin(), keys.end(), zThenX);
    return keys;
}

std::vector<RowSpan> cellsToRowSpans(const CellSet& cells,
                                     double gridSize, double offsetX, double offsetZ) {
    std::vector<RowSpan> spans;
    const auto keys = sortedCells(cells);

    auto emit = [&](std::int32_t gz, std::int32_t minGx, std::int32_t maxGx) {
        spans.push_back({gz, minGx, maxGx,
                         gz * gridSize + offsetZ,
                         minGx * gridSize + offsetX,
                         (maxGx + 1) * gridSize + offsetX});
    };

    for (size_t i = 0; i < keys.size();) {
        const auto gz = cellZ(keys[i]);
        auto runStart = cellX(keys[i]);
        auto runEnd = runStart;

        size_t j = i + 1;
        for (; j < keys.size() && cellZ(keys[j]) == gz; ++j) {
            const auto gx = cellX(keys[j]);
            if (gx == runEnd + 1) {
                runEnd = gx;
            } else {
                emit(gz, runStart, runEnd);
                runStart = runEnd = gx;
            }
        }
        emit(gz, runStart, runEnd);
        i = j;
    }

    return spans;
}

std::vector<Segment3> cellsBoundaryEdges(const CellSet& cells,
                                         double gridSize, double offsetX, double offsetZ,
                                         double y) {
    std::vector<Segment3> edges;

    for (const auto key : sortedCells(cells)) {
        const auto gx = cellX(key);
        const auto gz = cellZ(key);
        const double x0 = gx * gridSize + offsetX;
        const double z0 = gz * gridSize + offsetZ;
        const double x1 = x0 + gridSize;
        const double z1 = z0 + gridSize;

        if (!cells.contains(packCell(gx, gz - 1))) {
            edges.push_back({{x0, y, z0}, {x1, y, z0}});  // 南
        }
        if (!cells.contains(packCell(gx, gz + 1))) {
            edges.push_back({{x0, y, z1}, {x1, y, z1}});  // 北
        }
        if (!cells.contains(packCell(gx - 1, gz))) {
            edges.push_back({{x0, y, z0}, {x0, y, z1}});  // 西
        }
        if (!cells.contains(packCell(gx + 1, gz))) {
            edges.push_back({{x1, y, z0}, {x1, y, z1}});  // 东
        }
    }

    return edges;
}

std::optional<CellBounds> cellsBounds(const CellSet& cells) noexcept {
    if (cells.empty()) {
        return std::nullopt;
    }

    const auto first = *cells.begin();
    CellBounds bounds{cellX(first), cellX(first), cellZ(first), cellZ(first)};
    for (const auto key : cells) {
        bounds.minGx = std::min(bounds.minGx, cellX(key));
        bounds.maxGx = std::max(bounds.maxGx, cellX(key));
        bounds.minGz = std::min(bounds.minGz, cellZ(key));
        bounds.maxGz = std::max(bounds.maxGz, cellZ(key));
    }
    return bounds;
}

CellSet clipCellsNorth(const CellSet& cells, double gridSize, double offsetZ, double maxZ) {
    CellSet result;
    result.reserve(cells.size());

    const double half = gridSize / 2.0;
    for (const auto key : cells) {
        const double centerZ = cellZ(key) * gridSize + offsetZ + half;
        if (!(centerZ > maxZ)) {
            result.insert(key);
        }
    }
    return result;
}

GridLines gridLinesInPolygon(std::span<const LocalPoint> polygon, const GridFrame& frame,
                             int majorEvery, double y, const RasterLimits& limits) {
    GridLines lines;

    const auto range = indexRange(polygon, frame.gridSize, frame.offsetX, frame.offsetZ);
    if (!range) {
        return lines;
    }
    const double lineCount = static_cast<double>(range->gxMax - range->gxMin + 1) +
                             static_cast<double>(range->gzMax - range->gzMin + 1);
    if (lineCount > static_cast<double>(limits.maxCells)) {
        return lines;
    }

    const auto bounds = polygonBounds(polygon);
    auto isMajor = [majorEvery](std::int64_t index) {
        return majorEvery > 0 && index % majorEvery == 0;
    };

    // 竖线（x 恒定）
    for (auto gx = range->gxMin; gx <= range->gxMax; ++gx) {
        const double x = static_cast<double>(gx) * frame.gridSize + frame.offsetX;
        auto& target = isMajor(gx) ? lines.major : lines.minor;
        for (const auto& seg : clipVerticalLine(x, bounds->minZ, bounds->maxZ, polygon)) {
            target.push_back({{x, y, seg.start}, {x, y, seg.end}});
        }
    }

    // 横线（z 恒定）
    for (auto gz = range->gzMin; gz <= range->gzMax; ++gz) {
        const double z = static_cast<double>(gz) * frame.gridSize + frame.offsetZ;
        auto& target = isMajor(gz) ? lines.major : lines.minor;
        for (const auto& seg : clipHorizontalLine(z, bounds->minX, bounds->maxX, polygon)) {
            target.push_back({{seg.start, y, z}, {seg.end, y, z}});
        }
    }

    return lines;
}

GridPosition worldToGrid(const LocalPoint& world, const GridFrame& frame) noexcept {
    return {static_cast<std::int32_t>(std::lround((world.x - frame.offsetX) / frame.gridSize)),
            static_cast<std::int32_t>(std::lround((world.z - frame.offsetZ) / frame.gridSize))};
}

LocalPoint gridToWorld(const GridPosition& grid, const GridFrame& frame) noexcept {
    return {grid.gridX * frame.gridSize + frame.offsetX,
            grid.gridZ * frame.gridSize + frame.offsetZ};
}

LocalPoint snapToGrid(const LocalPoint& world, const GridFrame& frame) noexcept {
    return gridToWorld(worldToGrid(world, frame), frame);
}

double floorToWorldY(int floor, double floorHeight) noexcept {
    return (floor - 1) * floorHeight;
}

std::optional<Rotation> parseRotation(int degrees) noexcept {
    switch (degrees) {
        case 0:   return Rotation::Deg0;
        case 90:  return Rotation::Deg90;
        case 180: return Rotation::Deg180;
        case 270: return Rotation::Deg270;
        default:  return std::nullopt;
    }
}

int rotationDegrees(Rotation rotation) noexcept {
    switch (rotation) {
        case Rotation::Deg0:   return 0;
        case Rotation::Deg90:  return 90;
        case Rotation::Deg180: return 180;
        case Rotation::Deg270: return 270;
    }
    return 0;
}

std::pair<double, double> rotatedDimensions(double width, double depth, Rotation rotation) noexcept {
    if (rotation == Rotation::Deg90 || rotation == Rotation::Deg270) {
        return {depth, width};
    }
    return {width, depth};
}

std::vector<GridPosition> occupiedCells(const GridPosition& origin,
                                        int gridWidth, int gridDepth,
                                        Rotation rotation) {
    const auto [w, d] = rotatedDimensions(gridWidth, gridDepth, rotation);
    const auto effectiveWidth = static_cast<int>(w);
    const auto effectiveDepth = static_cast<int>(d);

    std::vector<GridPosition> cells;
    if (effectiveWidth <= 0 || effectiveDepth <= 0) {
        return cells;
    }

    cells.reserve(static_cast<size_t>(effectiveWidth) * static_cast<size_t>(effectiveDepth));
    for (int dx = 0; dx < effectiveWidth; ++dx) {
        for (int dz = 0; dz < effectiveDepth; ++dz) {
            cells.push_back({origin.gridX + dx, origin.gridZ + dz});
        }
    }
    return cells;
}

} // namespace site::core
