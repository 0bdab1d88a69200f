#include "core/Geometry.hpp"
#include <array>
#include <algorithm>
#include <cmath>

namespace site::core {

namespace {

// 偏移后的边：起点 + 原方向
struct OffsetEdge {
    double px, pz;
    double dx, dz;
};

// 边与常量坐标线的全部交点，升序
// 水平方向：key = z，value = x；竖直方向互换
template<typename KeyOf, typename ValueOf>
std::vector<double> crossings(std::span<const LocalPoint> polygon, double at,
                              KeyOf key, ValueOf value) {
    std::vector<double> result;
    const auto n = polygon.size();
    if (n < kMinPolygonPoints) {
        return result;
    }

    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const double ki = key(polygon[i]);
        const double kj = key(polygon[j]);
        if ((ki <= at && kj > at) || (kj <= at && ki > at)) {
            const double t = (at - ki) / (kj - ki);
            result.push_back(value(polygon[i]) + t * (value(polygon[j]) - value(polygon[i])));
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

// 交点两两配对成内部区间并裁剪
std::vector<Interval> pairCrossings(const std::vector<double>& sorted, double lo, double hi) {
    std::vector<Interval> segments;
    for (std::size_t i = 0; i + 1 < sorted.size(); i += 2) {
        const double start = std::max(sorted[i], lo);
        const double end = std::min(sorted[i + 1], hi);
        if (start < end) {
            segments.push_back({start, end});
        }
    }
    return segments;
}

} // namespace

double polygonSignedArea(std::span<const LocalPoint> polygon) noexcept {
    const auto n = polygon.size();
    if (n < kMinPolygonPoints) {
        return 0.0;
    }

    double area = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const auto& a = polygon[i];
        const auto& b = polygon[(i + 1) % n];
        area += a.x * b.z - b.x * a.z;
    }
    return area / 2.0;
}

double polygonArea(std::span<const LocalPoint> polygon) noexcept {
    return std::abs(polygonSignedArea(polygon));
}

std::optional<PolygonBounds> polygonBounds(std::span<const LocalPoint> polygon) noexcept {
    if (polygon.empty()) {
        return std::nullopt;
    }

    PolygonBounds bounds{polygon[0].x, polygon[0].x, polygon[0].z, polygon[0].z};
    for (const auto& p : polygon) {
        bounds.minX = std::min(bounds.minX, p.x);
        bounds.maxX = std::max(bounds.maxX, p.x);
        bounds.minZ = std::min(bounds.minZ, p.z);
        bounds.maxZ = std::max(bounds.maxZ, p.z);
    }
    return bounds;
}

LocalPoint polygonCentroid(std::span<const LocalPoint> polygon) noexcept {
    if (polygon.empty()) {
        return {};
    }

    LocalPoint sum;
    for (const auto& p : polygon) {
        sum.x += p.x;
        sum.z += p.z;
    }
    const auto n = static_cast<double>(polygon.size());
    return {sum.x / n, sum.z / n};
}

Polygon scalePolygon(std::span<const LocalPoint> polygon, const LocalPoint& origin, double factor) {
    Polygon result;
    result.reserve(polygon.size());
    for (const auto& p : polygon) {
        result.push_back({origin.x + (p.x - origin.x) * factor,
                          origin.z + (p.z - origin.z) * factor});
    }
    return result;
}

Polygon polygonInset(std::span<const LocalPoint> polygon, double distance) {
    const auto n = polygon.size();
    if (n < kMinPolygonPoints || !(distance > 0.0)) {
        return Polygon(polygon.begin(), polygon.end());
    }
    if (!std::isfinite(distance)) {
        return {};
    }

    // 有向面积为正 = 逆时针，内法线在方向左侧
    const double sign = polygonSignedArea(polygon) > 0.0 ? 1.0 : -1.0;

    std::vector<OffsetEdge> edges;
    edges.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& a = polygon[i];
        const auto& b = polygon[(i + 1) % n];
        const double ex = b.x - a.x;
        const double ez = b.z - a.z;
        const double len = std::sqrt(ex * ex + ez * ez);
        if (len == 0.0) {
            continue;  // 重复顶点
        }

        const double nx = sign * (-ez / len);
        const double nz = sign * (ex / len);
        edges.push_back({a.x + nx * distance, a.z + nz * distance, ex, ez});
    }

    const auto m = edges.size();
    if (m < kMinPolygonPoints) {
        return {};
    }

    // 相邻偏移线求交
    Polygon result;
    result.reserve(m);
    for (std::size_t i = 0; i < m; ++i) {
        const auto& e1 = edges[i];
        const auto& e2 = edges[(i + 1) % m];

        const double denom = e1.dx * e2.dz - e1.dz * e2.dx;
        if (std::abs(denom) < kParallelEpsilon) {
            result.push_back({(e1.px + e2.px) / 2.0, (e1.pz + e2.pz) / 2.0});
        } else {
            const double t = ((e2.px - e1.px) * e2.dz - (e2.pz - e1.pz) * e2.dx) / denom;
            result.push_back({e1.px + t * e1.dx, e1.pz + t * e1.dz});
        }
    }

    return result;
}

bool insetPreservesEdges(std::span<const LocalPoint> polygon, std::span<const LocalPoint> inset) noexcept {
    const auto n = polygon.size();
    if (n < kMinPolygonPoints) {
        return false;
    }

    // 与 polygonInset 相同地跳过重复顶点
    std::size_t m = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const auto& a = polygon[i];
        const auto& b = polygon[(i + 1) % n];
        if (a.x != b.x || a.z != b.z) {
            ++m;
        }
    }
    if (m < kMinPolygonPoints || inset.size() != m) {
        return false;
    }

    // inset[k] -> inset[k + 1] 位于第 k + 1 条原边的偏移线上
    std::size_t edge = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const auto& a = polygon[i];
        const auto& b = polygon[(i + 1) % n];
        if (a.x == b.x && a.z == b.z) {
            continue;
        }

        const auto& from = inset[(edge + m - 1) % m];
        const auto& to = inset[edge];
        const double dot = (to.x - from.x) * (b.x - a.x) + (to.z - from.z) * (b.z - a.z);
        if (!(dot > 0.0)) {
            return false;
        }
        ++edge;
    }
    return true;
}

bool pointInPolygon(const LocalPoint& point, std::span<const LocalPoint> polygon) noexcept {
    const auto n = polygon.size();
    if (n < kMinPolygonPoints) {
        return false;
    }

    bool inside = false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const auto& pi = polygon[i];
        const auto& pj = polygon[j];
        if ((pi.z > point.z) != (pj.z > point.z) &&
            point.x < (pj.x - pi.x) * (point.z - pi.z) / (pj.z - pi.z) + pi.x) {
            inside = !inside;
        }
    }
    return inside;
}

bool isRectInPolygon(const Rect& rect, std::span<const LocalPoint> polygon) noexcept {
    const std::array<LocalPoint, 4> corners{{
        {rect.minX, rect.minZ},
        {rect.maxX, rect.minZ},
        {rect.maxX, rect.maxZ},
        {rect.minX, rect.maxZ}
    }};

    return std::all_of(corners.begin(), corners.end(),
                       [&](const LocalPoint& c) { return pointInPolygon(c, polygon); });
}

std::vector<Interval>
clipHorizontalLine(double z, double xMin, double xMax, std::span<const LocalPoint> polygon) {
    auto xs = crossings(polygon, z,
                        [](const LocalPoint& p) { return p.z; },
                        [](const LocalPoint& p) { return p.x; });
    return pairCrossings(xs, xMin, xMax);
}

std::vector<Interval>
clipVerticalLine(double x, double zMin, double zMax, std::span<const LocalPoint> polygon) {
    auto zs = crossings(polygon, x,
                        [](const LocalPoint& p) { return p.x; },
                        [](const LocalPoint& p) { return p.z; });
    return pairCrossings(zs, zMin, zMax);
}

Rect maxInscribedRect(std::span<const LocalPoint> polygon, int steps) {
    if (polygon.size() < kMinPolygonPoints) {
        return {};
    }

    const auto bounds = polygonBounds(polygon);
    if (!bounds || bounds->empty()) {
        return {};
    }

    steps = std::clamp(steps, 1, kMaxInscribedRectSteps);
    const double dz = bounds->depth() / steps;

    // 每个采样行的全部内部区间（凹多边形一行可有多段）
    struct Row {
        double z;
        std::vector<Interval> segments;
    };

    std::vector<Row> rows;
    rows.reserve(static_cast<std::size_t>(steps) + 1);
    for (int i = 0; i <= steps; ++i) {
        const double z = bounds->minZ + i * dz;
        rows.push_back({z, clipHorizontalLine(z, bounds->minX, bounds->maxX, polygon)});
    }

    double bestArea = 0.0;
    Rect best;

    for (std::size_t i = 0; i < rows.size(); ++i) {
        for (const auto& start : rows[i].segments) {
            double left = start.start;
            double right = start.end;

            for (std::size_t j = i + 1; j < rows.size(); ++j) {
                // 取与当前区间重叠最多的段，保证中间各行都在内部
                const Interval* next = nullptr;
                double overlap = 0.0;
                for (const auto& seg : rows[j].segments) {
                    const double o = std::min(right, seg.end) - std::max(left, seg.start);
                    if (o > overlap) {
                        overlap = o;
                        next = &seg;
                    }
                }
                if (!next) {
                    break;
                }

                left = std::max(left, next->start);
                right = std::min(right, next->end);

                const double area = (right - left) * (rows[j].z - rows[i].z);
                if (area > bestArea) {
                    bestArea = area;
                    best = Rect{left, right, rows[i].z, rows[j].z};
                }
            }
        }
    }

    return best;
}

Polygon clipPolygonNorth(std::span<const LocalPoint> polygon, double maxZ) {
    const auto n = polygon.size();
    if (n < kMinPolygonPoints) {
        return {};
    }

    Polygon result;
    for (std::size_t i = 0; i < n; ++i) {
        const auto& curr = polygon[i];
        const auto& next = polygon[(i + 1) % n];
        const bool currIn = curr.z <= maxZ;
        const bool nextIn = next.z <= maxZ;

        if (currIn) {
            result.push_back(curr);
        }
        if (currIn != nextIn) {
            const double t = (maxZ - curr.z) / (next.z - curr.z);
            result.push_back({curr.x + t * (next.x - curr.x), maxZ});
        }
    }

    if (result.size() < kMinPolygonPoints) {
        return {};
    }
    return result;
}

} // namespace site::core
