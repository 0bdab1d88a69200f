#include "regulation/SolarAccess.hpp"
#include "core/Geometry.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace site::regulation {

double solarClipNorthZ(double northZ, double ceilingHeight) noexcept {
    if (ceilingHeight <= kSolarBaseHeight) {
        return std::numeric_limits<double>::infinity();
    }
    return northZ - solarSlopeDistance(ceilingHeight);
}

std::vector<SolarSection>
solarEnvelopeSections(std::span<const core::LocalPoint> polygon, double maxHeight, double step) {
    std::vector<SolarSection> sections;
    if (maxHeight <= kSolarBaseHeight || !std::isfinite(maxHeight) || !(step > 0.0)) {
        return sections;
    }

    const auto bounds = core::polygonBounds(polygon);
    if (polygon.size() < core::kMinPolygonPoints || !bounds || bounds->empty()) {
        return sections;
    }

    const double northZ = bounds->maxZ;
    const double southLimit = std::max(northZ - solarSlopeDistance(maxHeight), bounds->minZ);

    // 多采一步以覆盖南端
    const double span = northZ - southLimit + step;
    // 先在 double 中限幅再转换
    const double steps = std::min(std::floor(span / step) + 1.0, static_cast<double>(kMaxSolarSections));
    const auto count = static_cast<size_t>(steps);

    for (size_t i = 0; i < count; ++i) {
        const double d = static_cast<double>(i) * step;
        const double z = northZ - d;
        const auto segments = core::clipHorizontalLine(z, bounds->minX, bounds->maxX, polygon);
        if (segments.empty()) {
            continue;
        }
        sections.push_back({z, std::min(solarMaxHeight(d), maxHeight),
                            segments.front().start, segments.back().end});
    }

    return sections;
}

} // namespace site::regulation
