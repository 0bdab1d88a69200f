#include "regulation/Envelope.hpp"
#include "regulation/SolarAccess.hpp"
#include "core/Geometry.hpp"
#include <algorithm>
#include <cmath>

namespace site::regulation {

namespace {

core::Polygon regulationPolygonFor(const ParcelGeometry& parcel, const RegulationResult& regulation,
                                   const EnvelopeConfig& config, core::InsetCache* cache) {
    if (config.setbackMode == SetbackMode::PerSide) {
        return setbackRectangle(parcel.polygon, regulation.zoneRegulation);
    }
    auto inset = (cache && !parcel.id.empty())
        ? cache->inset(parcel.id, parcel.polygon, config.uniformSetback)
        : core::polygonInset(parcel.polygon, config.uniformSetback);
    if (config.uniformSetback > 0.0 && !core::insetPreservesEdges(parcel.polygon, inset)) {
        return {};
    }
    return inset;
}

} // namespace

core::Polygon setbackRectangle(std::span<const core::LocalPoint> polygon, const ZoneRegulation& regulation) {
    const auto bounds = core::polygonBounds(polygon);
    if (polygon.size() < core::kMinPolygonPoints || !bounds) {
        return {};
    }

    const double minX = bounds->minX + regulation.setbackLeft;
    const double maxX = bounds->maxX - regulation.setbackRight;
    const double minZ = bounds->minZ + regulation.setbackFront;
    const double maxZ = bounds->maxZ - regulation.setbackRear;
    if (minX >= maxX || minZ >= maxZ) {
        return {};
    }

    return {{minX, minZ}, {maxX, minZ}, {maxX, maxZ}, {minX, maxZ}};
}

int envelopeFloors(double maxTotalFloorArea, double footprintArea,
                   const ZoneRegulation& regulation, double floorHeight) noexcept {
    if (!(footprintArea > 0.0) || !(floorHeight > 0.0)) {
        return 0;
    }

    // 先在 double 中截断再转换
    double floors = std::floor(maxTotalFloorArea / footprintArea);
    if (regulation.hasFloorLimit()) {
        floors = std::min(floors, static_cast<double>(regulation.maxFloors));
    }
    if (regulation.hasHeightCap()) {
        floors = std::min(floors, std::floor(regulation.maxHeight / floorHeight));
    }
    if (!(floors > 0.0)) {
        return 0;
    }
    return static_cast<int>(std::min(floors, static_cast<double>(kMaxEnvelopeFloors)));
}

BuildableEnvelope computeBuildableEnvelope(const ParcelGeometry& parcel,
                                           const RegulationResult& regulation,
                                           const EnvelopeConfig& config,
                                           core::InsetCache* cache) {
    BuildableEnvelope envelope;
    if (parcel.polygon.size() < core::kMinPolygonPoints) {
        return envelope;
    }

    auto regulationPolygon = regulationPolygonFor(parcel, regulation, config, cache);
    if (regulationPolygon.size() < core::kMinPolygonPoints) {
        return envelope;
    }

    const auto& frame = config.grid;
    envelope.cells = core::gridCellsInPolygon(regulationPolygon, frame.gridSize,
                                              frame.offsetX, frame.offsetZ, config.limits);
    envelope.regulationArea = core::polygonArea(regulationPolygon);

    // 超过建蔽率上限时以形心为中心等比缩小
    const double maxFootprint = regulation.maxBuildingFootprint;
    envelope.footprintPolygon = regulationPolygon;
    envelope.footprintArea = envelope.regulationArea;
    if (envelope.regulationArea > maxFootprint && maxFootprint > 0.0) {
        const double scale = std::sqrt(maxFootprint / envelope.regulationArea);
        envelope.footprintPolygon = core::scalePolygon(regulationPolygon,
                                                       core::polygonCentroid(regulationPolygon), scale);
        envelope.footprintArea = maxFootprint;
    }

    const double cellArea = frame.gridSize * frame.gridSize;
    if (envelope.footprintArea < cellArea) {
        return {};
    }

    envelope.floors = envelopeFloors(regulation.maxTotalFloorArea, envelope.footprintArea,
                                     regulation.zoneRegulation, config.floorHeight);
    envelope.volumeHeight = envelope.floors * config.floorHeight;

    const double northZ = core::polygonBounds(regulationPolygon)->maxZ;
    envelope.solarApplied = isSolarAccessZone(regulation.zoneType) && envelope.volumeHeight > kSolarBaseHeight;
    envelope.regulationPolygon = std::move(regulationPolygon);

    const auto footprintBounds = core::polygonBounds(envelope.footprintPolygon);
    if (!footprintBounds || footprintBounds->empty()) {
        return envelope;
    }

    const double baseArea = core::polygonArea(envelope.footprintPolygon);
    const double fullDepth = footprintBounds->depth();

    for (int floor = 1; floor <= envelope.floors; ++floor) {
        const double ceiling = floor * config.floorHeight;

        double clippedMaxZ = footprintBounds->maxZ;
        if (envelope.solarApplied) {
            clippedMaxZ = std::min(clippedMaxZ, solarClipNorthZ(northZ, ceiling));
        }
        if (clippedMaxZ <= footprintBounds->minZ) {
            break;
        }

        FloorEnvelope level;
        level.floor = floor;
        level.solarClipped = clippedMaxZ < footprintBounds->maxZ;
        level.width = footprintBounds->width();
        level.depth = clippedMaxZ - footprintBounds->minZ;
        level.maxZ = clippedMaxZ;
        level.area = level.solarClipped ? baseArea * (level.depth / fullDepth) : baseArea;
        level.cells = level.solarClipped
            ? core::clipCellsNorth(envelope.cells, frame.gridSize, frame.offsetZ, clippedMaxZ)
            : envelope.cells;
        envelope.floorEnvelopes.push_back(std::move(level));
    }

    return envelope;
}

} // namespace site::regulation
