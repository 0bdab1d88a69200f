#include "regulation/Placement.hpp"
#include "core/Geometry.hpp"
#include <algorithm>

namespace site::regulation {

StaticModuleCatalog::StaticModuleCatalog(std::vector<ModuleDefinition> modules) {
    for (auto& module : modules) {
        add(std::move(module));
    }
}

const ModuleDefinition* StaticModuleCatalog::find(std::string_view moduleId) const {
    auto it = modules_.find(moduleId);
    return it != modules_.end() ? &it->second : nullptr;
}

void StaticModuleCatalog::add(ModuleDefinition module) {
    auto id = module.id;
    modules_.insert_or_assign(std::move(id), std::move(module));
}

core::Rect placementRect(const ModulePlacement& placement, const ModuleDefinition& module,
                         const core::GridFrame& frame) noexcept {
    const auto origin = core::gridToWorld({placement.gridX, placement.gridZ}, frame);
    const auto [w, d] = core::rotatedDimensions(module.width, module.depth, placement.rotation);
    return {origin.x, origin.x + w, origin.z, origin.z + d};
}

PlacementSummary summarizePlacements(std::span<const ModulePlacement> placements,
                                     const IModuleCatalog& catalog,
                                     std::span<const core::LocalPoint> boundary,
                                     double parcelArea,
                                     const core::GridFrame& frame,
                                     double floorHeight) {
    PlacementSummary summary;
    summary.parcelArea = parcelArea;
    summary.placementCount = placements.size();

    // 同层面积累加，建筑面积取各层最大值
    std::map<int, double> floorFootprints;

    for (const auto& placement : placements) {
        const auto* module = catalog.find(placement.moduleId);
        if (!module) {
            ++summary.skippedPlacements;
            continue;
        }

        const double area = module->footprintArea();
        summary.totalFloorArea += area;
        floorFootprints[placement.floor] += area;

        const double top = (placement.floor - 1) * floorHeight + module->height;
        summary.maxHeight = std::max(summary.maxHeight, top);
        summary.maxFloor = std::max(summary.maxFloor, placement.floor);

        if (summary.allWithinBoundary &&
            !core::isRectInPolygon(placementRect(placement, *module, frame), boundary)) {
            summary.allWithinBoundary = false;
        }
    }

    for (const auto& [floor, area] : floorFootprints) {
        summary.totalFootprintArea = std::max(summary.totalFootprintArea, area);
    }

    return summary;
}

OccupancyMap::OccupancyMap(std::span<const ModulePlacement> placements, const IModuleCatalog& catalog) {
    for (const auto& placement : placements) {
        if (const auto* module = catalog.find(placement.moduleId)) {
            add(placement, *module);
        }
    }
}

void OccupancyMap::add(const ModulePlacement& placement, const ModuleDefinition& module) {
    auto& cells = floors_[placement.floor];
    for (const auto& cell : core::occupiedCells({placement.gridX, placement.gridZ},
                                                module.gridWidth, module.gridDepth, placement.rotation)) {
        cells.insert_or_assign(core::packCell(cell.gridX, cell.gridZ), placement.id);
    }
}

std::optional<std::string_view> OccupancyMap::occupant(int floor, std::int32_t gx, std::int32_t gz) const {
    auto floorIt = floors_.find(floor);
    if (floorIt == floors_.end()) {
        return std::nullopt;
    }
    auto it = floorIt->second.find(core::packCell(gx, gz));
    if (it == floorIt->second.end()) {
        return std::nullopt;
    }
    return std::string_view{it->second};
}

std::vector<std::string> OccupancyMap::conflicts(const ModulePlacement& candidate, const ModuleDefinition& module,
                                                 std::string_view excludeId) const {
    std::vector<std::string> ids;
    for (const auto& cell : core::occupiedCells({candidate.gridX, candidate.gridZ},
                                                module.gridWidth, module.gridDepth, candidate.rotation)) {
        auto id = occupant(candidate.floor, cell.gridX, cell.gridZ);
        if (id && *id != excludeId) {
            ids.emplace_back(*id);
        }
    }

    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

size_t OccupancyMap::occupiedCount() const noexcept {
    size_t count = 0;
    for (const auto& [floor, cells] : floors_) {
        count += cells.size();
    }
    return count;
}

bool isPlacementInCells(const ModulePlacement& placement, const ModuleDefinition& module,
                        const core::CellSet& allowedCells) {
    const auto cells = core::occupiedCells({placement.gridX, placement.gridZ},
                                           module.gridWidth, module.gridDepth, placement.rotation);
    return !cells.empty() && std::all_of(cells.begin(), cells.end(), [&](const core::GridPosition& cell) {
        return allowedCells.contains(core::packCell(cell.gridX, cell.gridZ));
    });
}

PlacementValidation validatePlacement(const ModulePlacement& candidate,
                                      const IModuleCatalog& catalog,
                                      const OccupancyMap& occupancy,
                                      const core::CellSet& allowedCells) {
    PlacementValidation validation;

    const auto* module = catalog.find(candidate.moduleId);
    if (!module) {
        validation.valid = false;
        validation.reason = "unknown module: " + candidate.moduleId;
        return validation;
    }

    if (!isPlacementInCells(candidate, *module, allowedCells)) {
        validation.valid = false;
        validation.reason = "outside buildable cells";
        return validation;
    }

    validation.conflictingIds = occupancy.conflicts(candidate, *module, candidate.id);
    if (!validation.conflictingIds.empty()) {
        validation.valid = false;
        validation.reason = "overlaps existing placement";
    }
    return validation;
}

} // namespace site::regulation
