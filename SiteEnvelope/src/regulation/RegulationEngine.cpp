#include "regulation/RegulationEngine.hpp"
#include <algorithm>
#include <cmath>

namespace site::regulation {

std::expected<void, RegulationError> validateParcel(const ParcelInput& parcel) noexcept {
    if (!(parcel.area > 0.0) || !std::isfinite(parcel.area)) {
        return std::unexpected(RegulationError::InvalidParcelArea);
    }
    if (static_cast<size_t>(parcel.zoneType) >= kZoneTypeCount) {
        return std::unexpected(RegulationError::InvalidZoneType);
    }
    return {};
}

int effectiveFloorLimit(double maxHeight, int maxFloors, double floorHeight) noexcept {
    const bool heightCapped = maxHeight > 0.0;
    const bool floorsCapped = maxFloors > 0;

    if (!heightCapped && !floorsCapped) {
        return 0;
    }

    const int byHeight = static_cast<int>(std::floor(maxHeight / floorHeight));
    if (!floorsCapped) {
        return byHeight;
    }
    if (!heightCapped) {
        return maxFloors;
    }
    return std::min(byHeight, maxFloors);
}

RegulationResult calculateRegulations(const ParcelInput& parcel, const ZoneRegulation& reg) noexcept {
    const double side = std::sqrt(parcel.area);
    const double width = parcel.width.value_or(side);
    const double depth = parcel.depth.value_or(side);

    const double innerWidth = std::max(0.0, width - reg.setbackLeft - reg.setbackRight);
    const double innerDepth = std::max(0.0, depth - reg.setbackFront - reg.setbackRear);

    RegulationResult result;
    result.zoneType = parcel.zoneType;
    result.zoneRegulation = reg;
    result.buildableArea = innerWidth * innerDepth;
    result.maxBuildingFootprint = parcel.area * reg.maxCoverageRatio / 100.0;
    result.maxTotalFloorArea = parcel.area * reg.maxFloorAreaRatio / 100.0;
    result.effectiveMaxFloors = effectiveFloorLimit(reg.maxHeight, reg.maxFloors);
    return result;
}

RegulationResult calculateRegulations(const ParcelInput& parcel) noexcept {
    return calculateRegulations(parcel, zoneRegulation(parcel.zoneType));
}

std::expected<RegulationResult, RegulationError>
calculateRegulationsChecked(const ParcelInput& parcel) noexcept {
    if (auto valid = validateParcel(parcel); !valid) {
        return std::unexpected(valid.error());
    }
    return calculateRegulations(parcel);
}

std::expected<RegulationResult, RegulationError>
calculateRegulationsChecked(std::string_view zoneName, double area,
                            std::optional<double> width, std::optional<double> depth) noexcept {
    auto zone = parseZoneType(zoneName);
    if (!zone) {
        return std::unexpected(zone.error());
    }
    return calculateRegulationsChecked(ParcelInput{area, *zone, width, depth});
}

} // namespace site::regulation
