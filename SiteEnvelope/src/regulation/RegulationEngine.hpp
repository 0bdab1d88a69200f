#pragma once

#include "ZoneTable.hpp"
#include <expected>
#include <optional>

namespace site::regulation {

// 标准层高（米），用于由高度上限推算层数
inline constexpr double kFloorHeightMeters = 3.0;

// 地块输入，宽深缺省时按正方形 sqrt(area) 估算
struct ParcelInput {
    double area{0.0};
    ZoneType zoneType{ZoneType::R1Exclusive};
    std::optional<double> width;
    std::optional<double> depth;
};

// 规划计算结果
struct RegulationResult {
    ZoneType zoneType{ZoneType::R1Exclusive};
    ZoneRegulation zoneRegulation;
    double buildableArea{0.0};
    double maxBuildingFootprint{0.0};
    double maxTotalFloorArea{0.0};
    int effectiveMaxFloors{0};  // 0 = 不限

    constexpr bool hasFloorCap() const noexcept { return effectiveMaxFloors > 0; }

    // 层数上限，不限时返回 nullopt
    constexpr std::optional<int> floorCap() const noexcept {
        return hasFloorCap() ? std::optional<int>{effectiveMaxFloors} : std::nullopt;
    }
};

// 纯函数：边界校验（面积 > 0 且有限）
[[nodiscard]] std::expected<void, RegulationError> validateParcel(const ParcelInput& parcel) noexcept;

// 纯函数：前置条件由 validateParcel 保证，本函数不做校验
[[nodiscard]] RegulationResult calculateRegulations(const ParcelInput& parcel) noexcept;

// 纯函数：使用给定规制常数计算（忽略 parcel.zoneType 的查表）
[[nodiscard]] RegulationResult calculateRegulations(const ParcelInput& parcel,
                                                    const ZoneRegulation& regulation) noexcept;

// 校验后计算
[[nodiscard]] std::expected<RegulationResult, RegulationError>
calculateRegulationsChecked(const ParcelInput& parcel) noexcept;

// 由用途地域名与面积构造输入并计算
[[nodiscard]] std::expected<RegulationResult, RegulationError>
calculateRegulationsChecked(std::string_view zoneName, double area,
                            std::optional<double> width = std::nullopt,
                            std::optional<double> depth = std::nullopt) noexcept;

// 纯函数：由高度与层数上限得到有效层数，两者都不限时返回 0
[[nodiscard]] int effectiveFloorLimit(double maxHeight, int maxFloors,
                                      double floorHeight = kFloorHeightMeters) noexcept;

} // namespace site::regulation
