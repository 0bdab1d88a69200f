#pragma once

#include <array>
#include <expected>
#include <string>
#include <string_view>

namespace site::regulation {

// 规划边界错误类型
enum class RegulationError {
    InvalidZoneType,
    InvalidParcelArea
};

// 용도지역（20 种）
enum class ZoneType {
    R1Exclusive,
    R2Exclusive,
    R1General,
    R2General,
    R3General,
    RSemi,
    CCentral,
    CGeneral,
    CNeighborhood,
    CDistribution,
    IExclusive,
    IGeneral,
    ISemi,
    GConservation,
    GProduction,
    GNatural,
    MConservation,
    MProduction,
    MPlanned,
    Agriculture
};

inline constexpr size_t kZoneTypeCount = 20;

// 用途地域规制常数，0 表示不限
struct ZoneRegulation {
    std::string_view nameKo;
    double maxCoverageRatio{0.0};   // 建蔽率 %
    double maxFloorAreaRatio{0.0};  // 容积率 %
    double maxHeight{0.0};          // 米
    int maxFloors{0};
    double setbackFront{0.0};
    double setbackRear{0.0};
    double setbackLeft{0.0};
    double setbackRight{0.0};

    constexpr bool hasHeightCap() const noexcept { return maxHeight > 0.0; }
    constexpr bool hasFloorLimit() const noexcept { return maxFloors > 0; }
};

// 纯函数：查表
[[nodiscard]] const ZoneRegulation& zoneRegulation(ZoneType zone) noexcept;

// 纯函数：枚举名（如 "ZONE_R2_GENERAL"）
[[nodiscard]] std::string_view zoneTypeName(ZoneType zone) noexcept;

// 纯函数：由枚举名解析，未知名称返回 InvalidZoneType
[[nodiscard]] std::expected<ZoneType, RegulationError> parseZoneType(std::string_view name) noexcept;

// 全部用途地域，按枚举顺序
[[nodiscard]] const std::array<ZoneType, kZoneTypeCount>& allZoneTypes() noexcept;

[[nodiscard]] std::string_view regulationErrorName(RegulationError error) noexcept;

} // namespace site::regulation
