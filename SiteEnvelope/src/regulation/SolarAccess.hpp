#pragma once

#include "ZoneTable.hpp"
#include "core/Types.hpp"
#include <span>
#include <vector>

namespace site::regulation {

// 일조권 사선제한：北侧界线处允许的垂直高度（米）
inline constexpr double kSolarBaseHeight = 9.0;

// 斜率：每向南 1 米允许升高 2 米
inline constexpr double kSolarSlope = 2.0;

// 斜面截面采样数上限
inline constexpr size_t kMaxSolarSections = 4096;

// 斜面截面：距北边 z 处的高度 h 与该行内部 x 范围
struct SolarSection {
    double z{0.0};
    double h{0.0};
    double xMin{0.0};
    double xMax{0.0};
};

// 纯函数：是否为适用日照限制的住居地域（5 种）
[[nodiscard]] constexpr bool isSolarAccessZone(ZoneType zone) noexcept {
    switch (zone) {
        case ZoneType::R1Exclusive:
        case ZoneType::R2Exclusive:
        case ZoneType::R1General:
        case ZoneType::R2General:
        case ZoneType::R3General:
            return true;
        default:
            return false;
    }
}

// 纯函数：距北侧建筑线向南 d 米处的最大高度
[[nodiscard]] constexpr double solarMaxHeight(double d) noexcept {
    return d <= 0.0 ? kSolarBaseHeight : kSolarBaseHeight + kSolarSlope * d;
}

// 纯函数：达到 height 所需的向南距离，height <= 9 时为 0
[[nodiscard]] constexpr double solarSlopeDistance(double height) noexcept {
    return height <= kSolarBaseHeight ? 0.0 : (height - kSolarBaseHeight) / kSolarSlope;
}

// 纯函数：顶高 ceilingHeight 的楼层允许的最北 z
// ceilingHeight <= 9 时不裁剪（+inf）
[[nodiscard]] double solarClipNorthZ(double northZ, double ceilingHeight) noexcept;

// 纯函数：从北边向南采样斜面截面，直到斜面达到 maxHeight
// maxHeight <= 9 或多边形退化时返回空
[[nodiscard]] std::vector<SolarSection>
solarEnvelopeSections(std::span<const core::LocalPoint> polygon, double maxHeight, double step = 0.3);

} // namespace site::regulation
