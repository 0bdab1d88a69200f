#pragma once

#include "RegulationEngine.hpp"
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace site::regulation {

// 达到上限的 90% 即预警
inline constexpr double kWarningThreshold = 0.9;

enum class ComplianceLevel {
    Ok,
    Warning,
    Violation
};

// 已放置模块的汇总
struct PlacementSummary {
    double totalFootprintArea{0.0};
    double totalFloorArea{0.0};
    double maxHeight{0.0};
    int maxFloor{0};
    bool allWithinBoundary{true};
    double parcelArea{0.0};

    // 诊断信息
    size_t placementCount{0};
    size_t skippedPlacements{0};  // 模块目录中找不到的放置
};

// 单项指标，percentage 为 current / max 的百分比（max <= 0 时为 0）
struct ComplianceMetric {
    double current{0.0};
    double max{0.0};
    ComplianceLevel level{ComplianceLevel::Ok};
    double percentage{0.0};
};

struct BoundaryMetric {
    bool allWithin{true};
    ComplianceLevel level{ComplianceLevel::Ok};
};

struct ComplianceStatus {
    ComplianceLevel overall{ComplianceLevel::Ok};
    ComplianceMetric coverageRatio;
    ComplianceMetric floorAreaRatio;
    ComplianceMetric height;
    ComplianceMetric floors;
    BoundaryMetric boundary;
    std::vector<std::string> messages;

    bool ok() const noexcept { return overall == ComplianceLevel::Ok; }
};

// 纯函数：百分比指标分级，WARNING/VIOLATION 时追加消息
[[nodiscard]] ComplianceLevel checkRatio(double current, double max, std::string_view label,
                                         std::vector<std::string>& messages);

// 纯函数：绝对值指标分级，WARNING/VIOLATION 时追加消息
[[nodiscard]] ComplianceLevel checkValue(double current, double max, std::string_view label,
                                         std::string_view unit, std::vector<std::string>& messages);

// 纯函数：VIOLATION > WARNING > OK
[[nodiscard]] ComplianceLevel worstLevel(std::initializer_list<ComplianceLevel> levels) noexcept;

// 纯函数：全部五项检查
[[nodiscard]] ComplianceStatus checkCompliance(const PlacementSummary& summary,
                                               const RegulationResult& regulation);

[[nodiscard]] std::string_view complianceLevelName(ComplianceLevel level) noexcept;

} // namespace site::regulation
