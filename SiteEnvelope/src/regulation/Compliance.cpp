#include "regulation/Compliance.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace site::regulation {

namespace {

constexpr std::string_view kCoverageLabel = "건폐율";
constexpr std::string_view kFloorAreaLabel = "용적률";
constexpr std::string_view kHeightLabel = "높이";
constexpr std::string_view kFloorsLabel = "층수";
constexpr std::string_view kBoundaryMessage = "건축한계선 위반: 일부 모듈이 건축 가능 영역을 벗어났습니다";

double percentOf(double value, double whole) noexcept {
    return whole > 0.0 ? value / whole * 100.0 : 0.0;
}

ComplianceMetric makeMetric(double current, double max, ComplianceLevel level) noexcept {
    return {current, max, level, percentOf(current, max)};
}

} // namespace

ComplianceLevel checkRatio(double current, double max, std::string_view label,
                           std::vector<std::string>& messages) {
    if (max <= 0.0) {
        return ComplianceLevel::Ok;
    }

    const double ratio = current / max;
    if (ratio > 1.0) {
        messages.push_back(fmt::format("{} 초과: 현재 {:.1f}% / 허용 {}%", label, current, max));
        return ComplianceLevel::Violation;
    }
    if (ratio >= kWarningThreshold) {
        messages.push_back(fmt::format("{} 주의: 현재 {:.1f}% / 허용 {}% ({:.0f}% 사용)",
                                       label, current, max, ratio * 100.0));
        return ComplianceLevel::Warning;
    }
    return ComplianceLevel::Ok;
}

ComplianceLevel checkValue(double current, double max, std::string_view label,
                           std::string_view unit, std::vector<std::string>& messages) {
    if (max <= 0.0) {
        return ComplianceLevel::Ok;
    }

    if (current > max) {
        messages.push_back(fmt::format("{} 초과: 현재 {}{} / 허용 {}{}", label, current, unit, max, unit));
        return ComplianceLevel::Violation;
    }
    if (current >= max * kWarningThreshold) {
        messages.push_back(fmt::format("{} 주의: 현재 {}{} / 허용 {}{}", label, current, unit, max, unit));
        return ComplianceLevel::Warning;
    }
    return ComplianceLevel::Ok;
}

ComplianceLevel worstLevel(std::initializer_list<ComplianceLevel> levels) noexcept {
    // 枚举按严重程度递增
    return levels.size() == 0 ? ComplianceLevel::Ok : std::max(levels);
}

ComplianceStatus checkCompliance(const PlacementSummary& summary, const RegulationResult& regulation) {
    const auto& reg = regulation.zoneRegulation;
    ComplianceStatus status;

    const double coverage = percentOf(summary.totalFootprintArea, summary.parcelArea);
    const auto coverageLevel = checkRatio(coverage, reg.maxCoverageRatio, kCoverageLabel, status.messages);

    const double far = percentOf(summary.totalFloorArea, summary.parcelArea);
    const auto farLevel = checkRatio(far, reg.maxFloorAreaRatio, kFloorAreaLabel, status.messages);

    const auto heightLevel = checkValue(summary.maxHeight, reg.maxHeight, kHeightLabel, "m", status.messages);

    const double floorCap = regulation.effectiveMaxFloors;
    const auto floorLevel = checkValue(summary.maxFloor, floorCap, kFloorsLabel, "층", status.messages);

    auto boundaryLevel = ComplianceLevel::Ok;
    if (!summary.allWithinBoundary) {
        boundaryLevel = ComplianceLevel::Violation;
        status.messages.emplace_back(kBoundaryMessage);
    }

    status.coverageRatio = makeMetric(coverage, reg.maxCoverageRatio, coverageLevel);
    status.floorAreaRatio = makeMetric(far, reg.maxFloorAreaRatio, farLevel);
    status.height = makeMetric(summary.maxHeight, reg.maxHeight, heightLevel);
    status.floors = makeMetric(summary.maxFloor, floorCap, floorLevel);
    status.boundary = {summary.allWithinBoundary, boundaryLevel};
    status.overall = worstLevel({coverageLevel, farLevel, heightLevel, floorLevel, boundaryLevel});
    return status;
}

std::string_view complianceLevelName(ComplianceLevel level) noexcept {
    switch (level) {
        case ComplianceLevel::Ok:        return "OK";
        case ComplianceLevel::Warning:   return "WARNING";
        case ComplianceLevel::Violation: return "VIOLATION";
    }
    return "OK";
}

} // namespace site::regulation
