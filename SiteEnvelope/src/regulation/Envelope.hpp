#pragma once

#include "RegulationEngine.hpp"
#include "core/GridRaster.hpp"
#include "core/InsetCache.hpp"
#include <optional>
#include <string>
#include <vector>

namespace site::regulation {

// 대지안의 공지 缺省退让（米）
inline constexpr double kDefaultUniformSetback = 1.0;

// 单个体量的层数上限，防止退化的建筑面积产生海量楼层
inline constexpr int kMaxEnvelopeFloors = 200;

enum class SetbackMode {
    Uniform,  // 整体向内偏移
    PerSide   // 按用途地域四边退让的轴对齐矩形
};

struct EnvelopeConfig {
    SetbackMode setbackMode{SetbackMode::Uniform};
    double uniformSetback{kDefaultUniformSetback};
    core::GridFrame grid;
    core::RasterLimits limits;
    double floorHeight{core::kDefaultFloorHeight};
};

// 局部坐标下的地块
struct ParcelGeometry {
    std::string id;  // 用作 InsetCache 键
    core::Polygon polygon;
    double area{0.0};
    ZoneType zoneType{ZoneType::R1Exclusive};
};

// 单层可建范围
struct FloorEnvelope {
    int floor{1};
    double area{0.0};
    double width{0.0};
    double depth{0.0};
    double maxZ{0.0};
    bool solarClipped{false};
    core::CellSet cells;
};

struct BuildableEnvelope {
    core::Polygon regulationPolygon;  // 退让后
    core::Polygon footprintPolygon;   // 按建蔽率缩放后
    double regulationArea{0.0};
    double footprintArea{0.0};
    core::CellSet cells;              // 退让多边形内的网格单元
    int floors{0};
    double volumeHeight{0.0};
    bool solarApplied{false};
    std::vector<FloorEnvelope> floorEnvelopes;

    bool empty() const noexcept { return regulationPolygon.empty(); }
};

// 纯函数：四边退让后的轴对齐矩形（front = 南/minZ，rear = 北/maxZ，left = 西/minX，right = 东/maxX）
// 退让超过地块尺寸时返回空
[[nodiscard]] core::Polygon setbackRectangle(std::span<const core::LocalPoint> polygon,
                                             const ZoneRegulation& regulation);

// 纯函数：由 FAR 与建筑面积得到层数，再受层数与高度上限约束，最多 kMaxEnvelopeFloors
[[nodiscard]] int envelopeFloors(double maxTotalFloorArea, double footprintArea,
                                 const ZoneRegulation& regulation,
                                 double floorHeight = core::kDefaultFloorHeight) noexcept;

// 可建体量；cache 非空时用于复用退让多边形
// 地块退化、退让吞没地块或建筑面积不足一个网格单元时返回空体量
[[nodiscard]] BuildableEnvelope computeBuildableEnvelope(const ParcelGeometry& parcel,
                                                         const RegulationResult& regulation,
                                                         const EnvelopeConfig& config = {},
                                                         core::InsetCache* cache = nullptr);

} // namespace site::regulation
