#pragma once

#include "Compliance.hpp"
#include "core/GridRaster.hpp"
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace site::regulation {

// 模块定义（尺寸为米，网格尺寸为单元数）
struct ModuleDefinition {
    std::string id;
    std::string name;
    double width{0.0};
    double depth{0.0};
    double height{0.0};
    int gridWidth{0};
    int gridDepth{0};

    double footprintArea() const noexcept { return width * depth; }
};

// 模块放置，floor 从 1 开始
struct ModulePlacement {
    std::string id;
    std::string moduleId;
    std::int32_t gridX{0};
    std::int32_t gridZ{0};
    core::Rotation rotation{core::Rotation::Deg0};
    int floor{1};
};

// 模块目录接口
class IModuleCatalog {
public:
    virtual ~IModuleCatalog() = default;

    // 未找到返回 nullptr
    virtual const ModuleDefinition* find(std::string_view moduleId) const = 0;
    virtual size_t size() const = 0;
};

// 内存中的静态目录
class StaticModuleCatalog : public IModuleCatalog {
public:
    StaticModuleCatalog() = default;
    explicit StaticModuleCatalog(std::vector<ModuleDefinition> modules);

    const ModuleDefinition* find(std::string_view moduleId) const override;
    size_t size() const override { return modules_.size(); }

    // 同 id 覆盖
    void add(ModuleDefinition module);

private:
    std::map<std::string, ModuleDefinition, std::less<>> modules_;
};

// 放置在世界坐标中的矩形（旋转后尺寸）
[[nodiscard]] core::Rect placementRect(const ModulePlacement& placement, const ModuleDefinition& module,
                                       const core::GridFrame& frame) noexcept;

// 汇总全部放置；目录中找不到的模块跳过并计入 skippedPlacements
[[nodiscard]] PlacementSummary summarizePlacements(std::span<const ModulePlacement> placements,
                                                   const IModuleCatalog& catalog,
                                                   std::span<const core::LocalPoint> boundary,
                                                   double parcelArea,
                                                   const core::GridFrame& frame,
                                                   double floorHeight = core::kDefaultFloorHeight);

// 碰撞检测结果
struct PlacementValidation {
    bool valid{true};
    std::optional<std::string> reason;
    std::vector<std::string> conflictingIds;
};

// 逐层网格占用表：(floor, gx, gz) -> placement id
class OccupancyMap {
public:
    OccupancyMap() = default;
    OccupancyMap(std::span<const ModulePlacement> placements, const IModuleCatalog& catalog);

    void add(const ModulePlacement& placement, const ModuleDefinition& module);

    // 占用者 id，空单元返回 nullopt
    std::optional<std::string_view> occupant(int floor, std::int32_t gx, std::int32_t gz) const;

    // 与候选放置重叠的已有放置 id（排除 excludeId），按 id 排序去重
    std::vector<std::string> conflicts(const ModulePlacement& candidate, const ModuleDefinition& module,
                                       std::string_view excludeId = {}) const;

    size_t occupiedCount() const noexcept;

private:
    std::map<int, std::unordered_map<core::CellKey, std::string>> floors_;
};

// 纯函数：模块占用的全部单元是否都在允许集合内
[[nodiscard]] bool isPlacementInCells(const ModulePlacement& placement, const ModuleDefinition& module,
                                      const core::CellSet& allowedCells);

// 放置前校验：模块存在、单元在允许集合内、无碰撞
[[nodiscard]] PlacementValidation validatePlacement(const ModulePlacement& candidate,
                                                    const IModuleCatalog& catalog,
                                                    const OccupancyMap& occupancy,
                                                    const core::CellSet& allowedCells);

} // namespace site::regulation
