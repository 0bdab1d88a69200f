#include "io/JsonCodec.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <limits>

namespace site::io {

using nlohmann::json;

namespace {

std::expected<double, JsonError> requireNumber(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::unexpected(JsonError::MissingField);
    }
    if (!it->is_number()) {
        return std::unexpected(JsonError::InvalidValue);
    }
    return it->get<double>();
}

std::expected<std::optional<double>, JsonError> optionalNumber(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::optional<double>{};
    }
    if (!it->is_number()) {
        return std::unexpected(JsonError::InvalidValue);
    }
    return std::optional<double>{it->get<double>()};
}

std::expected<std::string, JsonError> requireString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::unexpected(JsonError::MissingField);
    }
    if (!it->is_string()) {
        return std::unexpected(JsonError::InvalidValue);
    }
    return it->get<std::string>();
}

std::expected<int, JsonError> optionalInteger(const json& object, const char* key, int fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        return std::unexpected(JsonError::InvalidValue);
    }

    // 超出 32 位范围的整数不截断
    constexpr auto kMin = std::numeric_limits<std::int32_t>::min();
    constexpr auto kMax = std::numeric_limits<std::int32_t>::max();
    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(kMax)) {
            return std::unexpected(JsonError::InvalidValue);
        }
        return static_cast<int>(value);
    }
    const auto value = it->get<std::int64_t>();
    if (value < kMin || value > kMax) {
        return std::unexpected(JsonError::InvalidValue);
    }
    return static_cast<int>(value);
}

std::expected<std::string, JsonError> optionalString(const json& object, const char* key, std::string fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        return std::unexpected(JsonError::InvalidValue);
    }
    return it->get<std::string>();
}

// 数组本身或对象中的指定数组字段
std::expected<const json*, JsonError> arrayOrField(const json& document, const char* key) {
    if (document.is_array()) {
        return &document;
    }
    if (!document.is_object()) {
        return std::unexpected(JsonError::InvalidValue);
    }
    auto it = document.find(key);
    if (it == document.end()) {
        return std::unexpected(JsonError::MissingField);
    }
    if (!it->is_array()) {
        return std::unexpected(JsonError::InvalidValue);
    }
    return &*it;
}

std::expected<std::vector<geo::GeoPoint>, JsonError> parseRing(const json& geometry) {
    if (!geometry.is_object()) {
        return std::unexpected(JsonError::InvalidValue);
    }

    auto type = requireString(geometry, "type");
    if (!type) {
        return std::unexpected(type.error());
    }
    if (*type != "Polygon") {
        return std::unexpected(JsonError::InvalidValue);
    }

    auto coords = geometry.find("coordinates");
    if (coords == geometry.end()) {
        return std::unexpected(JsonError::MissingField);
    }
    if (!coords->is_array() || coords->empty() || !(*coords)[0].is_array()) {
        return std::unexpected(JsonError::InvalidValue);
    }

    std::vector<geo::GeoPoint> ring;
    for (const auto& position : (*coords)[0]) {
        if (!position.is_array() || position.size() < 2 ||
            !position[0].is_number() || !position[1].is_number()) {
            return std::unexpected(JsonError::InvalidValue);
        }
        ring.emplace_back(position[0].get<double>(), position[1].get<double>());
    }
    return ring;
}

std::expected<regulation::ModulePlacement, JsonError> parsePlacement(const json& item, size_t index) {
    if (!item.is_object()) {
        return std::unexpected(JsonError::InvalidValue);
    }

    regulation::ModulePlacement placement;

    auto moduleId = requireString(item, "moduleId");
    if (!moduleId) {
        return std::unexpected(moduleId.error());
    }
    placement.moduleId = std::move(*moduleId);

    if (auto id = item.find("id"); id != item.end() && id->is_string()) {
        placement.id = id->get<std::string>();
    } else {
        placement.id = "placement-" + std::to_string(index);
    }

    auto gridX = optionalInteger(item, "gridX", 0);
    auto gridZ = optionalInteger(item, "gridZ", 0);
    auto rotation = optionalInteger(item, "rotation", 0);
    auto floor = optionalInteger(item, "floor", 1);
    if (!gridX || !gridZ || !rotation || !floor) {
        return std::unexpected(JsonError::InvalidValue);
    }

    auto parsedRotation = core::parseRotation(*rotation);
    if (!parsedRotation || *floor < 1) {
        return std::unexpected(JsonError::InvalidValue);
    }

    placement.gridX = *gridX;
    placement.gridZ = *gridZ;
    placement.rotation = *parsedRotation;
    placement.floor = *floor;
    return placement;
}

std::expected<regulation::ModuleDefinition, JsonError> parseModule(const json& item) {
    if (!item.is_object()) {
        return std::unexpected(JsonError::InvalidValue);
    }

    auto id = requireString(item, "id");
    auto width = requireNumber(item, "width");
    auto depth = requireNumber(item, "depth");
    auto height = requireNumber(item, "height");
    if (!id) return std::unexpected(id.error());
    if (!width) return std::unexpected(width.error());
    if (!depth) return std::unexpected(depth.error());
    if (!height) return std::unexpected(height.error());

    if (!(*width > 0.0) || !(*depth > 0.0) || *height < 0.0) {
        return std::unexpected(JsonError::InvalidValue);
    }

    regulation::ModuleDefinition module;
    module.id = std::move(*id);
    auto name = optionalString(item, "name", module.id);
    if (!name) {
        return std::unexpected(name.error());
    }
    module.name = std::move(*name);
    module.width = *width;
    module.depth = *depth;
    module.height = *height;

    constexpr double kMaxGridSpan = std::numeric_limits<std::int32_t>::max();
    const double gridSpanX = std::round(module.width / core::kDefaultGridSize);
    const double gridSpanZ = std::round(module.depth / core::kDefaultGridSize);
    if (!(gridSpanX <= kMaxGridSpan) || !(gridSpanZ <= kMaxGridSpan)) {
        return std::unexpected(JsonError::InvalidValue);
    }
    const auto defaultGridWidth = static_cast<int>(gridSpanX);
    const auto defaultGridDepth = static_cast<int>(gridSpanZ);
    auto gridWidth = optionalInteger(item, "gridWidth", defaultGridWidth);
    auto gridDepth = optionalInteger(item, "gridDepth", defaultGridDepth);
    if (!gridWidth || !gridDepth || *gridWidth <= 0 || *gridDepth <= 0) {
        return std::unexpected(JsonError::InvalidValue);
    }
    module.gridWidth = *gridWidth;
    module.gridDepth = *gridDepth;
    return module;
}

json metricJson(const regulation::ComplianceMetric& metric) {
    return json{
        {"current", metric.current},
        {"max", metric.max},
        {"level", std::string{regulation::complianceLevelName(metric.level)}},
        {"percentage", metric.percentage}
    };
}

} // namespace

std::expected<json, JsonError> readJsonFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(JsonError::FileNotFound);
    }

    try {
        return json::parse(file);
    } catch (const json::exception&) {
        return std::unexpected(JsonError::ParseError);
    }
}

std::expected<void, JsonError> writeJsonFile(const std::filesystem::path& path, const json& document, int indent) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return std::unexpected(JsonError::WriteError);
    }

    try {
        file << document.dump(indent) << std::endl;
    } catch (const json::exception&) {
        return std::unexpected(JsonError::WriteError);
    }

    if (!file) {
        return std::unexpected(JsonError::WriteError);
    }
    return {};
}

std::expected<ParcelDocument, JsonError> parseParcelDocument(const json& document) {
    if (!document.is_object()) {
        return std::unexpected(JsonError::InvalidValue);
    }

    ParcelDocument parcel;

    auto zoneType = requireString(document, "zoneType");
    if (!zoneType) {
        return std::unexpected(zoneType.error());
    }
    parcel.zoneType = std::move(*zoneType);

    auto area = requireNumber(document, "area");
    if (!area) {
        return std::unexpected(area.error());
    }
    parcel.area = *area;

    auto id = optionalString(document, "id", {});
    if (!id) {
        return std::unexpected(id.error());
    }
    parcel.id = std::move(*id);

    for (auto [key, target] : {std::pair{"officialPrice", &parcel.officialPrice},
                               std::pair{"width", &parcel.width},
                               std::pair{"depth", &parcel.depth}}) {
        auto value = optionalNumber(document, key);
        if (!value) {
            return std::unexpected(value.error());
        }
        *target = *value;
    }

    if (auto centroid = document.find("centroid"); centroid != document.end() && !centroid->is_null()) {
        if (!centroid->is_object()) {
            return std::unexpected(JsonError::InvalidValue);
        }
        auto lat = requireNumber(*centroid, "lat");
        auto lng = requireNumber(*centroid, "lng");
        if (!lat) return std::unexpected(lat.error());
        if (!lng) return std::unexpected(lng.error());
        parcel.centroid = geo::GeoPoint{*lng, *lat};
    }

    auto geometry = document.find("geometry");
    if (geometry == document.end()) {
        return std::unexpected(JsonError::MissingField);
    }
    auto ring = parseRing(*geometry);
    if (!ring) {
        return std::unexpected(ring.error());
    }
    parcel.ring = std::move(*ring);

    return parcel;
}

std::expected<std::vector<regulation::ModulePlacement>, JsonError> parsePlacements(const json& document) {
    auto items = arrayOrField(document, "placements");
    if (!items) {
        return std::unexpected(items.error());
    }

    std::vector<regulation::ModulePlacement> placements;
    placements.reserve((*items)->size());
    for (size_t i = 0; i < (*items)->size(); ++i) {
        auto placement = parsePlacement((**items)[i], i);
        if (!placement) {
            return std::unexpected(placement.error());
        }
        placements.push_back(std::move(*placement));
    }
    return placements;
}

std::expected<std::vector<regulation::ModuleDefinition>, JsonError> parseModuleCatalog(const json& document) {
    auto items = arrayOrField(document, "modules");
    if (!items) {
        return std::unexpected(items.error());
    }

    std::vector<regulation::ModuleDefinition> modules;
    modules.reserve((*items)->size());
    for (const auto& item : **items) {
        auto module = parseModule(item);
        if (!module) {
            return std::unexpected(module.error());
        }
        modules.push_back(std::move(*module));
    }
    return modules;
}

json toJson(const regulation::RegulationResult& result) {
    const auto& reg = result.zoneRegulation;
    return json{
        {"zoneType", std::string{regulation::zoneTypeName(result.zoneType)}},
        {"zoneNameKo", std::string{reg.nameKo}},
        {"maxCoverageRatio", reg.maxCoverageRatio},
        {"maxFloorAreaRatio", reg.maxFloorAreaRatio},
        {"maxHeight", reg.maxHeight},
        {"maxFloors", reg.maxFloors},
        {"setbackFront", reg.setbackFront},
        {"setbackRear", reg.setbackRear},
        {"setbackLeft", reg.setbackLeft},
        {"setbackRight", reg.setbackRight},
        {"buildableArea", result.buildableArea},
        {"maxBuildingFootprint", result.maxBuildingFootprint},
        {"maxTotalFloorArea", result.maxTotalFloorArea},
        {"effectiveMaxFloors", result.effectiveMaxFloors}
    };
}

json toJson(const regulation::ComplianceStatus& status) {
    return json{
        {"overall", std::string{regulation::complianceLevelName(status.overall)}},
        {"coverageRatio", metricJson(status.coverageRatio)},
        {"floorAreaRatio", metricJson(status.floorAreaRatio)},
        {"height", metricJson(status.height)},
        {"floors", metricJson(status.floors)},
        {"boundary", {
            {"allWithin", status.boundary.allWithin},
            {"level", std::string{regulation::complianceLevelName(status.boundary.level)}}
        }},
        {"messages", status.messages}
    };
}

json toJson(const regulation::PlacementSummary& summary) {
    return json{
        {"totalFootprintArea", summary.totalFootprintArea},
        {"totalFloorArea", summary.totalFloorArea},
        {"maxHeight", summary.maxHeight},
        {"maxFloor", summary.maxFloor},
        {"allWithinBoundary", summary.allWithinBoundary},
        {"parcelArea", summary.parcelArea},
        {"placementCount", summary.placementCount},
        {"skippedPlacements", summary.skippedPlacements}
    };
}

json toJson(const core::Rect& rect) {
    return json{
        {"minX", rect.minX},
        {"maxX", rect.maxX},
        {"minZ", rect.minZ},
        {"maxZ", rect.maxZ},
        {"width", rect.width()},
        {"depth", rect.depth()},
        {"area", rect.area()}
    };
}

json toJson(std::span<const core::LocalPoint> polygon) {
    json points = json::array();
    for (const auto& p : polygon) {
        points.push_back(json::array({p.x, p.z}));
    }
    return points;
}

json toJson(const regulation::BuildableEnvelope& envelope, const core::GridFrame& frame) {
    json rows = json::array();
    for (const auto& span : core::cellsToRowSpans(envelope.cells, frame.gridSize, frame.offsetX, frame.offsetZ)) {
        rows.push_back({{"gz", span.gz}, {"z", span.z}, {"minX", span.minX}, {"maxX", span.maxX}});
    }

    json floors = json::array();
    for (const auto& level : envelope.floorEnvelopes) {
        floors.push_back({
            {"floor", level.floor},
            {"area", level.area},
            {"width", level.width},
            {"depth", level.depth},
            {"maxZ", level.maxZ},
            {"solarClipped", level.solarClipped},
            {"cellCount", level.cells.size()}
        });
    }

    json cellBounds = nullptr;
    if (auto bounds = core::cellsBounds(envelope.cells)) {
        cellBounds = {{"minGx", bounds->minGx}, {"maxGx", bounds->maxGx},
                      {"minGz", bounds->minGz}, {"maxGz", bounds->maxGz}};
    }

    return json{
        {"regulationPolygon", toJson(envelope.regulationPolygon)},
        {"footprintPolygon", toJson(envelope.footprintPolygon)},
        {"regulationArea", envelope.regulationArea},
        {"footprintArea", envelope.footprintArea},
        {"gridSize", frame.gridSize},
        {"cellCount", envelope.cells.size()},
        {"cellBounds", cellBounds},
        {"rowSpans", rows},
        {"floors", envelope.floors},
        {"volumeHeight", envelope.volumeHeight},
        {"solarApplied", envelope.solarApplied},
        {"floorEnvelopes", floors}
    };
}

std::string_view jsonErrorName(JsonError error) noexcept {
    switch (error) {
        case JsonError::FileNotFound: return "FileNotFound";
        case JsonError::ParseError:   return "ParseError";
        case JsonError::MissingField: return "MissingField";
        case JsonError::InvalidValue: return "InvalidValue";
        case JsonError::WriteError:   return "WriteError";
    }
    return "Unknown";
}

} // namespace site::io
