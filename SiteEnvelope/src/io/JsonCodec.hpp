#pragma once

#include "../core/GridRaster.hpp"
#include "../geo/LocalFrame.hpp"
#include "../regulation/Compliance.hpp"
#include "../regulation/Envelope.hpp"
#include "../regulation/Placement.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace site::io {

// JSON 读写错误类型
enum class JsonError {
    FileNotFound,
    ParseError,
    MissingField,
    InvalidValue,
    WriteError
};

// 地块文档（GeoJSON 几何 + 属性）
struct ParcelDocument {
    std::string id;
    std::string zoneType;
    double area{0.0};
    std::optional<double> officialPrice;  // 不参与计算
    std::optional<double> width;
    std::optional<double> depth;
    std::optional<geo::GeoPoint> centroid;
    std::vector<geo::GeoPoint> ring;  // 外环，可含闭合点
};

// 文件读写
[[nodiscard]] std::expected<nlohmann::json, JsonError> readJsonFile(const std::filesystem::path& path);
[[nodiscard]] std::expected<void, JsonError> writeJsonFile(const std::filesystem::path& path,
                                                           const nlohmann::json& document,
                                                           int indent = 2);

// 输入文档解析
[[nodiscard]] std::expected<ParcelDocument, JsonError> parseParcelDocument(const nlohmann::json& document);

// 接受数组或 {"placements": [...]}
[[nodiscard]] std::expected<std::vector<regulation::ModulePlacement>, JsonError>
parsePlacements(const nlohmann::json& document);

// 接受数组或 {"modules": [...]}；缺省网格尺寸按 0.6m 模数推算
[[nodiscard]] std::expected<std::vector<regulation::ModuleDefinition>, JsonError>
parseModuleCatalog(const nlohmann::json& document);

// 输出记录
[[nodiscard]] nlohmann::json toJson(const regulation::RegulationResult& result);
[[nodiscard]] nlohmann::json toJson(const regulation::ComplianceStatus& status);
[[nodiscard]] nlohmann::json toJson(const regulation::PlacementSummary& summary);
[[nodiscard]] nlohmann::json toJson(const core::Rect& rect);
[[nodiscard]] nlohmann::json toJson(const regulation::BuildableEnvelope& envelope, const core::GridFrame& frame);
[[nodiscard]] nlohmann::json toJson(std::span<const core::LocalPoint> polygon);

[[nodiscard]] std::string_view jsonErrorName(JsonError error) noexcept;

} // namespace site::io
