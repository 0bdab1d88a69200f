#include "SitePipeline.hpp"
#include "core/Geometry.hpp"
#include "geo/LocalFrame.hpp"
#include "regulation/RegulationEngine.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cmath>

namespace site::pipeline {

namespace components {

namespace {

void report(const ProgressCallback& progress, double value, const std::string& message) {
    if (progress) {
        progress(value, message);
    }
}

void logError(const LogCallback& log, const std::string& message) {
    if (log) {
        log("error", message);
    }
}

// 读取并解析单个 JSON 文档
template<typename T, typename Parser>
std::expected<T, PipelineError> loadDocument(const std::filesystem::path& path, Parser parse,
                                             const char* what, const LogCallback& log) {
    auto document = io::readJsonFile(path);
    if (!document) {
        logError(log, fmt::format("{}读取失败: {} ({})", what, path.string(), io::jsonErrorName(document.error())));
        return std::unexpected(PipelineError::InputError);
    }

    auto parsed = parse(*document);
    if (!parsed) {
        logError(log, fmt::format("{}解析失败: {} ({})", what, path.string(), io::jsonErrorName(parsed.error())));
        return std::unexpected(PipelineError::InputError);
    }
    return std::move(*parsed);
}

} // namespace

std::expected<SiteInputs, PipelineError>
loadInputs(const PipelineConfig& config, const ProgressCallback& progress, const LogCallback& log) {
    try {
        report(progress, 0.05, "开始加载输入文件...");

        SiteInputs inputs;

        auto parcel = loadDocument<io::ParcelDocument>(
            config.parcelFile, [](const nlohmann::json& j) { return io::parseParcelDocument(j); }, "地块文件", log);
        if (!parcel) {
            return std::unexpected(parcel.error());
        }
        inputs.parcel = std::move(*parcel);

        if (config.placementsFile) {
            auto placements = loadDocument<std::vector<regulation::ModulePlacement>>(
                *config.placementsFile, [](const nlohmann::json& j) { return io::parsePlacements(j); },
                "放置文件", log);
            if (!placements) {
                return std::unexpected(placements.error());
            }
            inputs.placements = std::move(*placements);
            inputs.hasPlacements = true;
        }

        if (config.catalogFile) {
            auto modules = loadDocument<std::vector<regulation::ModuleDefinition>>(
                *config.catalogFile, [](const nlohmann::json& j) { return io::parseModuleCatalog(j); },
                "模块目录", log);
            if (!modules) {
                return std::unexpected(modules.error());
            }
            inputs.modules = std::move(*modules);
        }

        report(progress, 0.2, "输入文件加载完成");
        return inputs;
    } catch (const std::exception& e) {
        logError(log, fmt::format("输入加载异常: {}", e.what()));
        return std::unexpected(PipelineError::InputError);
    }
}

std::expected<SiteAnalysis, PipelineError>
analyzeSite(const io::ParcelDocument& parcel,
            const PipelineConfig& config,
            std::span<const regulation::ModulePlacement> placements,
            const regulation::IModuleCatalog* catalog,
            core::InsetCache* cache,
            const ProgressCallback& progress) {
    try {
        report(progress, 0.3, "计算规划指标...");

        auto zone = regulation::parseZoneType(parcel.zoneType);
        if (!zone) {
            return std::unexpected(PipelineError::ValidationError);
        }

        const regulation::ParcelInput input{parcel.area, *zone, parcel.width, parcel.depth};
        auto regulationResult = regulation::calculateRegulationsChecked(input);
        if (!regulationResult) {
            return std::unexpected(PipelineError::ValidationError);
        }

        auto origin = parcel.centroid ? parcel.centroid : geo::ringCentroid(parcel.ring);
        if (!origin) {
            return std::unexpected(PipelineError::ValidationError);
        }

        SiteAnalysis analysis;
        analysis.parcelId = parcel.id;
        analysis.origin = *origin;
        analysis.parcelPolygon = geo::ringToLocal(parcel.ring, *origin);
        analysis.regulation = *regulationResult;

        report(progress, 0.5, "计算可建体量...");

        const regulation::ParcelGeometry geometry{parcel.id, analysis.parcelPolygon, parcel.area, *zone};
        analysis.envelope = regulation::computeBuildableEnvelope(geometry, analysis.regulation, config.envelope, cache);
        analysis.inscribedRect = core::maxInscribedRect(analysis.envelope.regulationPolygon, config.inscribedRectSteps);

        if (catalog) {
            report(progress, 0.7, "检查放置合规性...");
            analysis.summary = regulation::summarizePlacements(placements, *catalog,
                                                               analysis.envelope.regulationPolygon,
                                                               parcel.area, config.envelope.grid,
                                                               config.envelope.floorHeight);
            analysis.compliance = regulation::checkCompliance(*analysis.summary, analysis.regulation);
        }

        return analysis;
    } catch (const std::exception&) {
        return std::unexpected(PipelineError::ProcessingError);
    }
}

nlohmann::json buildReport(const SiteAnalysis& analysis, const core::GridFrame& frame) {
    nlohmann::json document;
    document["parcel"] = {
        {"id", analysis.parcelId},
        {"origin", {{"lat", analysis.origin.latitude}, {"lng", analysis.origin.longitude}}},
        {"polygon", io::toJson(analysis.parcelPolygon)},
        {"polygonArea", core::polygonArea(analysis.parcelPolygon)}
    };
    document["regulation"] = io::toJson(analysis.regulation);
    document["envelope"] = io::toJson(analysis.envelope, frame);
    document["inscribedRect"] = io::toJson(analysis.inscribedRect);
    document["summary"] = analysis.summary ? io::toJson(*analysis.summary) : nlohmann::json(nullptr);
    document["compliance"] = analysis.compliance ? io::toJson(*analysis.compliance) : nlohmann::json(nullptr);
    return document;
}

std::expected<std::vector<std::filesystem::path>, PipelineError>
exportReport(const SiteAnalysis& analysis,
             const std::filesystem::path& outputFile,
             const core::GridFrame& frame,
             const ProgressCallback& progress) {
    try {
        report(progress, 0.85, "写出报告...");

        if (outputFile.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(outputFile.parent_path(), ec);
            if (ec) {
                return std::unexpected(PipelineError::OutputError);
            }
        }

        if (!io::writeJsonFile(outputFile, buildReport(analysis, frame))) {
            return std::unexpected(PipelineError::OutputError);
        }

        return std::vector<std::filesystem::path>{outputFile};
    } catch (const std::exception&) {
        return std::unexpected(PipelineError::OutputError);
    }
}

} // namespace components

PipelineResult SitePipeline::execute() {
    return execute(nullptr, nullptr);
}

PipelineResult SitePipeline::execute(const ProgressCallback& progressCallback,
                                     const LogCallback& logCallback) {
    PipelineResult result;
    startTime_ = std::chrono::steady_clock::now();

    try {
        log("info", "开始执行地块分析管道", logCallback);

        if (auto valid = validateConfig(config_); !valid) {
            result.errorMessage = "配置无效";
            log("error", result.errorMessage, logCallback);
            return result;
        }

        // 步骤1: 加载输入
        updateProgress(0.1, "加载输入文件", progressCallback);
        auto inputs = components::loadInputs(config_, nullptr,
            [this, &logCallback](const std::string& level, const std::string& message) {
                log(level, message, logCallback);
            });
        if (!inputs) {
            result.errorMessage = "输入加载失败";
            return result;
        }

        std::optional<regulation::StaticModuleCatalog> catalog;
        if (inputs->hasPlacements) {
            catalog.emplace(inputs->modules);
            log("debug", fmt::format("放置 {} 个，模块目录 {} 项", inputs->placements.size(), catalog->size()),
                logCallback);
        }

        // 步骤2: 分析
        updateProgress(0.3, "分析地块", progressCallback);
        auto analysis = components::analyzeSite(inputs->parcel, config_, inputs->placements,
                                                catalog ? &*catalog : nullptr, &insetCache_);
        if (!analysis) {
            result.errorMessage = fmt::format("地块分析失败: 用途地域 {}，面积 {}",
                                              inputs->parcel.zoneType, inputs->parcel.area);
            log("error", result.errorMessage, logCallback);
            return result;
        }
        result.analysis = std::move(*analysis);

        const auto& envelope = result.analysis.envelope;
        if (envelope.empty()) {
            log("warn", "退让后多边形退化，可建体量为空", logCallback);
        } else if (envelope.cells.empty()) {
            log("warn", fmt::format("网格栅格化为空（估计 {} 个单元，上限 {}）",
                                    core::estimateCellCount(envelope.regulationPolygon, config_.envelope.grid.gridSize),
                                    config_.envelope.limits.maxCells), logCallback);
        }
        log("debug", fmt::format("可建单元 {} 个，{} 层，高度 {}m", envelope.cells.size(),
                                 envelope.floors, envelope.volumeHeight), logCallback);

        if (const auto& summary = result.analysis.summary; summary && summary->skippedPlacements > 0) {
            log("warn", fmt::format("{} 个放置引用了未知模块，已跳过", summary->skippedPlacements), logCallback);
        }

        // 步骤3: 导出结果
        if (!config_.outputFile.empty()) {
            updateProgress(0.8, "导出报告", progressCallback);
            auto exported = components::exportReport(result.analysis, config_.outputFile, config_.envelope.grid);
            if (!exported) {
                result.errorMessage = "报告写出失败: " + config_.outputFile.string();
                log("error", result.errorMessage, logCallback);
                return result;
            }
            result.outputFiles = std::move(*exported);
        }

        result.success = true;
        updateProgress(1.0, "处理完成", progressCallback);

        auto endTime = std::chrono::steady_clock::now();
        result.processingTime = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime_);

        log("info", "地块分析管道执行成功，耗时: " +
            std::to_string(result.processingTime.count()) + "ms", logCallback);

    } catch (const std::exception& e) {
        result.errorMessage = std::string("执行异常: ") + e.what();
        log("error", result.errorMessage, logCallback);
    }

    return result;
}

void SitePipeline::updateProgress(double progress, const std::string& message,
                                  const ProgressCallback& callback) const {
    currentProgress_ = progress;
    if (callback && config_.enableProgressReporting) {
        callback(progress, message);
    }
}

void SitePipeline::log(const std::string& level, const std::string& message,
                       const LogCallback& callback) const {
    if (!config_.enableLogging) {
        return;
    }
    if (callback) {
        callback(level, message);
        return;
    }

    // 使用默认日志记录
    if (level == "error") {
        spdlog::error(message);
    } else if (level == "warn") {
        spdlog::warn(message);
    } else if (level == "info") {
        spdlog::info(message);
    } else if (level == "debug") {
        spdlog::debug(message);
    } else {
        spdlog::trace(message);
    }
}

PipelineBuilder createPipeline() {
    return PipelineBuilder{};
}

std::expected<void, PipelineError> validateConfig(const PipelineConfig& config) {
    // 验证输入配置
    if (config.parcelFile.empty() || !std::filesystem::exists(config.parcelFile)) {
        return std::unexpected(PipelineError::ConfigError);
    }
    if (config.placementsFile.has_value() != config.catalogFile.has_value()) {
        return std::unexpected(PipelineError::ConfigError);
    }
    if (config.placementsFile && !std::filesystem::exists(*config.placementsFile)) {
        return std::unexpected(PipelineError::ConfigError);
    }
    if (config.catalogFile && !std::filesystem::exists(*config.catalogFile)) {
        return std::unexpected(PipelineError::ConfigError);
    }

    // 验证计算配置
    const auto& grid = config.envelope.grid;
    if (!grid.valid() || !std::isfinite(grid.gridSize) ||
        !std::isfinite(grid.offsetX) || !std::isfinite(grid.offsetZ)) {
        return std::unexpected(PipelineError::ConfigError);
    }
    if (config.envelope.limits.maxCells == 0 || !(config.envelope.floorHeight > 0.0)) {
        return std::unexpected(PipelineError::ConfigError);
    }
    if (config.envelope.uniformSetback < 0.0 || !std::isfinite(config.envelope.uniformSetback)) {
        return std::unexpected(PipelineError::ConfigError);
    }
    if (config.inscribedRectSteps < 1 || config.inscribedRectSteps > core::kMaxInscribedRectSteps) {
        return std::unexpected(PipelineError::ConfigError);
    }

    return {};
}

std::string_view pipelineErrorName(PipelineError error) noexcept {
    switch (error) {
        case PipelineError::InputError:      return "InputError";
        case PipelineError::ValidationError: return "ValidationError";
        case PipelineError::ProcessingError: return "ProcessingError";
        case PipelineError::OutputError:     return "OutputError";
        case PipelineError::ConfigError:     return "ConfigError";
    }
    return "Unknown";
}

} // namespace site::pipeline
