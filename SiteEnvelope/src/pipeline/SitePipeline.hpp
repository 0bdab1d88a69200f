#pragma once

#include "../core/InsetCache.hpp"
#include "../io/JsonCodec.hpp"
#include "../regulation/Compliance.hpp"
#include "../regulation/Envelope.hpp"
#include "../regulation/Placement.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace site::pipeline {

// 管道错误类型
enum class PipelineError {
    InputError,
    ValidationError,
    ProcessingError,
    OutputError,
    ConfigError
};

// 管道配置
struct PipelineConfig {
    // 输入
    std::filesystem::path parcelFile;
    std::optional<std::filesystem::path> placementsFile;
    std::optional<std::filesystem::path> catalogFile;

    // 输出（为空则不写文件）
    std::filesystem::path outputFile;

    // 计算配置
    regulation::EnvelopeConfig envelope;
    int inscribedRectSteps{60};

    // 处理配置
    bool enableProgressReporting{true};
    bool enableLogging{true};
    std::string logLevel{"info"};  // trace, debug, info, warn, error
};

// 进度回调函数类型
using ProgressCallback = std::function<void(double progress, const std::string& message)>;
using LogCallback = std::function<void(const std::string& level, const std::string& message)>;

// 已加载的输入文档
struct SiteInputs {
    io::ParcelDocument parcel;
    std::vector<regulation::ModulePlacement> placements;
    std::vector<regulation::ModuleDefinition> modules;
    bool hasPlacements{false};
};

// 单个地块的分析结果
struct SiteAnalysis {
    std::string parcelId;
    geo::GeoPoint origin;
    core::Polygon parcelPolygon;
    regulation::RegulationResult regulation;
    regulation::BuildableEnvelope envelope;
    core::Rect inscribedRect;
    std::optional<regulation::PlacementSummary> summary;
    std::optional<regulation::ComplianceStatus> compliance;
};

// 管道结果
struct PipelineResult {
    SiteAnalysis analysis;
    std::chrono::milliseconds processingTime{0};
    std::vector<std::filesystem::path> outputFiles;
    bool success{false};
    std::string errorMessage;
};

// 函数式管道组件
namespace components {

// 输入阶段：读取地块、放置与模块目录文档
[[nodiscard]] std::expected<SiteInputs, PipelineError>
loadInputs(const PipelineConfig& config,
           const ProgressCallback& progress = nullptr,
           const LogCallback& log = nullptr);

// 分析阶段：纯内存计算；catalog 为空时不做放置汇总与合规检查
[[nodiscard]] std::expected<SiteAnalysis, PipelineError>
analyzeSite(const io::ParcelDocument& parcel,
            const PipelineConfig& config,
            std::span<const regulation::ModulePlacement> placements = {},
            const regulation::IModuleCatalog* catalog = nullptr,
            core::InsetCache* cache = nullptr,
            const ProgressCallback& progress = nullptr);

// 报告 JSON：{parcel, regulation, envelope, inscribedRect, summary, compliance}
[[nodiscard]] nlohmann::json buildReport(const SiteAnalysis& analysis, const core::GridFrame& frame);

// 输出阶段
[[nodiscard]] std::expected<std::vector<std::filesystem::path>, PipelineError>
exportReport(const SiteAnalysis& analysis,
             const std::filesystem::path& outputFile,
             const core::GridFrame& frame,
             const ProgressCallback& progress = nullptr);

} // namespace components

// 主管道类
class SitePipeline {
public:
    explicit SitePipeline(PipelineConfig config)
        : config_(std::move(config)) {}

    // 执行完整管道
    [[nodiscard]] PipelineResult execute();

    // 执行管道（带回调）
    [[nodiscard]] PipelineResult execute(const ProgressCallback& progressCallback,
                                         const LogCallback& logCallback = nullptr);

    // 配置访问
    const PipelineConfig& config() const noexcept { return config_; }
    void updateConfig(PipelineConfig newConfig) {
        config_ = std::move(newConfig);
        insetCache_.clear();
    }

    // 跨次执行复用的退让缓存
    const core::InsetCache& insetCache() const noexcept { return insetCache_; }

private:
    PipelineConfig config_;
    core::InsetCache insetCache_;

    // 内部状态
    mutable std::chrono::steady_clock::time_point startTime_;
    mutable double currentProgress_{0.0};

    // 辅助方法
    void updateProgress(double progress, const std::string& message,
                        const ProgressCallback& callback) const;
    void log(const std::string& level, const std::string& message,
             const LogCallback& callback) const;
};

// 管道构建器
class PipelineBuilder {
public:
    PipelineBuilder() = default;

    // 链式配置
    PipelineBuilder& withParcel(std::filesystem::path parcelFile) {
        config_.parcelFile = std::move(parcelFile);
        return *this;
    }

    PipelineBuilder& withPlacements(std::filesystem::path placementsFile, std::filesystem::path catalogFile) {
        config_.placementsFile = std::move(placementsFile);
        config_.catalogFile = std::move(catalogFile);
        return *this;
    }

    PipelineBuilder& withOutput(std::filesystem::path outputFile) {
        config_.outputFile = std::move(outputFile);
        return *this;
    }

    PipelineBuilder& withGrid(core::GridFrame grid) {
        config_.envelope.grid = grid;
        return *this;
    }

    PipelineBuilder& withEnvelope(regulation::EnvelopeConfig envelope) {
        config_.envelope = envelope;
        return *this;
    }

    PipelineBuilder& withRasterLimits(core::RasterLimits limits) {
        config_.envelope.limits = limits;
        return *this;
    }

    PipelineBuilder& withInscribedRectSteps(int steps) {
        config_.inscribedRectSteps = steps;
        return *this;
    }

    PipelineBuilder& withLogging(bool enable, std::string level = "info") {
        config_.enableLogging = enable;
        config_.logLevel = std::move(level);
        return *this;
    }

    // 构建管道
    [[nodiscard]] SitePipeline build() {
        return SitePipeline{std::move(config_)};
    }

    [[nodiscard]] PipelineResult execute(const ProgressCallback& progress = nullptr,
                                         const LogCallback& log = nullptr) {
        return build().execute(progress, log);
    }

private:
    PipelineConfig config_;
};

// 工厂函数
[[nodiscard]] PipelineBuilder createPipeline();

// 验证配置
[[nodiscard]] std::expected<void, PipelineError>
validateConfig(const PipelineConfig& config);

[[nodiscard]] std::string_view pipelineErrorName(PipelineError error) noexcept;

} // namespace site::pipeline
