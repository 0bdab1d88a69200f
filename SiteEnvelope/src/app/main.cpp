#include "../pipeline/SitePipeline.hpp"
#include "../regulation/Compliance.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <optional>
#include <cxxopts.hpp>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

using namespace site;

// 放置存在且整体违规时的退出码
constexpr int kExitViolation = 2;

// 命令行选项结构
struct CommandLineOptions {
    std::string parcelFile;
    std::optional<std::string> placementsFile;
    std::optional<std::string> catalogFile;
    std::string outputFile;
    double gridSize{core::kDefaultGridSize};
    double offsetX{0.0};
    double offsetZ{0.0};
    int steps{60};
    double setback{regulation::kDefaultUniformSetback};
    bool perSideSetbacks{false};
    size_t maxCells{core::RasterLimits{}.maxCells};
    bool verbose{false};
    bool quiet{false};
    std::string logFile;
    bool showProgress{true};
    bool dryRun{false};
};

// 解析命令行参数
std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char* argv[]) {
    try {
        cxxopts::Options options("sitecheck", "Zoning regulation and buildable envelope checker for land parcels");

        options.add_options()
            ("p,parcel", "Parcel JSON document", cxxopts::value<std::string>())
            ("placements", "Module placements JSON", cxxopts::value<std::string>())
            ("catalog", "Module catalog JSON", cxxopts::value<std::string>())
            ("o,output", "Report output file", cxxopts::value<std::string>())
            ("grid-size", "Construction grid size (m)", cxxopts::value<double>()->default_value("0.6"))
            ("offset-x", "Grid offset along x (m)", cxxopts::value<double>()->default_value("0"))
            ("offset-z", "Grid offset along z (m)", cxxopts::value<double>()->default_value("0"))
            ("steps", "Inscribed rectangle sampling rows", cxxopts::value<int>()->default_value("60"))
            ("setback", "Uniform setback distance (m)", cxxopts::value<double>()->default_value("1"))
            ("per-side-setbacks", "Use zone per-side setbacks instead of uniform inset",
             cxxopts::value<bool>()->default_value("false"))
            ("max-cells", "Maximum raster cells", cxxopts::value<size_t>()->default_value("1000000"))
            ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", "Quiet mode", cxxopts::value<bool>()->default_value("false"))
            ("log-file", "Log file path", cxxopts::value<std::string>())
            ("no-progress", "Disable progress bar", cxxopts::value<bool>()->default_value("false"))
            ("dry-run", "Dry run (validate only)", cxxopts::value<bool>()->default_value("false"))
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            std::exit(0);
        }

        CommandLineOptions opts;

        if (result.count("parcel")) {
            opts.parcelFile = result["parcel"].as<std::string>();
        } else {
            return std::unexpected("Parcel file is required");
        }

        if (result.count("placements")) {
            opts.placementsFile = result["placements"].as<std::string>();
        }
        if (result.count("catalog")) {
            opts.catalogFile = result["catalog"].as<std::string>();
        }
        if (opts.placementsFile && !opts.catalogFile) {
            return std::unexpected("--placements requires --catalog");
        }

        if (result.count("output")) {
            opts.outputFile = result["output"].as<std::string>();
        }

        opts.gridSize = result["grid-size"].as<double>();
        opts.offsetX = result["offset-x"].as<double>();
        opts.offsetZ = result["offset-z"].as<double>();
        opts.steps = result["steps"].as<int>();
        opts.setback = result["setback"].as<double>();
        opts.perSideSetbacks = result["per-side-setbacks"].as<bool>();
        opts.maxCells = result["max-cells"].as<size_t>();
        opts.verbose = result["verbose"].as<bool>();
        opts.quiet = result["quiet"].as<bool>();
        opts.showProgress = !result["no-progress"].as<bool>() && !opts.quiet;
        opts.dryRun = result["dry-run"].as<bool>();

        if (result.count("log-file")) {
            opts.logFile = result["log-file"].as<std::string>();
        }

        return opts;

    } catch (const std::exception& e) {
        return std::unexpected(std::string("Command line parsing error: ") + e.what());
    }
}

// 设置日志系统
void setupLogging(const CommandLineOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!opts.quiet) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);
    }

    if (!opts.logFile.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.logFile, true);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("sitecheck", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

// 进度回调
void progressCallback(double progress, const std::string& message) {
    static auto lastUpdate = std::chrono::steady_clock::now();
    auto now = std::chrono::steady_clock::now();

    // 限制更新频率（每100ms）
    if (std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate).count() < 100
        && progress < 1.0) {
        return;
    }
    lastUpdate = now;

    const int barWidth = 40;
    int pos = static_cast<int>(barWidth * progress);

    std::cout << "\r[";
    for (int i = 0; i < barWidth; ++i) {
        if (i < pos) std::cout << "=";
        else if (i == pos) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << static_cast<int>(progress * 100.0) << "% " << message;
    std::cout.flush();

    if (progress >= 1.0) {
        std::cout << std::endl;
    }
}

// 日志回调
void logCallback(const std::string& level, const std::string& message) {
    if (level == "trace") spdlog::trace(message);
    else if (level == "debug") spdlog::debug(message);
    else if (level == "info") spdlog::info(message);
    else if (level == "warn") spdlog::warn(message);
    else if (level == "error") spdlog::error(message);
    else spdlog::info(message);
}

// 构建管道配置
pipeline::PipelineConfig buildPipelineConfig(const CommandLineOptions& opts) {
    pipeline::PipelineConfig config;

    config.parcelFile = opts.parcelFile;
    if (opts.placementsFile) {
        config.placementsFile = *opts.placementsFile;
    }
    if (opts.catalogFile) {
        config.catalogFile = *opts.catalogFile;
    }
    config.outputFile = opts.outputFile;

    config.envelope.grid = core::GridFrame{opts.gridSize, opts.offsetX, opts.offsetZ};
    config.envelope.limits.maxCells = opts.maxCells;
    config.envelope.uniformSetback = opts.setback;
    config.envelope.setbackMode = opts.perSideSetbacks ? regulation::SetbackMode::PerSide
                                                       : regulation::SetbackMode::Uniform;
    config.inscribedRectSteps = opts.steps;

    config.enableProgressReporting = opts.showProgress;
    config.enableLogging = true;
    config.logLevel = opts.verbose ? "debug" : "info";

    return config;
}

void showMetric(const char* label, const regulation::ComplianceMetric& metric) {
    spdlog::info("  {:<6} {:>8.2f} / {:<8.2f} [{}]", label, metric.current, metric.max,
                 regulation::complianceLevelName(metric.level));
}

// 显示结果摘要
void showResultSummary(const pipeline::PipelineResult& result) {
    spdlog::info("=== Site Analysis Complete ===");
    spdlog::info("Success: {}", result.success ? "Yes" : "No");

    if (!result.success) {
        spdlog::error("Error: {}", result.errorMessage);
        return;
    }

    const auto& analysis = result.analysis;
    const auto& reg = analysis.regulation;
    spdlog::info("Processing time: {:.3f} seconds", result.processingTime.count() / 1000.0);
    spdlog::info("Zone: {} ({})", regulation::zoneTypeName(reg.zoneType), reg.zoneRegulation.nameKo);
    spdlog::info("Coverage / FAR: {}% / {}%", reg.zoneRegulation.maxCoverageRatio, reg.zoneRegulation.maxFloorAreaRatio);
    spdlog::info("Max footprint: {:.2f} m2, max floor area: {:.2f} m2",
                 reg.maxBuildingFootprint, reg.maxTotalFloorArea);
    spdlog::info("Effective max floors: {}", reg.hasFloorCap() ? std::to_string(reg.effectiveMaxFloors) : "unlimited");

    const auto& envelope = analysis.envelope;
    spdlog::info("Buildable cells: {}, floors: {}, volume height: {:.1f} m",
                 envelope.cells.size(), envelope.floors, envelope.volumeHeight);
    if (envelope.solarApplied) {
        std::vector<int> cellsPerFloor;
        for (const auto& level : envelope.floorEnvelopes) {
            cellsPerFloor.push_back(static_cast<int>(level.cells.size()));
        }
        spdlog::info("Solar stepped cells per floor: {}", fmt::join(cellsPerFloor, ", "));
    }
    spdlog::info("Inscribed rectangle: {:.2f} x {:.2f} m", analysis.inscribedRect.width(), analysis.inscribedRect.depth());

    if (analysis.compliance) {
        const auto& status = *analysis.compliance;
        spdlog::info("Compliance: {}", regulation::complianceLevelName(status.overall));
        showMetric("BCR", status.coverageRatio);
        showMetric("FAR", status.floorAreaRatio);
        showMetric("Height", status.height);
        showMetric("Floors", status.floors);
        spdlog::info("  Boundary {}", status.boundary.allWithin ? "OK" : "VIOLATION");
        for (const auto& message : status.messages) {
            spdlog::warn("  {}", message);
        }
    }

    for (const auto& file : result.outputFiles) {
        spdlog::info("Output: {}", file.string());
    }
}

int main(int argc, char* argv[]) {
    try {
        // 解析命令行
        auto optsResult = parseCommandLine(argc, argv);
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error() << std::endl;
            return 1;
        }
        const auto opts = *optsResult;

        // 设置日志
        setupLogging(opts);

        spdlog::info("sitecheck v0.1.0");
        spdlog::info("Parcel: {}", opts.parcelFile);
        if (opts.placementsFile) {
            spdlog::info("Placements: {} (catalog {})", *opts.placementsFile, *opts.catalogFile);
        }
        spdlog::info("Grid: {} m, offset ({}, {})", opts.gridSize, opts.offsetX, opts.offsetZ);
        spdlog::info("Setback: {}", opts.perSideSetbacks ? "per-side" : fmt::format("uniform {} m", opts.setback));

        // 构建管道配置
        auto config = buildPipelineConfig(opts);

        // 验证配置
        auto validation = pipeline::validateConfig(config);
        if (!validation) {
            spdlog::error("Configuration validation failed: {}", pipeline::pipelineErrorName(validation.error()));
            return 1;
        }

        if (opts.dryRun) {
            spdlog::info("Dry run completed successfully");
            return 0;
        }

        auto sitePipeline = pipeline::SitePipeline{std::move(config)};
        auto result = sitePipeline.execute(
            opts.showProgress ? progressCallback : pipeline::ProgressCallback{},
            logCallback
        );

        showResultSummary(result);

        if (!result.success) {
            return 1;
        }
        const auto& compliance = result.analysis.compliance;
        if (compliance && compliance->overall == regulation::ComplianceLevel::Violation) {
            return kExitViolation;
        }
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
