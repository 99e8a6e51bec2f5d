// =============================================================================
// rcp-packager - Export Command Implementation
// =============================================================================

#include "export_command.h"

#include <iostream>

#include "rcp/algo/zstd_codec.h"
#include "rcp/common/logger.h"
#include "rcp/format/package_writer.h"
#include "rcp/io/stage_loader.h"
#include "rcp/pipeline/export_bundle.h"

namespace rcp::commands {

ExportCommand::ExportCommand(ExportOptions options) : options_(std::move(options)) {}

ExportCommand::~ExportCommand() = default;

ExportCommand::ExportCommand(ExportCommand&&) noexcept = default;
ExportCommand& ExportCommand::operator=(ExportCommand&&) noexcept = default;

int ExportCommand::execute() {
    try {
        validateOptions();
        runExport();
        printSummary();
        return 0;

    } catch (const RCPException& e) {
        RCP_LOG_ERROR("Export failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        RCP_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

void ExportCommand::validateOptions() const {
    algo::ZstdCodec::validateLevel(options_.compressionLevel);

    if (options_.formatLabel.empty()) {
        throw UsageError("Format label must not be empty");
    }

    const io::StageLoader loader(options_.extractionDir, options_.simulationDir);
    if (!std::filesystem::exists(loader.extractionFile())) {
        throw IOError("Missing extraction.json in " + options_.extractionDir.string(),
                      ErrorContext(loader.extractionFile().string()));
    }
    if (!std::filesystem::exists(loader.simulationFile())) {
        throw IOError("Missing simulation.json in " + options_.simulationDir.string(),
                      ErrorContext(loader.simulationFile().string()));
    }
}

void ExportCommand::runExport() {
    RCP_LOG_INFO("Export starting in {} format", options_.formatLabel);

    const io::StageLoader loader(options_.extractionDir, options_.simulationDir);
    const pipeline::ExportBundle bundle = pipeline::loadBundle(loader);
    RCP_LOG_DEBUG("Loaded stages: {} skeleton points, {} kinematic points",
                  bundle.extraction.skeletonPoints.size(), bundle.kinematics.points.size());

    format::Manifest manifest = pipeline::bundleToManifest(bundle, options_.formatLabel);
    const format::TouchChannel touch = pipeline::bundleToTouchChannel(bundle);
    const format::AccChannel acc = pipeline::bundleToAccChannel(bundle);
    const format::GyroChannel gyro = pipeline::bundleToGyroChannel(bundle);

    index_ = format::writePackage(options_.outputDir, manifest, touch, acc, gyro,
                                  options_.compressionLevel);
    manifest_ = std::move(manifest);

    RCP_LOG_INFO("Export complete: {}", options_.outputDir.string());
}

void ExportCommand::printSummary() const {
    const auto& index = *index_;
    std::cout << "Exported RCP package at " << options_.outputDir.string() << std::endl;
    std::cout << "  Package ID:    " << manifest_->packageId << std::endl;
    std::cout << "  Touch samples: " << index.touchSamples << std::endl;
    std::cout << "  Acc samples:   " << index.accSamples << std::endl;
    std::cout << "  Gyro samples:  " << index.gyroSamples << std::endl;
    std::cout << "  Duration:      " << index.durationSeconds << " s" << std::endl;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<ExportCommand> createExportCommand(
    const std::string& extractionDir,
    const std::string& simulationDir,
    const std::string& outputDir,
    const std::string& formatLabel,
    CompressionLevel compressionLevel) {

    ExportOptions opts;
    opts.extractionDir = extractionDir;
    opts.simulationDir = simulationDir;
    opts.outputDir = outputDir;
    opts.formatLabel = formatLabel;
    opts.compressionLevel = compressionLevel;

    return std::make_unique<ExportCommand>(std::move(opts));
}

}  // namespace rcp::commands
