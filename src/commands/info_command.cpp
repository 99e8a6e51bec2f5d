// =============================================================================
// rcp-packager - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <iostream>

#include <fmt/format.h>

#include "rcp/common/logger.h"
#include "rcp/format/message_json.h"
#include "rcp/format/package_reader.h"

namespace rcp::commands {

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

InfoCommand::~InfoCommand() = default;

InfoCommand::InfoCommand(InfoCommand&&) noexcept = default;
InfoCommand& InfoCommand::operator=(InfoCommand&&) noexcept = default;

int InfoCommand::execute() {
    try {
        if (!std::filesystem::is_directory(options_.inputPath)) {
            throw IOError("Package directory not found: " + options_.inputPath.string(),
                          ErrorContext(options_.inputPath.string()));
        }

        const format::PackageReader reader(options_.inputPath);
        const format::Manifest manifest = reader.readManifest();
        const format::Index index = reader.readIndex();

        if (options_.jsonOutput) {
            printJsonInfo(manifest, index);
        } else {
            printTextInfo(manifest, index);
        }

        return 0;

    } catch (const RCPException& e) {
        RCP_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        RCP_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

void InfoCommand::printTextInfo(const format::Manifest& manifest,
                                const format::Index& index) const {
    std::cout << "=== RCP Package ===" << std::endl;
    std::cout << fmt::format("Path:            {}", options_.inputPath.string()) << std::endl;
    std::cout << fmt::format("Version:         {}", manifest.version) << std::endl;
    std::cout << fmt::format("Package ID:      {}", manifest.packageId) << std::endl;
    std::cout << fmt::format("Source:          {}", manifest.source) << std::endl;
    std::cout << fmt::format("Device profile:  {}", manifest.deviceProfile) << std::endl;
    std::cout << fmt::format("DPI:             {}", manifest.dpi) << std::endl;
    std::cout << fmt::format("Created:         {}", manifest.createdAt) << std::endl;
    std::cout << std::endl;

    std::cout << "Channels:" << std::endl;
    std::cout << fmt::format("  touch:  {:>10} samples", index.touchSamples) << std::endl;
    std::cout << fmt::format("  acc:    {:>10} samples", index.accSamples) << std::endl;
    std::cout << fmt::format("  gyro:   {:>10} samples", index.gyroSamples) << std::endl;
    std::cout << fmt::format("Duration:        {:.6f} s", index.durationSeconds) << std::endl;

    if (!manifest.attributes.empty()) {
        std::cout << std::endl << "Attributes:" << std::endl;
        for (const auto& [key, value] : manifest.attributes) {
            std::cout << fmt::format("  {} = {}", key, value) << std::endl;
        }
    }
}

void InfoCommand::printJsonInfo(const format::Manifest& manifest,
                                const format::Index& index) const {
    nlohmann::json doc;
    doc["path"] = options_.inputPath.string();
    doc["manifest"] = format::toJson(manifest);
    doc["index"] = format::toJson(index);
    std::cout << format::dumpJson(doc) << std::endl;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<InfoCommand> createInfoCommand(
    const std::string& inputPath,
    bool jsonOutput) {

    InfoOptions opts;
    opts.inputPath = inputPath;
    opts.jsonOutput = jsonOutput;

    return std::make_unique<InfoCommand>(std::move(opts));
}

}  // namespace rcp::commands
