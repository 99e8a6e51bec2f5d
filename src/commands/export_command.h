// =============================================================================
// rcp-packager - Export Command
// =============================================================================
// Command handler that packages upstream stage outputs as an RCP package.
//
// Reads extraction.json and kinematics.json from the extraction directory
// and simulation.json from the simulation directory, assembles the bundle
// and writes the package to the output directory.
// =============================================================================

#ifndef RCP_COMMANDS_EXPORT_COMMAND_H
#define RCP_COMMANDS_EXPORT_COMMAND_H

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "rcp/common/error.h"
#include "rcp/common/types.h"
#include "rcp/format/rcp_messages.h"

namespace rcp::commands {

// =============================================================================
// Export Options
// =============================================================================

/// @brief Configuration options for the export command.
struct ExportOptions {
    /// @brief Folder with extraction.json and kinematics.json.
    std::filesystem::path extractionDir;

    /// @brief Folder with simulation.json.
    std::filesystem::path simulationDir;

    /// @brief Destination package root.
    std::filesystem::path outputDir = "./artifacts/export";

    /// @brief Format label written to Manifest.version.
    std::string formatLabel = std::string(kDefaultFormatVersion);

    /// @brief zstd level for channel files (1-19).
    CompressionLevel compressionLevel = kDefaultCompressionLevel;
};

// =============================================================================
// ExportCommand Class
// =============================================================================

/// @brief Command handler for exporting an RCP package.
class ExportCommand {
public:
    explicit ExportCommand(ExportOptions options);
    ~ExportCommand();

    ExportCommand(const ExportCommand&) = delete;
    ExportCommand& operator=(const ExportCommand&) = delete;
    ExportCommand(ExportCommand&&) noexcept;
    ExportCommand& operator=(ExportCommand&&) noexcept;

    /// @brief Execute the export.
    /// @return Exit code (0 = success, see toExitCode for failures).
    [[nodiscard]] int execute();

    [[nodiscard]] const ExportOptions& options() const noexcept { return options_; }

    /// @brief Index written by the last successful execute().
    [[nodiscard]] const std::optional<format::Index>& index() const noexcept { return index_; }

    /// @brief Manifest written by the last successful execute().
    [[nodiscard]] const std::optional<format::Manifest>& manifest() const noexcept {
        return manifest_;
    }

private:
    /// @brief Check directories, stage files and the compression level.
    /// @throws UsageError, IOError.
    void validateOptions() const;

    void runExport();

    void printSummary() const;

    ExportOptions options_;
    std::optional<format::Manifest> manifest_;
    std::optional<format::Index> index_;
};

// =============================================================================
// Factory Function
// =============================================================================

[[nodiscard]] std::unique_ptr<ExportCommand> createExportCommand(
    const std::string& extractionDir,
    const std::string& simulationDir,
    const std::string& outputDir,
    const std::string& formatLabel,
    CompressionLevel compressionLevel);

}  // namespace rcp::commands

#endif  // RCP_COMMANDS_EXPORT_COMMAND_H
