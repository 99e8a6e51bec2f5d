// =============================================================================
// rcp-packager - Info Command
// =============================================================================
// Command handler for displaying package metadata.
//
// This module provides:
// - InfoCommand: print manifest and index summary of a package
// - Support for JSON output format
// =============================================================================

#ifndef RCP_COMMANDS_INFO_COMMAND_H
#define RCP_COMMANDS_INFO_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>

#include "rcp/common/error.h"
#include "rcp/format/rcp_messages.h"

namespace rcp::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for the info command.
struct InfoOptions {
    /// @brief Package root directory.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;
};

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying package information.
class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options);
    ~InfoCommand();

    InfoCommand(const InfoCommand&) = delete;
    InfoCommand& operator=(const InfoCommand&) = delete;
    InfoCommand(InfoCommand&&) noexcept;
    InfoCommand& operator=(InfoCommand&&) noexcept;

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    void printTextInfo(const format::Manifest& manifest, const format::Index& index) const;

    void printJsonInfo(const format::Manifest& manifest, const format::Index& index) const;

    InfoOptions options_;
};

// =============================================================================
// Factory Function
// =============================================================================

[[nodiscard]] std::unique_ptr<InfoCommand> createInfoCommand(
    const std::string& inputPath,
    bool jsonOutput);

}  // namespace rcp::commands

#endif  // RCP_COMMANDS_INFO_COMMAND_H
