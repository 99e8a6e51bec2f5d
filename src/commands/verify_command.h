// =============================================================================
// rcp-packager - Verify Command
// =============================================================================
// Command handler for verifying package integrity.
//
// Exit codes:
// - 0: every check passed
// - 4: a checksum mismatched or an artifact is missing
// - 3: checksums pass but the package is structurally inconsistent
// =============================================================================

#ifndef RCP_COMMANDS_VERIFY_COMMAND_H
#define RCP_COMMANDS_VERIFY_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>

#include "rcp/common/error.h"
#include "rcp/format/package_verifier.h"

namespace rcp::commands {

// =============================================================================
// Verify Options
// =============================================================================

/// @brief Configuration options for the verify command.
struct VerifyOptions {
    /// @brief Package root directory.
    std::filesystem::path inputPath;

    /// @brief Print every checked artifact, not just failures.
    bool verbose = false;

    /// @brief Compare index.json counts against the channel files.
    bool checkIndexCounts = true;

    /// @brief Require strictly increasing channel timestamps.
    bool checkTimestamps = true;

    bool checkFiniteValues = true;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

/// @brief Command handler for verifying package integrity.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);
    ~VerifyCommand();

    VerifyCommand(const VerifyCommand&) = delete;
    VerifyCommand& operator=(const VerifyCommand&) = delete;
    VerifyCommand(VerifyCommand&&) noexcept;
    VerifyCommand& operator=(VerifyCommand&&) noexcept;

    /// @brief Execute the verify command.
    /// @return Exit code (0 = success, non-zero = verification failed).
    [[nodiscard]] int execute();

    /// @brief Report produced by the last execute().
    [[nodiscard]] const format::VerificationReport& report() const noexcept { return report_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    void printReport() const;

    VerifyOptions options_;
    format::VerificationReport report_;
};

// =============================================================================
// Factory Function
// =============================================================================

[[nodiscard]] std::unique_ptr<VerifyCommand> createVerifyCommand(
    const std::string& inputPath,
    bool verbose);

}  // namespace rcp::commands

#endif  // RCP_COMMANDS_VERIFY_COMMAND_H
