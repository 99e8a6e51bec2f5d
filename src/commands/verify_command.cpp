// =============================================================================
// rcp-packager - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <algorithm>
#include <iostream>

#include "rcp/common/logger.h"
#include "rcp/format/rcp_format.h"

namespace rcp::commands {

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

VerifyCommand::~VerifyCommand() = default;

VerifyCommand::VerifyCommand(VerifyCommand&&) noexcept = default;
VerifyCommand& VerifyCommand::operator=(VerifyCommand&&) noexcept = default;

int VerifyCommand::execute() {
    try {
        if (!std::filesystem::is_directory(options_.inputPath)) {
            throw IOError("Package directory not found: " + options_.inputPath.string(),
                          ErrorContext(options_.inputPath.string()));
        }

        RCP_LOG_DEBUG("Verifying package {}", options_.inputPath.string());

        format::VerifierOptions verifierOptions;
        verifierOptions.checkIndexCounts = options_.checkIndexCounts;
        verifierOptions.checkTimestamps = options_.checkTimestamps;
        verifierOptions.checkFiniteValues = options_.checkFiniteValues;
        report_ = format::PackageVerifier(verifierOptions).verify(options_.inputPath);

        printReport();

        for (const auto& mismatch : report_.mismatches) {
            RCP_LOG_WARNING("Checksum mismatch for {}: expected {}, got {}", mismatch.file,
                            mismatch.expected,
                            mismatch.actual.empty() ? std::string("<missing>") : mismatch.actual);
        }
        for (const auto& issue : report_.issues) {
            RCP_LOG_WARNING("{}", issue);
        }

        return toExitCode(report_.errorCode());

    } catch (const RCPException& e) {
        RCP_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        RCP_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

void VerifyCommand::printReport() const {
    std::cout << std::endl;
    std::cout << "=== Verification Summary ===" << std::endl;
    std::cout << "Package: " << options_.inputPath.string() << std::endl;
    std::cout << "Files:   " << report_.filesChecked << " hashed" << std::endl;

    if (options_.verbose) {
        for (std::string_view artifact : format::kChecksummedArtifacts) {
            const bool failed =
                std::any_of(report_.mismatches.begin(), report_.mismatches.end(),
                            [&](const format::ChecksumMismatch& m) { return m.file == artifact; });
            std::cout << "[" << (failed ? "FAIL" : "PASS") << "] " << artifact << std::endl;
        }
    }

    if (report_.passed) {
        std::cout << "Status:  OK" << std::endl;
    } else {
        std::cout << "Status:  FAILED" << std::endl;
        for (const auto& mismatch : report_.mismatches) {
            std::cout << "  - " << mismatch.file << ": expected " << mismatch.expected
                      << ", got " << (mismatch.actual.empty() ? "<missing>" : mismatch.actual)
                      << std::endl;
        }
        for (const auto& missing : report_.missing) {
            std::cout << "  - missing: " << missing << std::endl;
        }
        for (const auto& issue : report_.issues) {
            std::cout << "  - " << issue << std::endl;
        }
    }

    std::cout << "=============================" << std::endl;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<VerifyCommand> createVerifyCommand(
    const std::string& inputPath,
    bool verbose) {

    VerifyOptions opts;
    opts.inputPath = inputPath;
    opts.verbose = verbose;

    return std::make_unique<VerifyCommand>(std::move(opts));
}

}  // namespace rcp::commands
