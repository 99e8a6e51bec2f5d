// =============================================================================
// rcp-packager - Package Verifier
// =============================================================================
// Re-reads a package from disk and checks it against checksums.txt.
//
// Checks performed:
// - checksums.txt is present and parseable
// - every layout artifact has a checksum line
// - every recorded digest matches a fresh SHA-256 of the file
// - index.json sample counts match the decoded channel files
// - channel timestamps are strictly increasing
//
// Findings are collected into a VerificationReport rather than thrown.
// Nothing is cached; every call re-reads and re-hashes.
// =============================================================================

#ifndef RCP_FORMAT_PACKAGE_VERIFIER_H
#define RCP_FORMAT_PACKAGE_VERIFIER_H

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "rcp/common/error.h"
#include "rcp/format/rcp_format.h"

namespace rcp::format {

/// @brief One artifact whose digest differs from the recorded one.
struct ChecksumMismatch {
    /// @brief Relative artifact path as listed in checksums.txt.
    std::string file;
    std::string expected;
    /// @brief Fresh digest, empty if the file is missing.
    std::string actual;

    bool operator==(const ChecksumMismatch&) const = default;
};

/// @brief Outcome of verifying one package.
struct VerificationReport {
    bool passed = false;
    std::vector<ChecksumMismatch> mismatches;
    /// @brief Relative paths of artifacts that do not exist.
    std::vector<std::string> missing;
    /// @brief Structural problems (unparseable files, count or order violations).
    std::vector<std::string> issues;
    /// @brief Number of checksum lines that were hashed.
    std::size_t filesChecked = 0;

    /// @brief True if any digest mismatched or an artifact is missing.
    [[nodiscard]] bool hasChecksumFailures() const noexcept {
        return !mismatches.empty() || !missing.empty();
    }

    /// @brief Exit category: success, checksum failure or format failure.
    [[nodiscard]] ErrorCode errorCode() const noexcept {
        if (hasChecksumFailures()) {
            return ErrorCode::kChecksumError;
        }
        return issues.empty() ? ErrorCode::kSuccess : ErrorCode::kFormatError;
    }
};

/// @brief Verifier options.
struct VerifierOptions {
    /// @brief Compare index.json sample counts against the channel files.
    bool checkIndexCounts = true;

    /// @brief Require strictly increasing channel timestamps.
    bool checkTimestamps = true;

    /// @brief Reject NaN and infinite channel values.
    bool checkFiniteValues = true;
};

/// @brief Stateless package verifier.
class PackageVerifier {
public:
    explicit PackageVerifier(VerifierOptions options = {}) : options_(options) {}

    /// @brief Verify the package rooted at root.
    /// @note Only programming errors throw; package defects go into the report.
    [[nodiscard]] VerificationReport verify(const std::filesystem::path& root) const;

private:
    void verifyChecksums(const PackagePaths& paths, VerificationReport& report) const;
    void verifyContents(const PackagePaths& paths, VerificationReport& report) const;

    VerifierOptions options_;
};

/// @brief Verify with default options.
[[nodiscard]] VerificationReport verifyPackage(const std::filesystem::path& root);

}  // namespace rcp::format

#endif  // RCP_FORMAT_PACKAGE_VERIFIER_H
