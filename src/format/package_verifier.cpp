// =============================================================================
// rcp-packager - Package Verifier Implementation
// =============================================================================

#include "rcp/format/package_verifier.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "rcp/format/checksum_file.h"
#include "rcp/format/package_reader.h"
#include "rcp/io/sha256.h"

namespace rcp::format {

namespace {

/// @brief Reject absolute paths and parent references in checksum entries.
bool isSafeRelativePath(const std::string& relative) {
    const std::filesystem::path path(relative);
    if (relative.empty() || path.is_absolute()) {
        return false;
    }
    return std::none_of(path.begin(), path.end(),
                        [](const std::filesystem::path& part) { return part == ".."; });
}

/// @brief Index of the first non-increasing timestamp, or npos.
std::size_t firstOrderViolation(const std::vector<TimestampUs>& t) {
    for (std::size_t i = 1; i < t.size(); ++i) {
        if (t[i] <= t[i - 1]) {
            return i;
        }
    }
    return std::string::npos;
}

using NamedColumn = std::pair<std::string_view, const std::vector<float>*>;

std::array<NamedColumn, 4> floatColumns(const TouchChannel& touch) {
    return {{{"x", &touch.x}, {"y", &touch.y}, {"pressure", &touch.pressure},
             {"size", &touch.size}}};
}

template <ChannelKind Kind>
std::array<NamedColumn, 3> floatColumns(const AxisChannel<Kind>& channel) {
    return {{{"x", &channel.x}, {"y", &channel.y}, {"z", &channel.z}}};
}

template <ChannelMessage Channel>
void checkChannel(const Channel& channel, std::uint64_t indexed, std::string_view file,
                  const VerifierOptions& options, VerificationReport& report) {
    if (options.checkIndexCounts && channel.sampleCount() != indexed) {
        report.issues.push_back(fmt::format("{}: index records {} samples, file holds {}", file,
                                            indexed, channel.sampleCount()));
    }
    if (options.checkTimestamps) {
        const std::size_t at = firstOrderViolation(channel.t);
        if (at != std::string::npos) {
            report.issues.push_back(
                fmt::format("{}: timestamps not strictly increasing at sample {} ({} after {})",
                            file, at, channel.t[at], channel.t[at - 1]));
        }
    }
    if (options.checkFiniteValues) {
        for (const auto& [name, column] : floatColumns(channel)) {
            const auto bad = std::find_if(column->begin(), column->end(),
                                          [](float v) { return !std::isfinite(v); });
            if (bad != column->end()) {
                report.issues.push_back(fmt::format("{}: non-finite {} value at sample {}", file,
                                                    name, bad - column->begin()));
            }
        }
    }
}

}  // namespace

VerificationReport PackageVerifier::verify(const std::filesystem::path& root) const {
    const PackagePaths paths = packagePaths(root);
    VerificationReport report;

    verifyChecksums(paths, report);
    if (options_.checkIndexCounts || options_.checkTimestamps || options_.checkFiniteValues) {
        verifyContents(paths, report);
    }

    report.passed = report.errorCode() == ErrorCode::kSuccess;
    return report;
}

void PackageVerifier::verifyChecksums(const PackagePaths& paths,
                                      VerificationReport& report) const {
    std::error_code ec;
    if (!std::filesystem::exists(paths.checksums, ec)) {
        report.missing.emplace_back(kChecksumsFile);
        return;
    }

    auto entries = tryExecute([&] { return readChecksumFile(paths.checksums); });
    if (!entries) {
        report.issues.push_back(entries.error().message());
        return;
    }

    for (std::string_view artifact : kChecksummedArtifacts) {
        const bool listed = std::any_of(entries->begin(), entries->end(),
                                        [&](const Checksum& c) { return c.path == artifact; });
        if (!listed) {
            report.issues.push_back(fmt::format("{}: no checksum recorded for {}",
                                                kChecksumsFile, artifact));
        }
    }

    for (const auto& entry : *entries) {
        if (!isSafeRelativePath(entry.path)) {
            report.issues.push_back(
                fmt::format("{}: refusing path outside package: {}", kChecksumsFile, entry.path));
            continue;
        }

        const std::filesystem::path full = paths.resolve(entry.path);
        if (!std::filesystem::is_regular_file(full, ec)) {
            report.missing.push_back(entry.path);
            report.mismatches.push_back(ChecksumMismatch{entry.path, entry.sha256, ""});
            continue;
        }

        auto actual = tryExecute([&] { return io::sha256FileHex(full); });
        if (!actual) {
            report.issues.push_back(actual.error().message());
            continue;
        }
        ++report.filesChecked;
        if (*actual != entry.sha256) {
            report.mismatches.push_back(ChecksumMismatch{entry.path, entry.sha256, *actual});
        }
    }
}

void PackageVerifier::verifyContents(const PackagePaths& paths,
                                     VerificationReport& report) const {
    const PackageReader reader(paths.root);

    auto index = tryExecute([&] { return reader.readIndex(); });
    if (!index) {
        report.issues.push_back(index.error().message());
        return;
    }

    // A channel that fails to decode is an issue; the others are still checked
    auto touch = tryExecute([&] { return reader.readChannel<TouchChannel>(); });
    if (touch) {
        checkChannel(*touch, index->touchSamples, kTouchFile, options_, report);
    } else {
        report.issues.push_back(fmt::format("{}: {}", kTouchFile, touch.error().message()));
    }

    auto acc = tryExecute([&] { return reader.readChannel<AccChannel>(); });
    if (acc) {
        checkChannel(*acc, index->accSamples, kAccFile, options_, report);
    } else {
        report.issues.push_back(fmt::format("{}: {}", kAccFile, acc.error().message()));
    }

    auto gyro = tryExecute([&] { return reader.readChannel<GyroChannel>(); });
    if (gyro) {
        checkChannel(*gyro, index->gyroSamples, kGyroFile, options_, report);
    } else {
        report.issues.push_back(fmt::format("{}: {}", kGyroFile, gyro.error().message()));
    }
}

VerificationReport verifyPackage(const std::filesystem::path& root) {
    return PackageVerifier().verify(root);
}

}  // namespace rcp::format
