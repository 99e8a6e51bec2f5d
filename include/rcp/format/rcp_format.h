// =============================================================================
// rcp-packager - RCP Package Layout
// =============================================================================
// On-disk layout of an RCP package directory.
//
// Package Layout:
// <root>/
// +-- manifest.json      Manifest, pretty JSON
// +-- index.json         Index (counts, duration, 4 checksums), pretty JSON
// +-- checksums.txt      "<sha256>  <relative path>" per artifact, index last
// +-- channels/
//     +-- touch.pbz      zstd(TouchChannel)
//     +-- acc.pbz        zstd(AccChannel)
//     +-- gyro.pbz       zstd(GyroChannel)
//
// checksums.txt is written last; a package without it is incomplete.
// =============================================================================

#ifndef RCP_FORMAT_RCP_FORMAT_H
#define RCP_FORMAT_RCP_FORMAT_H

#include <array>
#include <filesystem>
#include <string_view>

#include "rcp/common/types.h"

namespace rcp::format {

// =============================================================================
// Relative Artifact Paths
// =============================================================================

inline constexpr std::string_view kManifestFile = "manifest.json";
inline constexpr std::string_view kIndexFile = "index.json";
inline constexpr std::string_view kChecksumsFile = "checksums.txt";
inline constexpr std::string_view kChannelsDir = "channels";

inline constexpr std::string_view kTouchFile = "channels/touch.pbz";
inline constexpr std::string_view kAccFile = "channels/acc.pbz";
inline constexpr std::string_view kGyroFile = "channels/gyro.pbz";

/// @brief Separator between digest and path in checksums.txt.
inline constexpr std::string_view kChecksumSeparator = "  ";

/// @brief Artifacts covered by Index.checksums, in order.
inline constexpr std::array<std::string_view, 4> kIndexedArtifacts = {
    kManifestFile, kTouchFile, kAccFile, kGyroFile};

/// @brief Artifacts listed in checksums.txt, in order.
inline constexpr std::array<std::string_view, 5> kChecksummedArtifacts = {
    kManifestFile, kTouchFile, kAccFile, kGyroFile, kIndexFile};

/// @brief Relative channel file path for a channel kind.
[[nodiscard]] constexpr std::string_view channelFile(ChannelKind kind) noexcept {
    switch (kind) {
        case ChannelKind::kTouch:
            return kTouchFile;
        case ChannelKind::kAccelerometer:
            return kAccFile;
        case ChannelKind::kGyroscope:
            return kGyroFile;
    }
    return kTouchFile;
}

// =============================================================================
// PackagePaths
// =============================================================================

/// @brief Absolute paths of every artifact under one package root.
struct PackagePaths {
    std::filesystem::path root;
    std::filesystem::path channelsDir;
    std::filesystem::path touch;
    std::filesystem::path acc;
    std::filesystem::path gyro;
    std::filesystem::path manifest;
    std::filesystem::path index;
    std::filesystem::path checksums;

    /// @brief Path of the channel file for a kind.
    [[nodiscard]] const std::filesystem::path& channel(ChannelKind kind) const noexcept {
        switch (kind) {
            case ChannelKind::kAccelerometer:
                return acc;
            case ChannelKind::kGyroscope:
                return gyro;
            case ChannelKind::kTouch:
                break;
        }
        return touch;
    }

    /// @brief Resolve a relative artifact path against the root.
    [[nodiscard]] std::filesystem::path resolve(std::string_view relative) const {
        return root / std::filesystem::path(relative);
    }
};

/// @brief Compute the layout for a root directory. Touches no files.
[[nodiscard]] inline PackagePaths packagePaths(const std::filesystem::path& root) {
    PackagePaths paths;
    paths.root = root;
    paths.channelsDir = root / kChannelsDir;
    paths.touch = paths.resolve(kTouchFile);
    paths.acc = paths.resolve(kAccFile);
    paths.gyro = paths.resolve(kGyroFile);
    paths.manifest = paths.resolve(kManifestFile);
    paths.index = paths.resolve(kIndexFile);
    paths.checksums = paths.resolve(kChecksumsFile);
    return paths;
}

}  // namespace rcp::format

#endif  // RCP_FORMAT_RCP_FORMAT_H
