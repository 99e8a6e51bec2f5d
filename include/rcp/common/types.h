// =============================================================================
// rcp-packager - Common Type Definitions
// =============================================================================
// Core type aliases and constants shared by the codec, package and command
// layers.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef RCP_COMMON_TYPES_H
#define RCP_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace rcp {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Owned byte buffer.
using Bytes = std::vector<std::uint8_t>;

/// @brief Read-only view over bytes.
using ByteSpan = std::span<const std::uint8_t>;

/// @brief Sample timestamp in microseconds.
using TimestampUs = std::uint64_t;

/// @brief zstd compression level.
using CompressionLevel = int;

// =============================================================================
// Constants
// =============================================================================

/// @brief Format label written into Manifest.version by default.
inline constexpr std::string_view kDefaultFormatVersion = "rcp_2025";

/// @brief Default zstd level for channel files.
inline constexpr CompressionLevel kDefaultCompressionLevel = 3;

inline constexpr CompressionLevel kMinCompressionLevel = 1;

inline constexpr CompressionLevel kMaxCompressionLevel = 19;

/// @brief Ceiling for a single decompressed channel payload (1 GiB).
inline constexpr std::size_t kMaxDecompressedSize = std::size_t{1} << 30;

/// @brief Microseconds per second, used for duration derivation.
inline constexpr double kMicrosPerSecond = 1'000'000.0;

// =============================================================================
// Channel Kinds
// =============================================================================

/// @brief The three sensor channels carried by a package.
enum class ChannelKind : std::uint8_t {
    kTouch = 0,
    kAccelerometer = 1,
    kGyroscope = 2
};

}  // namespace rcp

#endif  // RCP_COMMON_TYPES_H
