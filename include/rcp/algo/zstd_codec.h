// =============================================================================
// rcp-packager - Zstd Codec
// =============================================================================
// Single-frame zstd compression for channel payloads.
//
// compress() emits one frame with the content size recorded in its header.
// decompress() sizes its output from that header. Frames without a recorded
// size are decoded into a buffer that starts at max(4 * input, 1024) bytes
// and doubles on "destination too small" until the output ceiling.
//
// Every libzstd failure surfaces as CompressionError carrying the library's
// error name verbatim; exceeding the ceiling raises OutputTooLargeError.
// =============================================================================

#ifndef RCP_ALGO_ZSTD_CODEC_H
#define RCP_ALGO_ZSTD_CODEC_H

#include <cstddef>

#include "rcp/common/error.h"
#include "rcp/common/types.h"

namespace rcp::algo {

/// @brief Minimum output buffer tried for frames of unknown content size.
inline constexpr std::size_t kMinUnknownSizeBuffer = 1024;

/// @brief zstd frame codec bound to a compression level.
///
/// Usage:
/// @code
/// ZstdCodec codec(5);
/// Bytes frame = codec.compress(payload);
/// Bytes restored = codec.decompress(frame);
/// @endcode
class ZstdCodec {
public:
    /// @brief Construct a codec.
    /// @param level Compression level, 1..19. 0 selects the library default.
    /// @param maxOutputSize Ceiling for a single decompressed frame.
    /// @throws UsageError if the level is out of range.
    explicit ZstdCodec(CompressionLevel level = kDefaultCompressionLevel,
                       std::size_t maxOutputSize = kMaxDecompressedSize);

    /// @brief Compress data into one zstd frame.
    /// @throws CompressionError on library failure.
    [[nodiscard]] Bytes compress(ByteSpan data) const;

    /// @brief Decompress one zstd frame.
    /// @throws CompressionError on a corrupt or truncated frame.
    /// @throws OutputTooLargeError if the output would exceed the ceiling.
    [[nodiscard]] Bytes decompress(ByteSpan data) const;

    [[nodiscard]] CompressionLevel level() const noexcept { return level_; }

    [[nodiscard]] std::size_t maxOutputSize() const noexcept { return maxOutputSize_; }

    /// @brief Throw UsageError unless level is 0 or within 1..min(19, ZSTD_maxCLevel()).
    static void validateLevel(CompressionLevel level);

private:
    CompressionLevel level_;
    std::size_t maxOutputSize_;
};

/// @brief Compress with a one-off codec.
[[nodiscard]] Bytes compress(ByteSpan data, CompressionLevel level = kDefaultCompressionLevel);

/// @brief Decompress with the default output ceiling.
[[nodiscard]] Bytes decompress(ByteSpan data);

}  // namespace rcp::algo

#endif  // RCP_ALGO_ZSTD_CODEC_H
