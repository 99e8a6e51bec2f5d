// =============================================================================
// rcp-packager - Zstd Codec Implementation
// =============================================================================

#include "rcp/algo/zstd_codec.h"

#include <algorithm>
#include <string>

#include <fmt/format.h>
#include <zstd.h>
#include <zstd_errors.h>

namespace rcp::algo {

namespace {

[[noreturn]] void throwZstdError(std::size_t code) {
    throw CompressionError(ZSTD_getErrorName(code));
}

}  // namespace

ZstdCodec::ZstdCodec(CompressionLevel level, std::size_t maxOutputSize)
    : level_(level), maxOutputSize_(maxOutputSize) {
    validateLevel(level);
}

void ZstdCodec::validateLevel(CompressionLevel level) {
    if (level == 0) {
        return;
    }
    const CompressionLevel upper = std::min(kMaxCompressionLevel, ZSTD_maxCLevel());
    if (level < kMinCompressionLevel || level > upper) {
        throw UsageError(fmt::format("Compression level must be between {} and {}, got {}",
                                     kMinCompressionLevel, upper, level));
    }
}

// =============================================================================
// Compression
// =============================================================================

Bytes ZstdCodec::compress(ByteSpan data) const {
    const std::size_t bound = ZSTD_compressBound(data.size());
    Bytes compressed(bound);

    // ZSTD_compress records the content size in the frame header
    const std::size_t written = ZSTD_compress(compressed.data(), compressed.size(),
                                              data.data(), data.size(), level_);
    if (ZSTD_isError(written)) {
        throwZstdError(written);
    }

    compressed.resize(written);
    return compressed;
}

// =============================================================================
// Decompression
// =============================================================================

Bytes ZstdCodec::decompress(ByteSpan data) const {
    const unsigned long long contentSize = ZSTD_getFrameContentSize(data.data(), data.size());

    if (contentSize == ZSTD_CONTENTSIZE_ERROR) {
        throw CompressionError("Invalid zstd frame");
    }

    if (contentSize != ZSTD_CONTENTSIZE_UNKNOWN) {
        if (contentSize > maxOutputSize_) {
            throw OutputTooLargeError(contentSize, maxOutputSize_);
        }
        Bytes output(static_cast<std::size_t>(contentSize));
        const std::size_t decoded =
            ZSTD_decompress(output.data(), output.size(), data.data(), data.size());
        if (ZSTD_isError(decoded)) {
            throwZstdError(decoded);
        }
        output.resize(decoded);
        return output;
    }

    // Size not recorded: grow the destination until the frame fits
    std::size_t capacity =
        std::min(std::max(data.size() * 4, kMinUnknownSizeBuffer), maxOutputSize_);
    while (true) {
        Bytes output(capacity);
        const std::size_t decoded =
            ZSTD_decompress(output.data(), output.size(), data.data(), data.size());
        if (!ZSTD_isError(decoded)) {
            output.resize(decoded);
            return output;
        }
        if (ZSTD_getErrorCode(decoded) != ZSTD_error_dstSize_tooSmall) {
            throwZstdError(decoded);
        }
        if (capacity >= maxOutputSize_) {
            throw OutputTooLargeError(static_cast<std::uint64_t>(capacity) * 2, maxOutputSize_);
        }
        capacity = std::min(capacity * 2, maxOutputSize_);
    }
}

// =============================================================================
// Convenience Functions
// =============================================================================

Bytes compress(ByteSpan data, CompressionLevel level) {
    return ZstdCodec(level).compress(data);
}

Bytes decompress(ByteSpan data) {
    return ZstdCodec().decompress(data);
}

}  // namespace rcp::algo
