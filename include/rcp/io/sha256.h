// =============================================================================
// rcp-packager - SHA-256 Digests
// =============================================================================
// Streaming SHA-256 over mbedTLS, rendered as 64 lowercase hex characters.
// =============================================================================

#ifndef RCP_IO_SHA256_H
#define RCP_IO_SHA256_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "rcp/common/error.h"
#include "rcp/common/types.h"

namespace rcp::io {

/// @brief Length of a raw SHA-256 digest in bytes.
inline constexpr std::size_t kSha256Size = 32;

/// @brief Length of a hex-rendered SHA-256 digest.
inline constexpr std::size_t kSha256HexSize = 64;

/// @brief Read chunk size used when hashing files.
inline constexpr std::size_t kHashChunkSize = 64 * 1024;

using Sha256Digest = std::array<std::uint8_t, kSha256Size>;

/// @brief Incremental SHA-256 hasher.
/// @note Not copyable; each instance owns one mbedTLS context.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    /// @brief Feed more bytes.
    void update(ByteSpan data);

    /// @brief Finish and return the raw digest. The hasher cannot be reused.
    [[nodiscard]] Sha256Digest finish();

    /// @brief Finish and return the lowercase hex digest.
    [[nodiscard]] std::string finishHex();

private:
    struct Context;
    std::unique_ptr<Context> ctx_;
    bool finished_ = false;
};

/// @brief Render a digest as lowercase hex.
[[nodiscard]] std::string toHex(const Sha256Digest& digest);

/// @brief Hex SHA-256 of an in-memory buffer.
[[nodiscard]] std::string sha256Hex(ByteSpan data);

/// @brief Hex SHA-256 of a file, read in kHashChunkSize chunks.
/// @throws IOError with the path if the file cannot be read.
[[nodiscard]] std::string sha256FileHex(const std::filesystem::path& path);

/// @brief True if text is exactly 64 lowercase hex characters.
[[nodiscard]] bool isSha256Hex(std::string_view text) noexcept;

}  // namespace rcp::io

#endif  // RCP_IO_SHA256_H
