// =============================================================================
// rcp-packager - Package Writer
// =============================================================================
// Writes a complete RCP package directory.
//
// Write sequence:
// 1. Validate column lengths of all channels (before any I/O)
// 2. Create <root>/channels/
// 3. Serialize + compress each channel to channels/{touch,acc,gyro}.pbz
// 4. Write manifest.json
// 5. Re-read the channel files to derive sample counts and duration
// 6. Hash manifest + channels into Index.checksums
// 7. Write index.json
// 8. Hash index.json; write checksums.txt (manifest, touch, acc, gyro, index)
// 9. Return the Index, which does not contain its own checksum
//
// Writes are not atomic. checksums.txt is the last file written, so its
// absence marks an incomplete package.
// =============================================================================

#ifndef RCP_FORMAT_PACKAGE_WRITER_H
#define RCP_FORMAT_PACKAGE_WRITER_H

#include <filesystem>

#include "rcp/algo/zstd_codec.h"
#include "rcp/format/rcp_format.h"
#include "rcp/format/rcp_messages.h"

namespace rcp::format {

/// @brief Writer options.
struct PackageWriterOptions {
    /// @brief zstd level for channel files (1-19, 0 = library default).
    CompressionLevel compressionLevel = kDefaultCompressionLevel;
};

/// @brief Writer bound to one package root.
/// @note Not thread-safe; concurrent writers to one root are not coordinated.
class PackageWriter {
public:
    /// @throws UsageError if the compression level is out of range.
    explicit PackageWriter(std::filesystem::path root, PackageWriterOptions options = {});

    [[nodiscard]] const PackagePaths& paths() const noexcept { return paths_; }

    [[nodiscard]] const PackageWriterOptions& options() const noexcept { return options_; }

    /// @brief Write the full package.
    /// @return Index as written to index.json.
    /// @throws ColumnLengthMismatchError before any file is touched.
    /// @throws IOError, CompressionError on write or re-read failure.
    Index write(const Manifest& manifest, const TouchChannel& touch, const AccChannel& acc,
                const GyroChannel& gyro);

private:
    template <ChannelMessage Channel>
    void writeChannel(const Channel& channel) const;

    /// @brief Derive counts and duration from the channel files on disk.
    [[nodiscard]] Index buildIndex() const;

    /// @brief SHA-256 of the given relative artifacts.
    template <std::size_t N>
    [[nodiscard]] std::vector<Checksum> computeChecksums(
        const std::array<std::string_view, N>& artifacts) const;

    PackagePaths paths_;
    PackageWriterOptions options_;
    algo::ZstdCodec codec_;
};

/// @brief Write a package with a one-off writer.
Index writePackage(const std::filesystem::path& root, const Manifest& manifest,
                   const TouchChannel& touch, const AccChannel& acc, const GyroChannel& gyro,
                   CompressionLevel compressionLevel = kDefaultCompressionLevel);

}  // namespace rcp::format

#endif  // RCP_FORMAT_PACKAGE_WRITER_H
