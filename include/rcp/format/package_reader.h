// =============================================================================
// rcp-packager - Package Reader
// =============================================================================
// Reads channel files and package metadata back from disk.
//
// Channel reads run read -> zstd decompress -> strict parse. Codec and
// schema errors propagate unchanged; a missing file is IOError with its path.
// =============================================================================

#ifndef RCP_FORMAT_PACKAGE_READER_H
#define RCP_FORMAT_PACKAGE_READER_H

#include <filesystem>
#include <vector>

#include "rcp/algo/zstd_codec.h"
#include "rcp/format/rcp_format.h"
#include "rcp/format/rcp_messages.h"
#include "rcp/io/file_io.h"

namespace rcp::format {

// =============================================================================
// Channel Reads
// =============================================================================

/// @brief Load one channel file.
/// @tparam Channel TouchChannel, AccChannel or GyroChannel.
/// @throws IOError if the file is missing.
/// @throws CompressionError, OutputTooLargeError on a bad frame.
/// @throws FormatError subclasses on a schema violation.
template <ChannelMessage Channel>
[[nodiscard]] Channel readChannel(const std::filesystem::path& path) {
    const Bytes compressed = io::readFileBytes(path);
    const Bytes raw = algo::decompress(compressed);
    return Channel::parse(raw);
}

/// @brief Runtime-dispatched variant of readChannel.
[[nodiscard]] Message readChannel(const std::filesystem::path& path, ChannelKind kind);

// =============================================================================
// Whole-Package Reads
// =============================================================================

/// @brief Every artifact of a package, decoded.
struct LoadedPackage {
    PackagePaths paths;
    Manifest manifest;
    Index index;
    TouchChannel touch;
    AccChannel acc;
    GyroChannel gyro;
};

/// @brief Reader bound to one package root.
///
/// Usage:
/// @code
/// PackageReader reader("/data/pkg");
/// Manifest manifest = reader.readManifest();
/// auto acc = reader.readChannel<AccChannel>();
/// @endcode
class PackageReader {
public:
    explicit PackageReader(std::filesystem::path root);

    [[nodiscard]] const PackagePaths& paths() const noexcept { return paths_; }

    /// @brief Load manifest.json.
    /// @throws FormatError naming the file if the JSON does not match the schema.
    [[nodiscard]] Manifest readManifest() const;

    /// @brief Load index.json.
    [[nodiscard]] Index readIndex() const;

    /// @brief Load checksums.txt.
    [[nodiscard]] std::vector<Checksum> readChecksums() const;

    template <ChannelMessage Channel>
    [[nodiscard]] Channel readChannel() const {
        return format::readChannel<Channel>(paths_.channel(Channel::kKind));
    }

    /// @brief Load manifest, index and the three channels.
    [[nodiscard]] LoadedPackage load() const;

private:
    PackagePaths paths_;
};

/// @brief Convenience wrapper for PackageReader(root).load().
[[nodiscard]] LoadedPackage readPackage(const std::filesystem::path& root);

}  // namespace rcp::format

#endif  // RCP_FORMAT_PACKAGE_READER_H
