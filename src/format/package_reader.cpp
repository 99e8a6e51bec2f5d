// =============================================================================
// rcp-packager - Package Reader Implementation
// =============================================================================

#include "rcp/format/package_reader.h"

#include "rcp/format/checksum_file.h"
#include "rcp/format/message_json.h"

namespace rcp::format {

Message readChannel(const std::filesystem::path& path, ChannelKind kind) {
    switch (kind) {
        case ChannelKind::kTouch:
            return readChannel<TouchChannel>(path);
        case ChannelKind::kAccelerometer:
            return readChannel<AccChannel>(path);
        case ChannelKind::kGyroscope:
            return readChannel<GyroChannel>(path);
    }
    throw UsageError("Unknown channel kind");
}

PackageReader::PackageReader(std::filesystem::path root) : paths_(packagePaths(root)) {}

Manifest PackageReader::readManifest() const {
    const std::string origin = paths_.manifest.string();
    return manifestFromJson(parseJson(io::readFileText(paths_.manifest), origin), origin);
}

Index PackageReader::readIndex() const {
    const std::string origin = paths_.index.string();
    return indexFromJson(parseJson(io::readFileText(paths_.index), origin), origin);
}

std::vector<Checksum> PackageReader::readChecksums() const {
    return readChecksumFile(paths_.checksums);
}

LoadedPackage PackageReader::load() const {
    LoadedPackage package;
    package.paths = paths_;
    package.manifest = readManifest();
    package.index = readIndex();
    package.touch = readChannel<TouchChannel>();
    package.acc = readChannel<AccChannel>();
    package.gyro = readChannel<GyroChannel>();
    return package;
}

LoadedPackage readPackage(const std::filesystem::path& root) {
    return PackageReader(root).load();
}

}  // namespace rcp::format
