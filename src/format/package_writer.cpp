// =============================================================================
// rcp-packager - Package Writer Implementation
// =============================================================================

#include "rcp/format/package_writer.h"

#include <algorithm>

#include "rcp/format/checksum_file.h"
#include "rcp/format/message_json.h"
#include "rcp/format/package_reader.h"
#include "rcp/io/file_io.h"
#include "rcp/io/sha256.h"

namespace rcp::format {

PackageWriter::PackageWriter(std::filesystem::path root, PackageWriterOptions options)
    : paths_(packagePaths(root)), options_(options), codec_(options.compressionLevel) {}

Index PackageWriter::write(const Manifest& manifest, const TouchChannel& touch,
                           const AccChannel& acc, const GyroChannel& gyro) {
    touch.validateColumns();
    acc.validateColumns();
    gyro.validateColumns();

    io::ensureDirectory(paths_.channelsDir);

    writeChannel(touch);
    writeChannel(acc);
    writeChannel(gyro);

    io::writeFileText(paths_.manifest, dumpJson(toJson(manifest)));

    Index index = buildIndex();
    index.checksums = computeChecksums(kIndexedArtifacts);

    io::writeFileText(paths_.index, dumpJson(toJson(index)));

    // index.json is hashed after it is written; its digest lives only in checksums.txt
    std::vector<Checksum> entries = index.checksums;
    entries.push_back(Checksum{std::string(kIndexFile), io::sha256FileHex(paths_.index)});
    io::writeFileText(paths_.checksums, formatChecksumFile(entries));

    return index;
}

template <ChannelMessage Channel>
void PackageWriter::writeChannel(const Channel& channel) const {
    const Bytes raw = channel.serialize();
    io::writeFileBytes(paths_.channel(Channel::kKind), codec_.compress(raw));
}

Index PackageWriter::buildIndex() const {
    const auto touch = format::readChannel<TouchChannel>(paths_.touch);
    const auto acc = format::readChannel<AccChannel>(paths_.acc);
    const auto gyro = format::readChannel<GyroChannel>(paths_.gyro);

    Index index;
    index.touchSamples = touch.sampleCount();
    index.accSamples = acc.sampleCount();
    index.gyroSamples = gyro.sampleCount();
    index.durationSeconds = std::max({channelDurationSeconds(touch.t),
                                      channelDurationSeconds(acc.t),
                                      channelDurationSeconds(gyro.t)});
    return index;
}

template <std::size_t N>
std::vector<Checksum> PackageWriter::computeChecksums(
    const std::array<std::string_view, N>& artifacts) const {
    std::vector<Checksum> checksums;
    checksums.reserve(N);
    for (std::string_view relative : artifacts) {
        checksums.push_back(
            Checksum{std::string(relative), io::sha256FileHex(paths_.resolve(relative))});
    }
    return checksums;
}

Index writePackage(const std::filesystem::path& root, const Manifest& manifest,
                   const TouchChannel& touch, const AccChannel& acc, const GyroChannel& gyro,
                   CompressionLevel compressionLevel) {
    PackageWriter writer(root, PackageWriterOptions{compressionLevel});
    return writer.write(manifest, touch, acc, gyro);
}

}  // namespace rcp::format
