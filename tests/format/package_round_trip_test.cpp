// =============================================================================
// rcp-packager - Package Writer/Reader Tests
// =============================================================================
// End-to-end tests that write a package to a temporary directory and read
// it back: file layout, index counts, checksum coverage and failure paths.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <filesystem>
#include <string>

#include "rcp/format/checksum_file.h"
#include "rcp/format/message_json.h"
#include "rcp/format/package_reader.h"
#include "rcp/format/package_writer.h"
#include "rcp/io/sha256.h"
#include "test_support.h"

namespace rcp::format::test {

using rcp::test::sampleAcc;
using rcp::test::sampleGyro;
using rcp::test::sampleManifest;
using rcp::test::sampleTouch;
using rcp::test::TempDirGuard;

TEST(PackageRoundTripTest, WritesExpectedLayout) {
    TempDirGuard dir("rcp_pkg");
    const auto root = dir.path() / "pkg";

    (void)writePackage(root, sampleManifest(), sampleTouch(), sampleAcc(), sampleGyro());

    EXPECT_TRUE(std::filesystem::is_regular_file(root / "manifest.json"));
    EXPECT_TRUE(std::filesystem::is_regular_file(root / "index.json"));
    EXPECT_TRUE(std::filesystem::is_regular_file(root / "checksums.txt"));
    EXPECT_TRUE(std::filesystem::is_regular_file(root / "channels" / "touch.pbz"));
    EXPECT_TRUE(std::filesystem::is_regular_file(root / "channels" / "acc.pbz"));
    EXPECT_TRUE(std::filesystem::is_regular_file(root / "channels" / "gyro.pbz"));
}

TEST(PackageRoundTripTest, IndexCountsAndDuration) {
    TempDirGuard dir("rcp_pkg");
    const Index index =
        writePackage(dir.path(), sampleManifest(), sampleTouch(), sampleAcc(), sampleGyro());

    EXPECT_EQ(index.touchSamples, 3U);
    EXPECT_EQ(index.accSamples, 3U);
    EXPECT_EQ(index.gyroSamples, 3U);
    EXPECT_NEAR(index.durationSeconds, 0.1, 1e-9);

    ASSERT_EQ(index.checksums.size(), kIndexedArtifacts.size());
    for (std::size_t i = 0; i < kIndexedArtifacts.size(); ++i) {
        EXPECT_EQ(index.checksums[i].path, kIndexedArtifacts[i]);
    }

    // index.json on disk carries the same four entries
    const Index stored = PackageReader(dir.path()).readIndex();
    EXPECT_EQ(stored, index);
}

TEST(PackageRoundTripTest, ChecksumsMatchFilesOnDisk) {
    TempDirGuard dir("rcp_pkg");
    (void)writePackage(dir.path(), sampleManifest(), sampleTouch(), sampleAcc(), sampleGyro());

    const auto entries = readChecksumFile(dir.path() / "checksums.txt");
    ASSERT_EQ(entries.size(), kChecksummedArtifacts.size());
    EXPECT_EQ(entries.back().path, "index.json");
    for (const auto& entry : entries) {
        EXPECT_EQ(entry.sha256, io::sha256FileHex(dir.path() / entry.path)) << entry.path;
    }
}

TEST(PackageRoundTripTest, ReaderRecoversEveryMessage) {
    TempDirGuard dir("rcp_pkg");
    (void)writePackage(dir.path(), sampleManifest(), sampleTouch(), sampleAcc(), sampleGyro(),
                       9);

    const LoadedPackage package = readPackage(dir.path());
    EXPECT_EQ(package.manifest, sampleManifest());
    EXPECT_EQ(package.manifest.attributes.at("style"), "aggressive");
    EXPECT_EQ(package.touch, sampleTouch());
    EXPECT_EQ(package.acc, sampleAcc());
    EXPECT_EQ(package.gyro, sampleGyro());

    const Message gyro = readChannel(package.paths.gyro, ChannelKind::kGyroscope);
    EXPECT_EQ(std::get<GyroChannel>(gyro), sampleGyro());
}

TEST(PackageRoundTripTest, ManifestJsonUsesSnakeCaseKeys) {
    TempDirGuard dir("rcp_pkg");
    (void)writePackage(dir.path(), sampleManifest(), sampleTouch(), sampleAcc(), sampleGyro());

    const auto doc = parseJson(rcp::test::readText(dir.path() / "manifest.json"), "manifest");
    EXPECT_EQ(doc.at("version"), "rcp_2025");
    EXPECT_EQ(doc.at("package_id"), "demo-package");
    EXPECT_EQ(doc.at("device_profile"), "generic");
    EXPECT_EQ(doc.at("attributes").at("style"), "aggressive");
}

TEST(PackageRoundTripTest, EmptyChannelsProduceZeroIndex) {
    TempDirGuard dir("rcp_pkg");
    const Index index =
        writePackage(dir.path(), Manifest{}, TouchChannel{}, AccChannel{}, GyroChannel{});

    EXPECT_EQ(index.touchSamples, 0U);
    EXPECT_EQ(index.accSamples, 0U);
    EXPECT_EQ(index.gyroSamples, 0U);
    EXPECT_DOUBLE_EQ(index.durationSeconds, 0.0);
    EXPECT_EQ(readPackage(dir.path()).touch, TouchChannel{});
}

TEST(PackageRoundTripTest, MismatchedColumnsWriteNothing) {
    TempDirGuard dir("rcp_pkg");
    const auto root = dir.path() / "pkg";

    TouchChannel touch = sampleTouch();
    touch.pressure.pop_back();

    EXPECT_THROW(
        (void)writePackage(root, sampleManifest(), touch, sampleAcc(), sampleGyro()),
        ColumnLengthMismatchError);
    EXPECT_FALSE(std::filesystem::exists(root));
}

TEST(PackageRoundTripTest, InvalidLevelIsRejectedBeforeWriting) {
    TempDirGuard dir("rcp_pkg");
    const auto root = dir.path() / "pkg";

    EXPECT_THROW((void)writePackage(root, sampleManifest(), sampleTouch(), sampleAcc(),
                                    sampleGyro(), 25),
                 UsageError);
    EXPECT_FALSE(std::filesystem::exists(root));
}

TEST(PackageRoundTripTest, MissingManifestIsIOError) {
    TempDirGuard dir("rcp_pkg");
    EXPECT_THROW((void)PackageReader(dir.path()).readManifest(), IOError);
}

TEST(PackageRoundTripTest, CorruptChannelFileIsCompressionError) {
    TempDirGuard dir("rcp_pkg");
    (void)writePackage(dir.path(), sampleManifest(), sampleTouch(), sampleAcc(), sampleGyro());
    rcp::test::writeText(dir.path() / "channels" / "acc.pbz", "garbage");

    EXPECT_THROW((void)PackageReader(dir.path()).readChannel<AccChannel>(), CompressionError);
}

RC_GTEST_PROP(PackageRoundTripProperty, TouchCountMatchesIndex, ()) {
    const auto n = *rc::gen::inRange<std::size_t>(0, 64);
    TouchChannel touch;
    for (std::size_t i = 0; i < n; ++i) {
        touch.t.push_back(i * 1000);
        touch.x.push_back(static_cast<float>(i));
        touch.y.push_back(static_cast<float>(i) * 0.5F);
        touch.pressure.push_back(1.0F);
        touch.size.push_back(1.0F);
    }

    TempDirGuard dir("rcp_pkg_prop");
    const Index index = writePackage(dir.path(), sampleManifest(), touch, AccChannel{},
                                     GyroChannel{});
    RC_ASSERT(index.touchSamples == n);
    RC_ASSERT(PackageReader(dir.path()).readChannel<TouchChannel>() == touch);
}

}  // namespace rcp::format::test
