// =============================================================================
// rcp-packager - Package Verifier Tests
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

#include "rcp/format/package_verifier.h"
#include "rcp/format/package_writer.h"
#include "test_support.h"

namespace rcp::format::test {

using rcp::test::sampleAcc;
using rcp::test::sampleGyro;
using rcp::test::sampleManifest;
using rcp::test::sampleTouch;
using rcp::test::TempDirGuard;

namespace {

void writeSample(const std::filesystem::path& root) {
    (void)writePackage(root, sampleManifest(), sampleTouch(), sampleAcc(), sampleGyro());
}

void flipLastByte(const std::filesystem::path& file) {
    std::string bytes = rcp::test::readText(file);
    ASSERT_FALSE(bytes.empty());
    bytes.back() = static_cast<char>(bytes.back() ^ 0x5A);
    rcp::test::writeText(file, bytes);
}

}  // namespace

TEST(PackageVerifierTest, FreshPackagePasses) {
    TempDirGuard dir("rcp_verify");
    writeSample(dir.path());

    const VerificationReport report = verifyPackage(dir.path());
    EXPECT_TRUE(report.passed);
    EXPECT_TRUE(report.mismatches.empty());
    EXPECT_TRUE(report.missing.empty());
    EXPECT_TRUE(report.issues.empty());
    EXPECT_EQ(report.filesChecked, kChecksummedArtifacts.size());
    EXPECT_EQ(report.errorCode(), ErrorCode::kSuccess);
}

TEST(PackageVerifierTest, TamperedChannelIsReported) {
    TempDirGuard dir("rcp_verify");
    writeSample(dir.path());
    flipLastByte(dir.path() / "channels" / "acc.pbz");

    const VerificationReport report = verifyPackage(dir.path());
    EXPECT_FALSE(report.passed);
    ASSERT_EQ(report.mismatches.size(), 1U);
    EXPECT_EQ(report.mismatches[0].file, "channels/acc.pbz");
    EXPECT_NE(report.mismatches[0].expected, report.mismatches[0].actual);
    EXPECT_EQ(toExitCode(report.errorCode()), 4);
}

TEST(PackageVerifierTest, TamperedManifestIsReported) {
    TempDirGuard dir("rcp_verify");
    writeSample(dir.path());
    {
        std::ofstream out(dir.path() / "manifest.json", std::ios::app);
        out << " ";
    }

    const VerificationReport report = verifyPackage(dir.path());
    ASSERT_EQ(report.mismatches.size(), 1U);
    EXPECT_EQ(report.mismatches[0].file, "manifest.json");
    EXPECT_TRUE(report.hasChecksumFailures());
}

TEST(PackageVerifierTest, MissingArtifactIsReported) {
    TempDirGuard dir("rcp_verify");
    writeSample(dir.path());
    std::filesystem::remove(dir.path() / "channels" / "gyro.pbz");

    const VerificationReport report = verifyPackage(dir.path());
    EXPECT_FALSE(report.passed);
    ASSERT_EQ(report.missing.size(), 1U);
    EXPECT_EQ(report.missing[0], "channels/gyro.pbz");
    ASSERT_EQ(report.mismatches.size(), 1U);
    EXPECT_TRUE(report.mismatches[0].actual.empty());
    EXPECT_EQ(report.errorCode(), ErrorCode::kChecksumError);
}

TEST(PackageVerifierTest, MissingChecksumFileIsReported) {
    TempDirGuard dir("rcp_verify");
    writeSample(dir.path());
    std::filesystem::remove(dir.path() / "checksums.txt");

    const VerificationReport report = verifyPackage(dir.path());
    ASSERT_EQ(report.missing.size(), 1U);
    EXPECT_EQ(report.missing[0], "checksums.txt");
    EXPECT_EQ(report.errorCode(), ErrorCode::kChecksumError);
}

TEST(PackageVerifierTest, UnsafeChecksumPathIsAnIssue) {
    TempDirGuard dir("rcp_verify");
    writeSample(dir.path());
    {
        std::ofstream out(dir.path() / "checksums.txt", std::ios::app);
        out << std::string(64, '0') << "  ../outside.txt\n";
    }

    const VerificationReport report = verifyPackage(dir.path());
    EXPECT_FALSE(report.passed);
    EXPECT_TRUE(report.mismatches.empty());
    ASSERT_EQ(report.issues.size(), 1U);
    EXPECT_NE(report.issues[0].find("../outside.txt"), std::string::npos);
    EXPECT_EQ(toExitCode(report.errorCode()), 3);
}

TEST(PackageVerifierTest, UnreadableArtifactIsNotCountedAsHashed) {
    TempDirGuard dir("rcp_verify");
    writeSample(dir.path());
    const std::filesystem::path locked = dir.path() / "channels" / "touch.pbz";
    std::filesystem::permissions(locked, std::filesystem::perms::none);
    if (std::ifstream(locked).is_open()) {
        std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
        GTEST_SKIP() << "file permissions are not enforced for this user";
    }

    VerifierOptions options;
    options.checkIndexCounts = false;
    options.checkTimestamps = false;
    options.checkFiniteValues = false;
    const VerificationReport report = PackageVerifier(options).verify(dir.path());
    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

    EXPECT_FALSE(report.passed);
    EXPECT_EQ(report.filesChecked, kChecksummedArtifacts.size() - 1);
    EXPECT_FALSE(report.issues.empty());
}

TEST(PackageVerifierTest, UnorderedTimestampsAreAnIssue) {
    TempDirGuard dir("rcp_verify");
    TouchChannel touch = sampleTouch();
    touch.t = {0, 100'000, 50'000};
    (void)writePackage(dir.path(), sampleManifest(), touch, sampleAcc(), sampleGyro());

    const VerificationReport report = verifyPackage(dir.path());
    EXPECT_FALSE(report.passed);
    EXPECT_FALSE(report.hasChecksumFailures());
    ASSERT_EQ(report.issues.size(), 1U);
    EXPECT_NE(report.issues[0].find("channels/touch.pbz"), std::string::npos);
    EXPECT_EQ(report.errorCode(), ErrorCode::kFormatError);

    VerifierOptions relaxed;
    relaxed.checkTimestamps = false;
    EXPECT_TRUE(PackageVerifier(relaxed).verify(dir.path()).passed);
}

TEST(PackageVerifierTest, NonFiniteValuesAreAnIssue) {
    TempDirGuard dir("rcp_verify");
    AccChannel acc = sampleAcc();
    acc.x[1] = std::numeric_limits<float>::quiet_NaN();
    (void)writePackage(dir.path(), sampleManifest(), sampleTouch(), acc, sampleGyro());

    const VerificationReport report = verifyPackage(dir.path());
    ASSERT_EQ(report.issues.size(), 1U);
    EXPECT_EQ(report.issues[0], "channels/acc.pbz: non-finite x value at sample 1");
}

}  // namespace rcp::format::test
