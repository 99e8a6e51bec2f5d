// =============================================================================
// rcp-packager - Export Bundle Tests
// =============================================================================

#include <gtest/gtest.h>

#include <regex>
#include <string>

#include "rcp/pipeline/export_bundle.h"
#include "test_support.h"

namespace rcp::pipeline::test {

using nlohmann::json;

namespace {

ExportBundle makeBundle() {
    ExportBundle bundle;
    bundle.extraction.metadata = {{"source", "scan.png"}, {"style", "calm"}};
    bundle.kinematics.metadata = {{"dpi", 300}};
    bundle.kinematics.points = {{0.0, 0.0}, {1.0, 0.5}, {2.0, 1.0}};
    bundle.kinematics.timestampsUs = {0, 50'000, 100'000};
    bundle.simulation.metadata = {{"device", "tablet"}, {"style", "aggressive"}};
    bundle.simulation.accelerometer = {{0, 1}, {0.5, 0.25}, {0.0, 0.0}, {9.8, 9.8}};
    bundle.simulation.gyroscope = {{0}, {0.1}, {0.2}, {0.3}};
    return bundle;
}

}  // namespace

TEST(ExportBundleTest, LaterStagesOverrideMetadata) {
    const json merged = makeBundle().mergedMetadata();
    EXPECT_EQ(merged.at("style"), "aggressive");
    EXPECT_EQ(merged.at("source"), "scan.png");
    EXPECT_EQ(merged.at("dpi"), 300);
}

TEST(ExportBundleTest, ManifestFromMetadata) {
    ExportBundle bundle = makeBundle();
    bundle.simulation.metadata["created_at"] = "2025-03-01T12:00:00Z";

    const format::Manifest manifest = bundleToManifest(bundle, "rcp_2025");
    EXPECT_EQ(manifest.version, "rcp_2025");
    EXPECT_EQ(manifest.source, "scan.png");
    EXPECT_EQ(manifest.deviceProfile, "tablet");
    EXPECT_DOUBLE_EQ(manifest.dpi, 300.0);
    EXPECT_EQ(manifest.createdAt, "2025-03-01T12:00:00Z");
    EXPECT_EQ(manifest.attributes.at("style"), "aggressive");
    EXPECT_EQ(manifest.attributes.at("dpi"), "300");
    EXPECT_FALSE(manifest.packageId.empty());
}

TEST(ExportBundleTest, ManifestDefaults) {
    const format::Manifest manifest = bundleToManifest(ExportBundle{}, "custom");
    EXPECT_EQ(manifest.version, "custom");
    EXPECT_EQ(manifest.deviceProfile, kDefaultDeviceProfile);
    EXPECT_DOUBLE_EQ(manifest.dpi, 0.0);
    EXPECT_TRUE(manifest.source.empty());
    EXPECT_TRUE(std::regex_match(manifest.createdAt,
                                 std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)")));
}

TEST(ExportBundleTest, TouchChannelUsesKinematics) {
    ExportBundle bundle = makeBundle();
    bundle.kinematics.pressure = {0.2, 0.4, 0.6};

    const format::TouchChannel touch = bundleToTouchChannel(bundle);
    EXPECT_EQ(touch.t, bundle.kinematics.timestampsUs);
    EXPECT_EQ(touch.sampleCount(), bundle.kinematics.points.size());
    EXPECT_FLOAT_EQ(touch.x[2], 2.0F);
    EXPECT_FLOAT_EQ(touch.y[1], 0.5F);
    EXPECT_FLOAT_EQ(touch.pressure[1], 0.4F);
    EXPECT_EQ(touch.size, (std::vector<float>(3, kDefaultTouchSize)));
    EXPECT_NO_THROW(touch.validateColumns());
}

TEST(ExportBundleTest, TouchChannelSynthesizesTimestamps) {
    ExportBundle bundle = makeBundle();
    bundle.kinematics.timestampsUs.clear();

    const format::TouchChannel touch = bundleToTouchChannel(bundle);
    EXPECT_EQ(touch.t, (std::vector<TimestampUs>{0, kDefaultTouchIntervalUs,
                                                  2 * kDefaultTouchIntervalUs}));
    EXPECT_EQ(touch.pressure, (std::vector<float>(3, kDefaultTouchPressure)));
}

TEST(ExportBundleTest, InertialChannelsCopyColumns) {
    const ExportBundle bundle = makeBundle();

    const format::AccChannel acc = bundleToAccChannel(bundle);
    EXPECT_EQ(acc.t, (std::vector<TimestampUs>{0, 1}));
    EXPECT_FLOAT_EQ(acc.x[0], 0.5F);
    EXPECT_FLOAT_EQ(acc.z[1], 9.8F);

    const format::GyroChannel gyro = bundleToGyroChannel(bundle);
    EXPECT_EQ(gyro.sampleCount(), 1U);
    EXPECT_FLOAT_EQ(gyro.z[0], 0.3F);
}

TEST(ExportBundleTest, UuidV4Shape) {
    const std::regex shape("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
    const std::string first = generateUuidV4();
    EXPECT_TRUE(std::regex_match(first, shape)) << first;
    EXPECT_NE(first, generateUuidV4());
}

TEST(ExportBundleTest, LoadBundleFromStageFiles) {
    rcp::test::TempDirGuard dir("rcp_bundle");
    rcp::test::writeText(dir.path() / "ext" / "extraction.json", R"({"skeleton_points": []})");
    rcp::test::writeText(dir.path() / "ext" / "kinematics.json",
                         R"({"points": [[1, 1]], "timestamps_us": [5]})");
    rcp::test::writeText(dir.path() / "sim" / "simulation.json", "{}");

    const ExportBundle bundle =
        loadBundle(io::StageLoader(dir.path() / "ext", dir.path() / "sim"));
    EXPECT_EQ(bundle.kinematics.points.size(), 1U);
    EXPECT_EQ(bundle.mergedMetadata().at("source"), (dir.path() / "ext").string());
}

}  // namespace rcp::pipeline::test
