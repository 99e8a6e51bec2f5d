// =============================================================================
// rcp-packager - Stage Loader Tests
// =============================================================================
// Tests for loading extraction/kinematics/simulation side-channel files and
// for the timestamp repair applied while loading them.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <limits>
#include <vector>

#include "rcp/io/stage_loader.h"
#include "test_support.h"

namespace rcp::io::test {

using rcp::test::TempDirGuard;
using rcp::test::writeText;

// =============================================================================
// Timestamp Repair
// =============================================================================

TEST(TimestampRepairTest, OrderedInputIsUntouched) {
    std::vector<TimestampUs> t = {1, 2, 3};
    std::vector<double> x = {10.0, 20.0, 30.0};
    repairTimestamps(t, x);
    EXPECT_EQ(t, (std::vector<TimestampUs>{1, 2, 3}));
    EXPECT_EQ(x, (std::vector<double>{10.0, 20.0, 30.0}));
    EXPECT_TRUE(monotonicOrder(t).empty());
}

TEST(TimestampRepairTest, SortsAndBumpsDuplicates) {
    std::vector<TimestampUs> t = {30, 10, 10};
    std::vector<double> x = {3.0, 1.0, 2.0};
    repairTimestamps(t, x);
    EXPECT_EQ(t, (std::vector<TimestampUs>{10, 11, 30}));
    EXPECT_EQ(x, (std::vector<double>{1.0, 2.0, 3.0}));
}

TEST(TimestampRepairTest, ColumnsOfOtherLengthKeepTheirOrder) {
    std::vector<TimestampUs> t = {2, 1};
    std::vector<double> aligned = {20.0, 10.0};
    std::vector<double> shorter = {5.0};
    repairTimestamps(t, aligned, shorter);
    EXPECT_EQ(aligned, (std::vector<double>{10.0, 20.0}));
    EXPECT_EQ(shorter, (std::vector<double>{5.0}));
}

TEST(TimestampRepairTest, BumpPastMaximumThrows) {
    constexpr TimestampUs kMax = std::numeric_limits<TimestampUs>::max();
    std::vector<TimestampUs> t = {kMax, kMax};
    EXPECT_THROW(bumpDuplicateTimestamps(t), FormatError);

    std::vector<TimestampUs> fits = {kMax - 1, kMax - 1};
    bumpDuplicateTimestamps(fits);
    EXPECT_EQ(fits, (std::vector<TimestampUs>{kMax - 1, kMax}));
}

RC_GTEST_PROP(TimestampRepairProperty, ResultIsStrictlyIncreasing,
              (std::vector<std::uint32_t> raw)) {
    std::vector<TimestampUs> t(raw.begin(), raw.end());
    std::vector<std::size_t> tags(t.size());
    for (std::size_t i = 0; i < tags.size(); ++i) {
        tags[i] = i;
    }

    repairTimestamps(t, tags);

    RC_ASSERT(t.size() == raw.size());
    for (std::size_t i = 1; i < t.size(); ++i) {
        RC_ASSERT(t[i] > t[i - 1]);
    }
    // Companion column is a permutation of the input positions
    std::vector<std::size_t> sorted = tags;
    std::sort(sorted.begin(), sorted.end());
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        RC_ASSERT(sorted[i] == i);
    }
}

// =============================================================================
// Loaders
// =============================================================================

TEST(StageLoaderTest, LoadsExtractionAndDefaultsSource) {
    TempDirGuard dir("rcp_stage");
    writeText(dir.path() / "extraction.json",
              R"({"metadata": {"style": "calm"}, "skeleton_points": [[1, 2], [3, 4]]})");

    const ExtractionStage stage = loadExtraction(dir.path() / "extraction.json");
    EXPECT_EQ(stage.metadata.at("style"), "calm");
    EXPECT_EQ(stage.metadata.at("source"), dir.path().string());
    ASSERT_EQ(stage.skeletonPoints.size(), 2U);
    EXPECT_EQ(stage.skeletonPoints[1][0], 3);
}

TEST(StageLoaderTest, KinematicsTimestampsAreRepaired) {
    TempDirGuard dir("rcp_stage");
    writeText(dir.path() / "kinematics.json", R"({
        "points": [[3.0, 3.5], [1.0, 1.5], [2.0, 2.5]],
        "velocity": [30.0, 10.0, 20.0],
        "timestamps_us": [30, 10, 10]
    })");

    const KinematicsStage stage = loadKinematics(dir.path() / "kinematics.json");
    EXPECT_EQ(stage.timestampsUs, (std::vector<TimestampUs>{10, 11, 30}));
    ASSERT_EQ(stage.points.size(), 3U);
    EXPECT_DOUBLE_EQ(stage.points[0][0], 1.0);
    EXPECT_DOUBLE_EQ(stage.points[1][0], 2.0);
    EXPECT_DOUBLE_EQ(stage.points[2][0], 3.0);
    EXPECT_EQ(stage.velocity, (std::vector<double>{10.0, 20.0, 30.0}));
    EXPECT_TRUE(stage.metadata.is_object());
}

TEST(StageLoaderTest, SimulationAxesAreRepaired) {
    TempDirGuard dir("rcp_stage");
    writeText(dir.path() / "simulation.json", R"({
        "metadata": {"device": "tablet"},
        "accelerometer": {"t": [30, 10, 10], "x": [3, 1, 2], "y": [0, 0, 0], "z": [9, 8, 7]},
        "gyroscope": {"t": [5, 2, 4], "x": [0.5, 0.2, 0.4], "y": [0, 0, 0], "z": [1, 2, 3]}
    })");

    const SimulationStage stage = loadSimulation(dir.path() / "simulation.json");
    EXPECT_EQ(stage.metadata.at("device"), "tablet");
    EXPECT_EQ(stage.accelerometer.t, (std::vector<TimestampUs>{10, 11, 30}));
    EXPECT_EQ(stage.accelerometer.x, (std::vector<double>{1, 2, 3}));
    EXPECT_EQ(stage.accelerometer.z, (std::vector<double>{8, 7, 9}));
    EXPECT_EQ(stage.gyroscope.t, (std::vector<TimestampUs>{2, 4, 5}));
    EXPECT_EQ(stage.gyroscope.x, (std::vector<double>{0.2, 0.4, 0.5}));
    EXPECT_EQ(stage.gyroscope.z, (std::vector<double>{2, 3, 1}));
}

TEST(StageLoaderTest, SimulationLengthMismatchThrows) {
    TempDirGuard dir("rcp_stage");
    writeText(dir.path() / "simulation.json",
              R"({"accelerometer": {"t": [1, 2], "x": [1], "y": [1, 2], "z": [1, 2]}})");

    EXPECT_THROW((void)loadSimulation(dir.path() / "simulation.json"), ColumnLengthMismatchError);
}

TEST(StageLoaderTest, MissingSectionsLoadEmpty) {
    TempDirGuard dir("rcp_stage");
    writeText(dir.path() / "simulation.json", "{}");

    const SimulationStage stage = loadSimulation(dir.path() / "simulation.json");
    EXPECT_TRUE(stage.accelerometer.t.empty());
    EXPECT_TRUE(stage.gyroscope.t.empty());
}

TEST(StageLoaderTest, MalformedDocumentsAreFormatErrors) {
    TempDirGuard dir("rcp_stage");
    writeText(dir.path() / "bad.json", "{not json");
    writeText(dir.path() / "array.json", "[1, 2]");
    writeText(dir.path() / "negative.json", R"({"timestamps_us": [-1]})");
    writeText(dir.path() / "points.json", R"({"points": [[1.0]]})");

    EXPECT_THROW((void)loadKinematics(dir.path() / "bad.json"), FormatError);
    EXPECT_THROW((void)loadKinematics(dir.path() / "array.json"), FormatError);
    EXPECT_THROW((void)loadKinematics(dir.path() / "negative.json"), FormatError);
    EXPECT_THROW((void)loadKinematics(dir.path() / "points.json"), FormatError);
    EXPECT_THROW((void)loadKinematics(dir.path() / "absent.json"), IOError);
}

TEST(StageLoaderTest, LargeFloatTimestampsAboveSignedRangeLoad) {
    TempDirGuard dir("rcp_stage");
    writeText(dir.path() / "simulation.json", R"({
        "accelerometer": {"t": [5, 7, 1.0e19], "x": [0, 0, 0], "y": [0, 0, 0], "z": [0, 0, 0]}
    })");

    const SimulationStage stage = loadSimulation(dir.path() / "simulation.json");
    ASSERT_EQ(stage.accelerometer.t.size(), 3U);
    EXPECT_EQ(stage.accelerometer.t[0], 5U);
    EXPECT_EQ(stage.accelerometer.t[2], 10'000'000'000'000'000'000ULL);
}

TEST(StageLoaderTest, FloatTimestampsOutsideUnsignedRangeAreFormatErrors) {
    TempDirGuard dir("rcp_stage");
    writeText(dir.path() / "huge.json", R"({"timestamps_us": [1, 2.0e19]})");
    writeText(dir.path() / "negative.json", R"({"timestamps_us": [-0.5e3]})");

    EXPECT_THROW((void)loadKinematics(dir.path() / "huge.json"), FormatError);
    EXPECT_THROW((void)loadKinematics(dir.path() / "negative.json"), FormatError);
}

TEST(StageLoaderTest, SkeletonPointsOutsideSignedRangeAreFormatErrors) {
    TempDirGuard dir("rcp_stage");
    writeText(dir.path() / "float.json", R"({"skeleton_points": [[1.0e19, 2]]})");
    writeText(dir.path() / "unsigned.json", R"({"skeleton_points": [[1, 18446744073709551615]]})");
    writeText(dir.path() / "fractional.json", R"({"skeleton_points": [[3.7, -2.5]]})");

    EXPECT_THROW((void)loadExtraction(dir.path() / "float.json"), FormatError);
    EXPECT_THROW((void)loadExtraction(dir.path() / "unsigned.json"), FormatError);
    const ExtractionStage stage = loadExtraction(dir.path() / "fractional.json");
    ASSERT_EQ(stage.skeletonPoints.size(), 1U);
    EXPECT_EQ(stage.skeletonPoints[0][0], 3);
    EXPECT_EQ(stage.skeletonPoints[0][1], -2);
}

TEST(StageLoaderTest, FlattenMetadataStringifiesNonStrings) {
    const auto metadata = nlohmann::json::parse(
        R"({"style": "calm", "dpi": 300, "tags": ["a", "b"], "nested": {"k": true}})");
    const Attributes attributes = flattenMetadata(metadata);
    EXPECT_EQ(attributes.at("style"), "calm");
    EXPECT_EQ(attributes.at("dpi"), "300");
    EXPECT_EQ(attributes.at("tags"), R"(["a","b"])");
    EXPECT_EQ(attributes.at("nested"), R"({"k":true})");
}

TEST(StageLoaderTest, LoaderResolvesFileNames) {
    const StageLoader loader("/data/extract", "/data/sim");
    EXPECT_EQ(loader.extractionFile(), std::filesystem::path("/data/extract/extraction.json"));
    EXPECT_EQ(loader.kinematicsFile(), std::filesystem::path("/data/extract/kinematics.json"));
    EXPECT_EQ(loader.simulationFile(), std::filesystem::path("/data/sim/simulation.json"));
}

}  // namespace rcp::io::test
