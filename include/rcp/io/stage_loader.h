// =============================================================================
// rcp-packager - Stage Side-Channel Loaders
// =============================================================================
// Loads the JSON files persisted by the upstream pipeline stages:
//
//   extraction.json  {metadata, skeleton_points: [[row, col], ...]}
//   kinematics.json  {metadata, points: [[x, y], ...], velocity, curvature,
//                     pressure?, size?, timestamps_us?}
//   simulation.json  {metadata, accelerometer: {t, x, y, z},
//                     gyroscope: {t, x, y, z}}
//
// Timestamp columns are repaired on load: if any t[i] <= t[i-1] all columns
// are stably sorted by t, then every remaining t[i] <= t[i-1] is bumped to
// t[i-1] + 1. Missing keys load as empty columns.
// =============================================================================

#ifndef RCP_IO_STAGE_LOADER_H
#define RCP_IO_STAGE_LOADER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "rcp/common/error.h"
#include "rcp/common/types.h"

namespace rcp::io {

inline constexpr std::string_view kExtractionFile = "extraction.json";
inline constexpr std::string_view kKinematicsFile = "kinematics.json";
inline constexpr std::string_view kSimulationFile = "simulation.json";

/// @brief Flat string attributes derived from a stage's metadata object.
using Attributes = std::map<std::string, std::string>;

// =============================================================================
// Stage Data
// =============================================================================

struct ExtractionStage {
    /// @brief Metadata object as stored; always a JSON object.
    nlohmann::json metadata = nlohmann::json::object();
    std::vector<std::array<std::int64_t, 2>> skeletonPoints;
};

struct KinematicsStage {
    nlohmann::json metadata = nlohmann::json::object();
    std::vector<std::array<double, 2>> points;
    std::vector<double> velocity;
    std::vector<double> curvature;
    std::vector<double> pressure;
    std::vector<double> size;
    /// @brief Per-point timestamps; empty when the stage recorded none.
    std::vector<TimestampUs> timestampsUs;
};

/// @brief One simulated inertial channel.
struct AxisColumns {
    std::vector<TimestampUs> t;
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> z;
};

struct SimulationStage {
    nlohmann::json metadata = nlohmann::json::object();
    AxisColumns accelerometer;
    AxisColumns gyroscope;
};

// =============================================================================
// Timestamp Repair
// =============================================================================

/// @brief Stable sort order of t if t is not strictly increasing, else empty.
[[nodiscard]] std::vector<std::size_t> monotonicOrder(const std::vector<TimestampUs>& t);

/// @brief Reorder column so that column[i] = old[order[i]].
/// @note No-op for an empty order or a column of a different length.
template <typename T>
void applyOrder(std::vector<T>& column, const std::vector<std::size_t>& order) {
    if (order.empty() || column.size() != order.size()) {
        return;
    }
    std::vector<T> reordered;
    reordered.reserve(column.size());
    for (std::size_t source : order) {
        reordered.push_back(column[source]);
    }
    column = std::move(reordered);
}

/// @brief Bump every t[i] <= t[i-1] to t[i-1] + 1, in place.
/// @throws FormatError if a bump would pass the largest timestamp
void bumpDuplicateTimestamps(std::vector<TimestampUs>& t);

/// @brief Sort and bump t, carrying the given sibling columns along.
template <typename... Columns>
void repairTimestamps(std::vector<TimestampUs>& t, Columns&... columns) {
    const std::vector<std::size_t> order = monotonicOrder(t);
    if (!order.empty()) {
        applyOrder(t, order);
        (applyOrder(columns, order), ...);
    }
    bumpDuplicateTimestamps(t);
}

// =============================================================================
// Loaders
// =============================================================================

/// @brief Load extraction.json.
/// @note metadata.source defaults to the file's parent directory.
/// @throws IOError if missing; FormatError if malformed.
[[nodiscard]] ExtractionStage loadExtraction(const std::filesystem::path& file);

/// @brief Load kinematics.json, repairing timestamps_us when present.
[[nodiscard]] KinematicsStage loadKinematics(const std::filesystem::path& file);

/// @brief Load simulation.json.
/// @throws ColumnLengthMismatchError if a channel has non-empty t and
///         x/y/z of another length.
[[nodiscard]] SimulationStage loadSimulation(const std::filesystem::path& file);

/// @brief Render a metadata object as string attributes.
/// @note Strings are kept verbatim; other values become compact JSON text.
[[nodiscard]] Attributes flattenMetadata(const nlohmann::json& metadata);

/// @brief Loader bound to the extraction and simulation output directories.
class StageLoader {
public:
    StageLoader(std::filesystem::path extractionDir, std::filesystem::path simulationDir);

    [[nodiscard]] std::filesystem::path extractionFile() const;
    [[nodiscard]] std::filesystem::path kinematicsFile() const;
    [[nodiscard]] std::filesystem::path simulationFile() const;

    [[nodiscard]] ExtractionStage loadExtraction() const;
    [[nodiscard]] KinematicsStage loadKinematics() const;
    [[nodiscard]] SimulationStage loadSimulation() const;

private:
    std::filesystem::path extractionDir_;
    std::filesystem::path simulationDir_;
};

}  // namespace rcp::io

#endif  // RCP_IO_STAGE_LOADER_H
