// =============================================================================
// rcp-packager - Stage Side-Channel Loaders Implementation
// =============================================================================

#include "rcp/io/stage_loader.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <type_traits>

#include <fmt/format.h>

#include "rcp/io/file_io.h"

namespace rcp::io {

using nlohmann::json;

namespace {

// 2^64 and 2^63 as doubles; casts are defined only strictly below these
constexpr double kTimestampBound = 18446744073709551616.0;
constexpr double kInt64Bound = 9223372036854775808.0;

json readDocument(const std::filesystem::path& file) {
    const std::string text = readFileText(file);
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw FormatError(fmt::format("{}: invalid JSON: {}", file.string(), ex.what()),
                          ErrorContext(file.string()));
    }
    if (!doc.is_object()) {
        throw FormatError(fmt::format("{}: top level must be a JSON object", file.string()),
                          ErrorContext(file.string()));
    }
    return doc;
}

[[noreturn]] void throwBadKey(const std::filesystem::path& file, std::string_view key,
                              std::string_view expected) {
    throw FormatError(fmt::format("{}: '{}' must be {}", file.string(), key, expected),
                      ErrorContext(file.string()));
}

/// @brief Fetch an optional array; absent or null reads as empty.
const json* optionalArray(const json& doc, const char* key, const std::filesystem::path& file) {
    const auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_array()) {
        throwBadKey(file, key, "an array");
    }
    return &*it;
}

json metadataOf(const json& doc, const std::filesystem::path& file) {
    const auto it = doc.find("metadata");
    if (it == doc.end() || it->is_null()) {
        return json::object();
    }
    if (!it->is_object()) {
        throwBadKey(file, "metadata", "an object");
    }
    return *it;
}

std::vector<double> numberColumn(const json& doc, const char* key,
                                 const std::filesystem::path& file) {
    std::vector<double> column;
    const json* array = optionalArray(doc, key, file);
    if (array == nullptr) {
        return column;
    }
    column.reserve(array->size());
    for (const auto& value : *array) {
        if (!value.is_number()) {
            throwBadKey(file, key, "an array of numbers");
        }
        column.push_back(value.get<double>());
    }
    return column;
}

std::vector<TimestampUs> timestampColumn(const json& doc, const char* key,
                                         const std::filesystem::path& file) {
    std::vector<TimestampUs> column;
    const json* array = optionalArray(doc, key, file);
    if (array == nullptr) {
        return column;
    }
    column.reserve(array->size());
    for (const auto& value : *array) {
        if (value.is_number_unsigned()) {
            column.push_back(value.get<TimestampUs>());
        } else if (value.is_number_integer()) {
            const auto signedValue = value.get<std::int64_t>();
            if (signedValue < 0) {
                throwBadKey(file, key, "an array of non-negative timestamps");
            }
            column.push_back(static_cast<TimestampUs>(signedValue));
        } else if (value.is_number_float()) {
            // Fractional microseconds are truncated
            const double d = value.get<double>();
            if (!std::isfinite(d) || d < 0.0 || d >= kTimestampBound) {
                throwBadKey(file, key, "an array of non-negative timestamps below 2^64");
            }
            column.push_back(static_cast<TimestampUs>(d));
        } else {
            throwBadKey(file, key, "an array of integer timestamps");
        }
    }
    return column;
}

/// @brief Read one pair element, rejecting values the target type cannot hold.
template <typename T>
T pairElement(const json& value, const char* key, const std::filesystem::path& file) {
    if constexpr (std::is_integral_v<T>) {
        if (value.is_number_unsigned()) {
            if (value.get<std::uint64_t>() >
                static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                throwBadKey(file, key, "an array of [a, b] pairs within 64-bit range");
            }
        } else if (value.is_number_float()) {
            const double d = value.get<double>();
            if (!std::isfinite(d) || d < -kInt64Bound || d >= kInt64Bound) {
                throwBadKey(file, key, "an array of [a, b] pairs within 64-bit range");
            }
            return static_cast<T>(d);
        }
    }
    return value.get<T>();
}

template <typename T>
std::vector<std::array<T, 2>> pairColumn(const json& doc, const char* key,
                                         const std::filesystem::path& file) {
    std::vector<std::array<T, 2>> column;
    const json* array = optionalArray(doc, key, file);
    if (array == nullptr) {
        return column;
    }
    column.reserve(array->size());
    for (const auto& pair : *array) {
        if (!pair.is_array() || pair.size() != 2 || !pair[0].is_number() ||
            !pair[1].is_number()) {
            throwBadKey(file, key, "an array of [a, b] number pairs");
        }
        column.push_back({pairElement<T>(pair[0], key, file), pairElement<T>(pair[1], key, file)});
    }
    return column;
}

AxisColumns loadAxisColumns(const json& doc, const char* name,
                            const std::filesystem::path& file) {
    AxisColumns columns;
    const auto it = doc.find(name);
    if (it == doc.end() || it->is_null()) {
        return columns;
    }
    if (!it->is_object()) {
        throwBadKey(file, name, "an object with t/x/y/z arrays");
    }

    columns.t = timestampColumn(*it, "t", file);
    columns.x = numberColumn(*it, "x", file);
    columns.y = numberColumn(*it, "y", file);
    columns.z = numberColumn(*it, "z", file);

    const std::size_t n = columns.t.size();
    if (n != 0 && (columns.x.size() != n || columns.y.size() != n || columns.z.size() != n)) {
        throw ColumnLengthMismatchError(
            fmt::format("{}: {} columns must align t/x/y/z lengths (t={}, x={}, y={}, z={})",
                        file.string(), name, n, columns.x.size(), columns.y.size(),
                        columns.z.size()),
            ErrorContext(file.string()));
    }

    repairTimestamps(columns.t, columns.x, columns.y, columns.z);
    return columns;
}

}  // namespace

// =============================================================================
// Timestamp Repair
// =============================================================================

std::vector<std::size_t> monotonicOrder(const std::vector<TimestampUs>& t) {
    bool ordered = true;
    for (std::size_t i = 1; i < t.size(); ++i) {
        if (t[i] <= t[i - 1]) {
            ordered = false;
            break;
        }
    }
    if (ordered) {
        return {};
    }

    std::vector<std::size_t> order(t.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&t](std::size_t a, std::size_t b) { return t[a] < t[b]; });
    return order;
}

void bumpDuplicateTimestamps(std::vector<TimestampUs>& t) {
    for (std::size_t i = 1; i < t.size(); ++i) {
        if (t[i] <= t[i - 1]) {
            if (t[i - 1] == std::numeric_limits<TimestampUs>::max()) {
                throw FormatError(
                    fmt::format("timestamp {} at sample {} cannot be bumped past the maximum",
                                t[i], i));
            }
            t[i] = t[i - 1] + 1;
        }
    }
}

// =============================================================================
// Loaders
// =============================================================================

ExtractionStage loadExtraction(const std::filesystem::path& file) {
    const json doc = readDocument(file);

    ExtractionStage stage;
    stage.metadata = metadataOf(doc, file);
    if (!stage.metadata.contains("source")) {
        stage.metadata["source"] = file.parent_path().string();
    }
    stage.skeletonPoints = pairColumn<std::int64_t>(doc, "skeleton_points", file);
    return stage;
}

KinematicsStage loadKinematics(const std::filesystem::path& file) {
    const json doc = readDocument(file);

    KinematicsStage stage;
    stage.metadata = metadataOf(doc, file);
    stage.points = pairColumn<double>(doc, "points", file);
    stage.velocity = numberColumn(doc, "velocity", file);
    stage.curvature = numberColumn(doc, "curvature", file);
    stage.pressure = numberColumn(doc, "pressure", file);
    stage.size = numberColumn(doc, "size", file);
    stage.timestampsUs = timestampColumn(doc, "timestamps_us", file);

    // Per-point columns of another length are left in their stored order
    repairTimestamps(stage.timestampsUs, stage.points, stage.velocity, stage.curvature,
                     stage.pressure, stage.size);
    return stage;
}

SimulationStage loadSimulation(const std::filesystem::path& file) {
    const json doc = readDocument(file);

    SimulationStage stage;
    stage.metadata = metadataOf(doc, file);
    stage.accelerometer = loadAxisColumns(doc, "accelerometer", file);
    stage.gyroscope = loadAxisColumns(doc, "gyroscope", file);
    return stage;
}

Attributes flattenMetadata(const json& metadata) {
    Attributes attributes;
    if (!metadata.is_object()) {
        return attributes;
    }
    for (const auto& [key, value] : metadata.items()) {
        attributes[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return attributes;
}

// =============================================================================
// StageLoader
// =============================================================================

StageLoader::StageLoader(std::filesystem::path extractionDir, std::filesystem::path simulationDir)
    : extractionDir_(std::move(extractionDir)), simulationDir_(std::move(simulationDir)) {}

std::filesystem::path StageLoader::extractionFile() const {
    return extractionDir_ / kExtractionFile;
}

std::filesystem::path StageLoader::kinematicsFile() const {
    return extractionDir_ / kKinematicsFile;
}

std::filesystem::path StageLoader::simulationFile() const {
    return simulationDir_ / kSimulationFile;
}

ExtractionStage StageLoader::loadExtraction() const {
    return io::loadExtraction(extractionFile());
}

KinematicsStage StageLoader::loadKinematics() const {
    return io::loadKinematics(kinematicsFile());
}

SimulationStage StageLoader::loadSimulation() const {
    return io::loadSimulation(simulationFile());
}

}  // namespace rcp::io
