// =============================================================================
// rcp-packager - Export Bundle
// =============================================================================
// Assembles the outputs of the extraction, kinematics and simulation stages
// into the Manifest and channel messages of an RCP package.
//
// Mapping:
// - Manifest: version = format label, package_id = random UUIDv4, source,
//   device_profile, dpi and created_at from the merged stage metadata,
//   attributes = merged metadata rendered as strings
// - TouchChannel: kinematics points; t from timestamps_us or 10 ms spacing;
//   pressure/size from kinematics when aligned, otherwise 1.0
// - AccChannel / GyroChannel: simulation columns copied as-is
// =============================================================================

#ifndef RCP_PIPELINE_EXPORT_BUNDLE_H
#define RCP_PIPELINE_EXPORT_BUNDLE_H

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "rcp/format/rcp_messages.h"
#include "rcp/io/stage_loader.h"

namespace rcp::pipeline {

/// @brief Device profile used when the metadata names none.
inline constexpr std::string_view kDefaultDeviceProfile = "generic";

/// @brief Touch sample spacing when kinematics carries no timestamps (10 ms).
inline constexpr TimestampUs kDefaultTouchIntervalUs = 10'000;

/// @brief Default touch pressure and contact size.
inline constexpr float kDefaultTouchPressure = 1.0F;
inline constexpr float kDefaultTouchSize = 1.0F;

/// @brief Outputs of all upstream stages.
struct ExportBundle {
    io::ExtractionStage extraction;
    io::KinematicsStage kinematics;
    io::SimulationStage simulation;

    /// @brief Metadata of all stages merged; later stages override earlier keys.
    [[nodiscard]] nlohmann::json mergedMetadata() const;
};

/// @brief Load every stage through a StageLoader.
[[nodiscard]] ExportBundle loadBundle(const io::StageLoader& loader);

[[nodiscard]] format::Manifest bundleToManifest(const ExportBundle& bundle,
                                                std::string_view version);

[[nodiscard]] format::TouchChannel bundleToTouchChannel(const ExportBundle& bundle);

[[nodiscard]] format::AccChannel bundleToAccChannel(const ExportBundle& bundle);

[[nodiscard]] format::GyroChannel bundleToGyroChannel(const ExportBundle& bundle);

/// @brief Random RFC 4122 version-4 UUID in canonical lowercase form.
[[nodiscard]] std::string generateUuidV4();

/// @brief Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string currentUtcTimestamp();

}  // namespace rcp::pipeline

#endif  // RCP_PIPELINE_EXPORT_BUNDLE_H
