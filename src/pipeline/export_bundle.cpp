// =============================================================================
// rcp-packager - Export Bundle Implementation
// =============================================================================

#include "rcp/pipeline/export_bundle.h"

#include <array>
#include <chrono>
#include <ctime>
#include <random>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace rcp::pipeline {

using nlohmann::json;

namespace {

std::string stringOr(const json& metadata, const char* key, std::string_view fallback) {
    const auto it = metadata.find(key);
    if (it != metadata.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::string(fallback);
}

template <ChannelKind Kind>
format::ChannelType<Kind> copyAxisColumns(const io::AxisColumns& columns) {
    format::ChannelType<Kind> channel;
    channel.t = columns.t;
    channel.x.assign(columns.x.begin(), columns.x.end());
    channel.y.assign(columns.y.begin(), columns.y.end());
    channel.z.assign(columns.z.begin(), columns.z.end());
    return channel;
}

}  // namespace

json ExportBundle::mergedMetadata() const {
    json merged = json::object();
    for (const json* stage : {&extraction.metadata, &kinematics.metadata, &simulation.metadata}) {
        if (stage->is_object()) {
            merged.update(*stage);
        }
    }
    return merged;
}

ExportBundle loadBundle(const io::StageLoader& loader) {
    ExportBundle bundle;
    bundle.extraction = loader.loadExtraction();
    bundle.kinematics = loader.loadKinematics();
    bundle.simulation = loader.loadSimulation();
    return bundle;
}

// =============================================================================
// Manifest
// =============================================================================

format::Manifest bundleToManifest(const ExportBundle& bundle, std::string_view version) {
    const json metadata = bundle.mergedMetadata();

    format::Manifest manifest;
    manifest.version = std::string(version);
    manifest.packageId = generateUuidV4();
    manifest.source = stringOr(metadata, "source", "");
    manifest.deviceProfile = stringOr(metadata, "device", kDefaultDeviceProfile);

    const auto dpi = metadata.find("dpi");
    if (dpi != metadata.end() && dpi->is_number()) {
        manifest.dpi = dpi->get<double>();
    }

    manifest.createdAt = stringOr(metadata, "created_at", "");
    if (manifest.createdAt.empty()) {
        manifest.createdAt = currentUtcTimestamp();
    }

    for (auto& [key, value] : io::flattenMetadata(metadata)) {
        if (!key.empty()) {
            manifest.attributes.emplace(key, std::move(value));
        }
    }
    return manifest;
}

// =============================================================================
// Channels
// =============================================================================

format::TouchChannel bundleToTouchChannel(const ExportBundle& bundle) {
    const io::KinematicsStage& kine = bundle.kinematics;
    const std::size_t count = kine.points.size();

    format::TouchChannel touch;
    touch.t.reserve(count);
    touch.x.reserve(count);
    touch.y.reserve(count);

    const bool hasTimestamps = kine.timestampsUs.size() == count;
    for (std::size_t i = 0; i < count; ++i) {
        touch.t.push_back(hasTimestamps ? kine.timestampsUs[i]
                                        : static_cast<TimestampUs>(i) * kDefaultTouchIntervalUs);
        touch.x.push_back(static_cast<float>(kine.points[i][0]));
        touch.y.push_back(static_cast<float>(kine.points[i][1]));
    }

    if (kine.pressure.size() == count) {
        touch.pressure.assign(kine.pressure.begin(), kine.pressure.end());
    } else {
        touch.pressure.assign(count, kDefaultTouchPressure);
    }
    if (kine.size.size() == count) {
        touch.size.assign(kine.size.begin(), kine.size.end());
    } else {
        touch.size.assign(count, kDefaultTouchSize);
    }
    return touch;
}

format::AccChannel bundleToAccChannel(const ExportBundle& bundle) {
    return copyAxisColumns<ChannelKind::kAccelerometer>(bundle.simulation.accelerometer);
}

format::GyroChannel bundleToGyroChannel(const ExportBundle& bundle) {
    return copyAxisColumns<ChannelKind::kGyroscope>(bundle.simulation.gyroscope);
}

// =============================================================================
// Identifiers and Timestamps
// =============================================================================

std::string generateUuidV4() {
    std::random_device device;
    std::mt19937_64 engine((static_cast<std::uint64_t>(device()) << 32) | device());
    std::uniform_int_distribution<std::uint32_t> byteDist(0, 0xFF);

    std::array<std::uint8_t, 16> bytes{};
    for (auto& byte : bytes) {
        byte = static_cast<std::uint8_t>(byteDist(engine));
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    return fmt::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
                       "{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
                       bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6],
                       bytes[7], bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13],
                       bytes[14], bytes[15]);
}

std::string currentUtcTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", utc);
}

}  // namespace rcp::pipeline
