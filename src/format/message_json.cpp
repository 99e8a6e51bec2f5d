// =============================================================================
// rcp-packager - JSON Views of Package Metadata Implementation
// =============================================================================

#include "rcp/format/message_json.h"

#include <fmt/format.h>

namespace rcp::format {

using nlohmann::json;

namespace {

constexpr int kJsonIndent = 2;

/// @brief Fetch a required key with the expected JSON type.
const json& requireKey(const json& doc, const char* key, json::value_t type,
                       std::string_view origin) {
    const auto it = doc.find(key);
    if (it == doc.end()) {
        throw FormatError(fmt::format("{}: missing key '{}'", origin, key),
                          ErrorContext(std::string(origin)));
    }
    const bool numberWanted = type == json::value_t::number_float;
    const bool unsignedWanted = type == json::value_t::number_unsigned;
    const bool ok = numberWanted     ? it->is_number()
                    : unsignedWanted ? it->is_number_unsigned()
                                     : it->type() == type;
    if (!ok) {
        throw FormatError(
            fmt::format("{}: key '{}' has type {}", origin, key, it->type_name()),
            ErrorContext(std::string(origin)));
    }
    return *it;
}

void requireObject(const json& doc, std::string_view what, std::string_view origin) {
    if (!doc.is_object()) {
        throw FormatError(fmt::format("{}: {} must be a JSON object", origin, what),
                          ErrorContext(std::string(origin)));
    }
}

Checksum checksumFromJson(const json& doc, std::string_view origin) {
    requireObject(doc, "checksum entry", origin);
    Checksum checksum;
    checksum.path = requireKey(doc, "path", json::value_t::string, origin).get<std::string>();
    checksum.sha256 =
        requireKey(doc, "sha256", json::value_t::string, origin).get<std::string>();
    return checksum;
}

}  // namespace

// =============================================================================
// Serialization
// =============================================================================

json toJson(const Checksum& checksum) {
    return json{{"path", checksum.path}, {"sha256", checksum.sha256}};
}

json toJson(const Manifest& manifest) {
    json attributes = json::object();
    for (const auto& [key, value] : manifest.attributes) {
        attributes[key] = value;
    }
    return json{
        {"version", manifest.version},
        {"package_id", manifest.packageId},
        {"source", manifest.source},
        {"device_profile", manifest.deviceProfile},
        {"dpi", manifest.dpi},
        {"created_at", manifest.createdAt},
        {"attributes", std::move(attributes)},
    };
}

json toJson(const Index& index) {
    json checksums = json::array();
    for (const auto& checksum : index.checksums) {
        checksums.push_back(toJson(checksum));
    }
    return json{
        {"touch_samples", index.touchSamples},
        {"acc_samples", index.accSamples},
        {"gyro_samples", index.gyroSamples},
        {"duration_seconds", index.durationSeconds},
        {"checksums", std::move(checksums)},
    };
}

// =============================================================================
// Deserialization
// =============================================================================

Manifest manifestFromJson(const json& doc, std::string_view origin) {
    requireObject(doc, "manifest", origin);

    Manifest manifest;
    manifest.version = requireKey(doc, "version", json::value_t::string, origin).get<std::string>();
    manifest.packageId =
        requireKey(doc, "package_id", json::value_t::string, origin).get<std::string>();
    manifest.source = requireKey(doc, "source", json::value_t::string, origin).get<std::string>();
    manifest.deviceProfile =
        requireKey(doc, "device_profile", json::value_t::string, origin).get<std::string>();
    manifest.dpi = requireKey(doc, "dpi", json::value_t::number_float, origin).get<double>();
    manifest.createdAt =
        requireKey(doc, "created_at", json::value_t::string, origin).get<std::string>();

    const json& attributes = requireKey(doc, "attributes", json::value_t::object, origin);
    for (const auto& [key, value] : attributes.items()) {
        if (!value.is_string()) {
            throw FormatError(fmt::format("{}: attribute '{}' must be a string", origin, key),
                              ErrorContext(std::string(origin)));
        }
        manifest.attributes[key] = value.get<std::string>();
    }
    return manifest;
}

Index indexFromJson(const json& doc, std::string_view origin) {
    requireObject(doc, "index", origin);

    Index index;
    index.touchSamples =
        requireKey(doc, "touch_samples", json::value_t::number_unsigned, origin).get<std::uint64_t>();
    index.accSamples =
        requireKey(doc, "acc_samples", json::value_t::number_unsigned, origin).get<std::uint64_t>();
    index.gyroSamples =
        requireKey(doc, "gyro_samples", json::value_t::number_unsigned, origin).get<std::uint64_t>();
    index.durationSeconds =
        requireKey(doc, "duration_seconds", json::value_t::number_float, origin).get<double>();

    const json& checksums = requireKey(doc, "checksums", json::value_t::array, origin);
    index.checksums.reserve(checksums.size());
    for (const auto& entry : checksums) {
        index.checksums.push_back(checksumFromJson(entry, origin));
    }
    return index;
}

// =============================================================================
// Text Rendering
// =============================================================================

std::string dumpJson(const json& doc) {
    return doc.dump(kJsonIndent, ' ', /*ensure_ascii=*/true);
}

json parseJson(std::string_view text, std::string_view origin) {
    try {
        return json::parse(text.begin(), text.end());
    } catch (const json::parse_error& ex) {
        throw FormatError(fmt::format("{}: invalid JSON: {}", origin, ex.what()),
                          ErrorContext(std::string(origin)));
    }
}

}  // namespace rcp::format
