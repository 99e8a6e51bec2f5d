// =============================================================================
// rcp-packager - JSON Views of Package Metadata
// =============================================================================
// manifest.json and index.json carry the Manifest and Index messages as
// JSON objects with snake_case keys:
//
//   manifest.json  {attributes, created_at, device_profile, dpi,
//                   package_id, source, version}
//   index.json     {acc_samples, checksums: [{path, sha256}], duration_seconds,
//                   gyro_samples, touch_samples}
//
// Documents are rendered with a 2-space indent, keys sorted, ASCII-escaped,
// without a trailing newline. Every field is written, defaults included.
// =============================================================================

#ifndef RCP_FORMAT_MESSAGE_JSON_H
#define RCP_FORMAT_MESSAGE_JSON_H

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "rcp/format/rcp_messages.h"

namespace rcp::format {

[[nodiscard]] nlohmann::json toJson(const Checksum& checksum);
[[nodiscard]] nlohmann::json toJson(const Manifest& manifest);
[[nodiscard]] nlohmann::json toJson(const Index& index);

/// @brief Build a Manifest from its JSON object.
/// @param origin Name reported in errors (usually the file path).
/// @throws FormatError if a key is missing or has the wrong type.
[[nodiscard]] Manifest manifestFromJson(const nlohmann::json& doc, std::string_view origin);

/// @brief Build an Index from its JSON object.
/// @throws FormatError if a key is missing or has the wrong type.
[[nodiscard]] Index indexFromJson(const nlohmann::json& doc, std::string_view origin);

/// @brief Render a document the way package metadata files are stored.
[[nodiscard]] std::string dumpJson(const nlohmann::json& doc);

/// @brief Parse JSON text.
/// @throws FormatError naming origin if the text is not valid JSON.
[[nodiscard]] nlohmann::json parseJson(std::string_view text, std::string_view origin);

}  // namespace rcp::format

#endif  // RCP_FORMAT_MESSAGE_JSON_H
