// =============================================================================
// rcp-packager - checksums.txt Codec
// =============================================================================
// One line per artifact: "<64 lowercase hex>  <relative path>\n".
// The format matches `sha256sum` text mode, so `sha256sum -c checksums.txt`
// run from the package root verifies a package.
// =============================================================================

#ifndef RCP_FORMAT_CHECKSUM_FILE_H
#define RCP_FORMAT_CHECKSUM_FILE_H

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "rcp/format/rcp_messages.h"

namespace rcp::format {

/// @brief Render entries as checksums.txt text (trailing newline included).
[[nodiscard]] std::string formatChecksumFile(const std::vector<Checksum>& entries);

/// @brief Parse checksums.txt text.
/// @param origin Name reported in errors.
/// @throws FormatError on a malformed line, naming its 1-based line number.
[[nodiscard]] std::vector<Checksum> parseChecksumFile(std::string_view text,
                                                      std::string_view origin);

/// @brief Read and parse a checksums.txt file.
/// @throws IOError if the file is missing.
[[nodiscard]] std::vector<Checksum> readChecksumFile(const std::filesystem::path& path);

}  // namespace rcp::format

#endif  // RCP_FORMAT_CHECKSUM_FILE_H
