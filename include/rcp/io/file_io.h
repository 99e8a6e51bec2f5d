// =============================================================================
// rcp-packager - Whole-File I/O
// =============================================================================
// Blocking whole-buffer reads and writes. Every failure raises IOError
// carrying the offending path.
// =============================================================================

#ifndef RCP_IO_FILE_IO_H
#define RCP_IO_FILE_IO_H

#include <filesystem>
#include <string>
#include <string_view>

#include "rcp/common/error.h"
#include "rcp/common/types.h"

namespace rcp::io {

/// @brief Read an entire file into memory.
/// @throws IOError if the file is missing or unreadable.
[[nodiscard]] Bytes readFileBytes(const std::filesystem::path& path);

/// @brief Read an entire file as text.
[[nodiscard]] std::string readFileText(const std::filesystem::path& path);

/// @brief Create or truncate a file and write the buffer.
void writeFileBytes(const std::filesystem::path& path, ByteSpan data);

void writeFileText(const std::filesystem::path& path, std::string_view text);

/// @brief Create a directory and its parents; no-op if it already exists.
void ensureDirectory(const std::filesystem::path& path);

}  // namespace rcp::io

#endif  // RCP_IO_FILE_IO_H
