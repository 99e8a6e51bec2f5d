// =============================================================================
// rcp-packager - checksums.txt Codec Implementation
// =============================================================================

#include "rcp/format/checksum_file.h"

#include <fmt/format.h>

#include "rcp/format/rcp_format.h"
#include "rcp/io/file_io.h"
#include "rcp/io/sha256.h"

namespace rcp::format {

std::string formatChecksumFile(const std::vector<Checksum>& entries) {
    std::string text;
    for (const auto& entry : entries) {
        text += fmt::format("{}{}{}\n", entry.sha256, kChecksumSeparator, entry.path);
    }
    return text;
}

std::vector<Checksum> parseChecksumFile(std::string_view text, std::string_view origin) {
    std::vector<Checksum> entries;
    std::size_t lineNumber = 0;
    std::size_t start = 0;

    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        start = end + 1;
        ++lineNumber;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            continue;
        }

        const std::size_t digestEnd = io::kSha256HexSize;
        const bool wellFormed = line.size() > digestEnd + kChecksumSeparator.size() &&
                                io::isSha256Hex(line.substr(0, digestEnd)) &&
                                line.substr(digestEnd, kChecksumSeparator.size()) ==
                                    kChecksumSeparator;
        if (!wellFormed) {
            throw FormatError(fmt::format("{}: malformed checksum line {}", origin, lineNumber),
                              ErrorContext(std::string(origin)));
        }

        Checksum entry;
        entry.sha256 = std::string(line.substr(0, digestEnd));
        entry.path = std::string(line.substr(digestEnd + kChecksumSeparator.size()));
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<Checksum> readChecksumFile(const std::filesystem::path& path) {
    return parseChecksumFile(io::readFileText(path), path.string());
}

}  // namespace rcp::format
