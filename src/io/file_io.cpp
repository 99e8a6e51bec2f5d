// =============================================================================
// rcp-packager - Whole-File I/O Implementation
// =============================================================================

#include "rcp/io/file_io.h"

#include <fstream>
#include <iterator>
#include <system_error>

namespace rcp::io {

namespace {

std::ifstream openForRead(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code ec;
        const bool exists = std::filesystem::exists(path, ec);
        throw IOError((exists ? "Failed to open file: " : "File not found: ") + path.string(),
                      ErrorContext(path.string()));
    }
    return in;
}

void writeRaw(const std::filesystem::path& path, const char* data, std::size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("Failed to open file for writing: " + path.string(),
                      ErrorContext(path.string()));
    }
    out.write(data, static_cast<std::streamsize>(size));
    out.flush();
    if (!out) {
        throw IOError("Failed to write file: " + path.string(), ErrorContext(path.string()));
    }
}

}  // namespace

Bytes readFileBytes(const std::filesystem::path& path) {
    std::ifstream in = openForRead(path);
    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw IOError("Failed to read file: " + path.string(), ErrorContext(path.string()));
    }
    return data;
}

std::string readFileText(const std::filesystem::path& path) {
    std::ifstream in = openForRead(path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw IOError("Failed to read file: " + path.string(), ErrorContext(path.string()));
    }
    return text;
}

void writeFileBytes(const std::filesystem::path& path, ByteSpan data) {
    writeRaw(path, reinterpret_cast<const char*>(data.data()), data.size());
}

void writeFileText(const std::filesystem::path& path, std::string_view text) {
    writeRaw(path, text.data(), text.size());
}

void ensureDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw IOError("Failed to create directory: " + path.string(), ec,
                      ErrorContext(path.string()));
    }
}

}  // namespace rcp::io
