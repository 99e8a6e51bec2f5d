// =============================================================================
// rcp-packager - SHA-256 Digests Implementation
// =============================================================================

#include "rcp/io/sha256.h"

#include <fstream>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <mbedtls/sha256.h>

namespace rcp::io {

struct Sha256::Context {
    mbedtls_sha256_context sha;
};

namespace {

void checkMbedtls(int rc, std::string_view operation) {
    if (rc != 0) {
        throw IOError(fmt::format("SHA-256 {} failed (mbedtls error {})", operation, rc));
    }
}

}  // namespace

Sha256::Sha256() : ctx_(std::make_unique<Context>()) {
    mbedtls_sha256_init(&ctx_->sha);
    // 0 selects SHA-256 rather than SHA-224
    checkMbedtls(mbedtls_sha256_starts(&ctx_->sha, 0), "start");
}

Sha256::~Sha256() {
    if (ctx_) {
        mbedtls_sha256_free(&ctx_->sha);
    }
}

Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            mbedtls_sha256_free(&ctx_->sha);
        }
        ctx_ = std::move(other.ctx_);
        finished_ = other.finished_;
    }
    return *this;
}

void Sha256::update(ByteSpan data) {
    if (finished_) {
        throw UsageError("Sha256::update called after finish");
    }
    if (data.empty()) {
        return;
    }
    checkMbedtls(mbedtls_sha256_update(&ctx_->sha, data.data(), data.size()), "update");
}

Sha256Digest Sha256::finish() {
    if (finished_) {
        throw UsageError("Sha256::finish called twice");
    }
    Sha256Digest digest{};
    checkMbedtls(mbedtls_sha256_finish(&ctx_->sha, digest.data()), "finish");
    finished_ = true;
    return digest;
}

std::string Sha256::finishHex() {
    return toHex(finish());
}

std::string toHex(const Sha256Digest& digest) {
    return fmt::format("{:02x}", fmt::join(digest, ""));
}

std::string sha256Hex(ByteSpan data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finishHex();
}

std::string sha256FileHex(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError("Failed to open file for hashing: " + path.string(),
                      ErrorContext(path.string()));
    }

    Sha256 hasher;
    std::vector<char> chunk(kHashChunkSize);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got > 0) {
            hasher.update(ByteSpan(reinterpret_cast<const std::uint8_t*>(chunk.data()), got));
        }
    }
    if (in.bad()) {
        throw IOError("Failed to read file for hashing: " + path.string(),
                      ErrorContext(path.string()));
    }
    return hasher.finishHex();
}

bool isSha256Hex(std::string_view text) noexcept {
    if (text.size() != kSha256HexSize) {
        return false;
    }
    for (char c : text) {
        const bool digit = c >= '0' && c <= '9';
        const bool lowerHex = c >= 'a' && c <= 'f';
        if (!digit && !lowerHex) {
            return false;
        }
    }
    return true;
}

}  // namespace rcp::io
