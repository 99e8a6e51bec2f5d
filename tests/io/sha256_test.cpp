// =============================================================================
// rcp-packager - SHA-256 Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "rcp/io/sha256.h"
#include "test_support.h"

namespace rcp::io::test {

namespace {

ByteSpan asBytes(std::string_view text) {
    return ByteSpan(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

constexpr std::string_view kEmptyDigest =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr std::string_view kAbcDigest =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

}  // namespace

TEST(Sha256Test, KnownVectors) {
    EXPECT_EQ(sha256Hex(ByteSpan{}), kEmptyDigest);
    EXPECT_EQ(sha256Hex(asBytes("abc")), kAbcDigest);
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    Sha256 hasher;
    hasher.update(asBytes("a"));
    hasher.update(asBytes(""));
    hasher.update(asBytes("bc"));
    EXPECT_EQ(hasher.finishHex(), kAbcDigest);
}

TEST(Sha256Test, UpdateAfterFinishThrows) {
    Sha256 hasher;
    (void)hasher.finish();
    EXPECT_THROW(hasher.update(asBytes("x")), UsageError);
    EXPECT_THROW((void)hasher.finish(), UsageError);
}

TEST(Sha256Test, FileDigestMatchesMemoryDigest) {
    rcp::test::TempDirGuard dir("rcp_sha");
    const auto file = dir.path() / "payload.bin";

    // Spans several read chunks
    std::string payload(kHashChunkSize * 2 + 17, '\0');
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(i * 31);
    }
    rcp::test::writeText(file, payload);

    EXPECT_EQ(sha256FileHex(file), sha256Hex(asBytes(payload)));
}

TEST(Sha256Test, MissingFileThrowsIOError) {
    rcp::test::TempDirGuard dir("rcp_sha");
    EXPECT_THROW((void)sha256FileHex(dir.path() / "absent"), IOError);
}

TEST(Sha256Test, HexValidation) {
    EXPECT_TRUE(isSha256Hex(kAbcDigest));
    EXPECT_FALSE(isSha256Hex(kAbcDigest.substr(1)));
    EXPECT_FALSE(isSha256Hex(std::string(64, 'A')));
    EXPECT_FALSE(isSha256Hex(std::string(64, 'g')));
}

}  // namespace rcp::io::test
