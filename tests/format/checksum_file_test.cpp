// =============================================================================
// rcp-packager - checksums.txt Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rcp/format/checksum_file.h"

namespace rcp::format::test {

namespace {

const std::string kDigestA(64, 'a');
const std::string kDigestB(64, '0');

}  // namespace

TEST(ChecksumFileTest, FormatsSha256sumLines) {
    const std::vector<Checksum> entries = {{"manifest.json", kDigestA},
                                           {"channels/touch.pbz", kDigestB}};
    EXPECT_EQ(formatChecksumFile(entries),
              kDigestA + "  manifest.json\n" + kDigestB + "  channels/touch.pbz\n");
}

TEST(ChecksumFileTest, ParseInvertsFormat) {
    const std::vector<Checksum> entries = {{"index.json", kDigestA},
                                           {"channels/gyro.pbz", kDigestB}};
    EXPECT_EQ(parseChecksumFile(formatChecksumFile(entries), "checksums.txt"), entries);
}

TEST(ChecksumFileTest, ToleratesBlankLinesAndCrlf) {
    const std::string text = "\n" + kDigestA + "  manifest.json\r\n\r\n";
    const auto entries = parseChecksumFile(text, "checksums.txt");
    ASSERT_EQ(entries.size(), 1U);
    EXPECT_EQ(entries[0].path, "manifest.json");
    EXPECT_EQ(entries[0].sha256, kDigestA);
}

TEST(ChecksumFileTest, PathMayContainSpaces) {
    const auto entries = parseChecksumFile(kDigestA + "  dir/a b.txt\n", "checksums.txt");
    ASSERT_EQ(entries.size(), 1U);
    EXPECT_EQ(entries[0].path, "dir/a b.txt");
}

TEST(ChecksumFileTest, MalformedLinesAreRejected) {
    // single space separator
    EXPECT_THROW((void)parseChecksumFile(kDigestA + " manifest.json\n", "c"), FormatError);
    // short digest
    EXPECT_THROW((void)parseChecksumFile("abc  manifest.json\n", "c"), FormatError);
    // missing path
    EXPECT_THROW((void)parseChecksumFile(kDigestA + "  \n", "c"), FormatError);

    try {
        (void)parseChecksumFile(kDigestA + "  ok\nbroken\n", "checksums.txt");
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.message(), "checksums.txt: malformed checksum line 2");
    }
}

}  // namespace rcp::format::test
