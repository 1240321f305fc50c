#include <gtest/gtest.h>

#include "pod_protocol/text.hpp"

using namespace pod_protocol;

TEST(TextTest, HexDump) {
    EXPECT_EQ("00 0A FF", toHex(Bytes{0x00, 0x0A, 0xFF}));
    EXPECT_EQ("", toHex(Bytes{}));
}

TEST(TextTest, ValidUtf8IsKept) {
    EXPECT_EQ("GpsPod", decodeText(std::string("GpsPod")));
    EXPECT_EQ("Laufen \xC3\xBC\xE2\x82\xAC\xF0\x9F\x8F\x83", decodeText(std::string("Laufen \xC3\xBC\xE2\x82\xAC\xF0\x9F\x8F\x83")));
    EXPECT_EQ("", decodeText(std::string()));
}

TEST(TextTest, InvalidBytesAreReplaced) {
    const std::string replacement = "\xEF\xBF\xBD";

    EXPECT_EQ("A" + replacement + "B", decodeText(std::string("A\xFF" "B")));
    // Truncated two byte sequence
    EXPECT_EQ("R" + replacement + "!", decodeText(std::string("R\xC3!")));
    EXPECT_EQ("x" + replacement + replacement, decodeText(std::string("x\xE2\x82")));
    // Overlong encoding and UTF-16 surrogate
    EXPECT_EQ(replacement + replacement, decodeText(std::string("\xC0\xAF")));
    EXPECT_EQ(replacement + replacement + replacement, decodeText(std::string("\xED\xA0\x80")));
}

TEST(TextTest, EmbeddedNulIsKept) {
    const char raw[] = {'a', '\0', 'b'};
    EXPECT_EQ(std::string(raw, 3), decodeText(raw, 3));
}
