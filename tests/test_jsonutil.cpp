#include <gtest/gtest.h>
#include "core/JsonUtil.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>

namespace pattern_harness {
namespace jsonutil {

TEST(JsonUtilTest, EscapeNormalString) {
    EXPECT_EQ(escape(""), "");
    EXPECT_EQ(escape("Hello World"), "Hello World");
}

TEST(JsonUtilTest, EscapeQuoteAndBackslash) {
    EXPECT_EQ(escape("He said \"Hello\""), "He said \\\"Hello\\\"");
    EXPECT_EQ(escape("Path\\to\\file"), "Path\\\\to\\\\file");
}

TEST(JsonUtilTest, EscapeWhitespace) {
    EXPECT_EQ(escape("Line 1\nLine 2"), "Line 1\\nLine 2");
    EXPECT_EQ(escape("Line 1\rLine 2"), "Line 1\\rLine 2");
    EXPECT_EQ(escape("Col1\tCol2"), "Col1\\tCol2");
}

TEST(JsonUtilTest, EscapeAllControlCharacters) {
    for(int i = 0; i < 0x20; ++i) {
        if(i == '\t' || i == '\n' || i == '\r') continue;
        std::string input(1, static_cast<char>(i));
        std::ostringstream expected;
        expected << "\\u" << std::hex << std::setw(4) << std::setfill('0') << i;
        EXPECT_EQ(escape(input), expected.str()) << "control character " << i;
    }
}

TEST(JsonUtilTest, EscapeLeavesUtf8Alone) {
    std::string input = "Test\xE2\x9C\x93";
    EXPECT_EQ(escape(input), input);
}

TEST(JsonUtilTest, TimeToIsoEpochIsEmpty) {
    std::chrono::system_clock::time_point epoch;
    EXPECT_EQ(time_to_iso(epoch), "");
}

TEST(JsonUtilTest, TimeToIsoKnownInstant) {
    // 2000-01-01T00:00:00Z
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(946684800));
    EXPECT_EQ(time_to_iso(tp), "2000-01-01T00:00:00Z");
}

}
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
