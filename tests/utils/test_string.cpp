#include "ddns/utils/string.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace ddns::utils;

TEST(StringUtilsTest, URLEncode) {
    EXPECT_EQ(urlEncode("hello world"), "hello+world");
    EXPECT_EQ(urlEncode("a+b=c"), "a%2Bb%3Dc");
    EXPECT_EQ(urlEncode("a.example.com,b.example.com"),
              "a.example.com%2Cb.example.com");
    EXPECT_EQ(urlEncode("unreserved-_.~"), "unreserved-_.~");
    EXPECT_EQ(urlEncode(""), "");
}

TEST(StringUtilsTest, URLEncodeNonAscii) {
    EXPECT_EQ(urlEncode("\xC3\xA9"), "%C3%A9");
}

TEST(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(startsWith("hello world", "hello"));
    EXPECT_FALSE(startsWith("hello world", "world"));
    EXPECT_TRUE(startsWith("good 1.2.3.4", "good "));
    EXPECT_FALSE(startsWith("good", "good "));
}

TEST(StringUtilsTest, JoinStrings) {
    std::vector<std::string> input = {"a", "b", "c"};
    EXPECT_EQ(joinStrings(input, ","), "a,b,c");
    EXPECT_EQ(joinStrings(input, ", "), "a, b, c");

    std::vector<std::string> single = {"only"};
    EXPECT_EQ(joinStrings(single, ","), "only");

    std::vector<std::string> empty;
    EXPECT_EQ(joinStrings(empty, ","), "");
}

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trim("  hello  "), "hello");
    EXPECT_EQ(trim("\t\r\n1.2.3.4\r\n"), "1.2.3.4");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("xxhixx", "x"), "hi");
}

TEST(StringUtilsTest, IsBlank) {
    EXPECT_TRUE(isBlank(""));
    EXPECT_TRUE(isBlank(" \t\r\n"));
    EXPECT_FALSE(isBlank(" a "));
}

TEST(StringUtilsTest, SplitLinesAcceptsAllLineEndings) {
    std::vector<std::string> expected = {"a", "b", "c", "d"};
    EXPECT_EQ(splitLines("a\nb\r\nc\rd"), expected);
}

TEST(StringUtilsTest, SplitLinesDropsBlankLinesAndTrims) {
    std::vector<std::string> expected = {"good 1.2.3.4", "nochg 1.2.3.4"};
    EXPECT_EQ(splitLines("\n  good 1.2.3.4  \n\n   \nnochg 1.2.3.4\n"),
              expected);
    EXPECT_TRUE(splitLines("").empty());
    EXPECT_TRUE(splitLines("\r\n\r\n").empty());
}
