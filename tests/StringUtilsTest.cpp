#include "StringUtils.hpp"

#include <gtest/gtest.h>

using namespace utils;

TEST(StringUtilsTest, CaseConversion) {
    EXPECT_EQ(toLower("Content-Type"), "content-type");
    EXPECT_EQ(toUpper("post"), "POST");
    EXPECT_TRUE(iequals("KEEP-ALIVE", "keep-alive"));
    EXPECT_FALSE(iequals("keep-alive", "keep-alive "));
}

TEST(StringUtilsTest, TrimOnlyStripsSpacesAndTabs) {
    EXPECT_EQ(trim(" \tvalue \t"), "value");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
    auto parts = split("a,,b,", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");
}

TEST(StringUtilsTest, AffixesAndHex) {
    EXPECT_TRUE(startsWith("HTTP/1.1 200", "HTTP/"));
    EXPECT_FALSE(startsWith("HT", "HTTP/"));
    EXPECT_TRUE(endsWith("SHA-256-SESS", "-SESS"));
    EXPECT_FALSE(endsWith("SESS", "-SESS"));

    const unsigned char bytes[] = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(toHex(bytes, sizeof(bytes)), "000fabff");
}
