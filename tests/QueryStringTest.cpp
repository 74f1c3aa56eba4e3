#include "QueryString.hpp"

#include <gtest/gtest.h>

TEST(QueryStringTest, EscapeKeepsUnreservedCharacters) {
    EXPECT_EQ(query_string::escape("a-b_c.d!e~f*g'h(i)j"), "a-b_c.d!e~f*g'h(i)j");
    EXPECT_EQ(query_string::escape("a b&c=d/é"), "a%20b%26c%3Dd%2F%C3%A9");
}

TEST(QueryStringTest, UnescapeToleratesMalformedSequences) {
    EXPECT_EQ(query_string::unescape("a%20b%zz%4"), "a b%zz%4");
    EXPECT_EQ(query_string::unescape("a+b"), "a+b");
    EXPECT_EQ(query_string::unescape("a+b", true), "a b");
}

TEST(QueryStringTest, FlatStringifyRepeatsArrayKeys) {
    Json::Value data;
    data["name"] = "a b";
    data["n"] = 3;
    data["flag"] = true;
    data["list"].append("x");
    data["list"].append("y");

    // Member names come out in sorted order
    EXPECT_EQ(query_string::stringify(data), "flag=true&list=x&list=y&n=3&name=a%20b");
}

TEST(QueryStringTest, FlatStringifyLosesNestedStructure) {
    Json::Value data;
    data["a"]["b"] = 1;
    EXPECT_EQ(query_string::stringify(data), "a=");

    Json::Value parsed = query_string::parseNested(query_string::stringify(data));
    EXPECT_TRUE(parsed["a"].isString());
    EXPECT_EQ(parsed["a"].asString(), "");
}

TEST(QueryStringTest, NestedStringifyRoundTrips) {
    Json::Value data;
    data["a"]["b"] = 1;
    std::string encoded = query_string::stringifyNested(data);
    EXPECT_EQ(encoded, "a%5Bb%5D=1");

    Json::Value parsed = query_string::parseNested(encoded);
    ASSERT_TRUE(parsed["a"].isObject());
    EXPECT_EQ(parsed["a"]["b"].asString(), "1");
}

TEST(QueryStringTest, NestedArraysUseIndexes) {
    Json::Value data;
    data["list"].append("x");
    data["list"].append("y");
    data["deep"]["items"].append(1);

    std::string encoded = query_string::stringifyNested(data);
    EXPECT_EQ(encoded, "deep%5Bitems%5D%5B0%5D=1&list%5B0%5D=x&list%5B1%5D=y");

    Json::Value parsed = query_string::parseNested(encoded);
    ASSERT_TRUE(parsed["list"].isArray());
    EXPECT_EQ(parsed["list"].size(), 2u);
    EXPECT_EQ(parsed["list"][1].asString(), "y");
    ASSERT_TRUE(parsed["deep"]["items"].isArray());
}

TEST(QueryStringTest, ParseCollectsRepeatedKeys) {
    Json::Value parsed = query_string::parse("a=1&b=x+y&a=2&c");
    ASSERT_TRUE(parsed["a"].isArray());
    EXPECT_EQ(parsed["a"][0].asString(), "1");
    EXPECT_EQ(parsed["a"][1].asString(), "2");
    EXPECT_EQ(parsed["b"].asString(), "x y");
    EXPECT_EQ(parsed["c"].asString(), "");
}

TEST(QueryStringTest, ParseNestedAppendsEmptyBrackets) {
    Json::Value parsed = query_string::parseNested("tags[]=a&tags[]=b");
    ASSERT_TRUE(parsed["tags"].isArray());
    EXPECT_EQ(parsed["tags"][0].asString(), "a");
    EXPECT_EQ(parsed["tags"][1].asString(), "b");
}

TEST(QueryStringTest, AppendQuery) {
    EXPECT_EQ(query_string::appendQuery("", "a=1"), "a=1");
    EXPECT_EQ(query_string::appendQuery("x=0", "a=1"), "x=0&a=1");
    EXPECT_EQ(query_string::appendQuery("x=0&", "a=1"), "x=0&a=1");
    EXPECT_EQ(query_string::appendQuery("x=0", ""), "x=0");
}
