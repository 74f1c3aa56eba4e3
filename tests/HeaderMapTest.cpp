#include "HeaderMap.hpp"

#include <gtest/gtest.h>

TEST(HeaderMapTest, LookupIsCaseInsensitive) {
    HeaderMap headers{{"Content-Type", "text/plain"}};
    EXPECT_EQ(headers.get("content-type").value_or(""), "text/plain");
    EXPECT_TRUE(headers.has("CONTENT-TYPE"));
    EXPECT_FALSE(headers.get("Content-Length").has_value());
}

TEST(HeaderMapTest, SetReplacesInPlaceAndDropsDuplicates) {
    HeaderMap headers;
    headers.append("Accept", "a");
    headers.append("X-Test", "1");
    headers.append("accept", "b");

    headers.set("ACCEPT", "c");
    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers.fields()[0].first, "Accept");
    EXPECT_EQ(headers.fields()[0].second, "c");
    EXPECT_EQ(headers.fields()[1].first, "X-Test");
}

TEST(HeaderMapTest, AppendKeepsRepeatedFields) {
    HeaderMap headers;
    headers.append("Set-Cookie", "a=1");
    headers.append("Set-Cookie", "b=2");
    auto values = headers.getAll("set-cookie");
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[1], "b=2");
    EXPECT_EQ(headers.get("Set-Cookie").value_or(""), "a=1");
}

TEST(HeaderMapTest, MergeLetsOverlayWin) {
    HeaderMap base{{"User-Agent", "default"}, {"Accept", "*/*"}};
    HeaderMap overlay{{"user-agent", "custom"}, {"X-Extra", "1"}};
    base.merge(overlay);

    EXPECT_EQ(base.getAll("User-Agent").size(), 1u);
    EXPECT_EQ(base.get("User-Agent").value_or(""), "custom");
    EXPECT_EQ(base.get("Accept").value_or(""), "*/*");
    EXPECT_EQ(base.get("X-Extra").value_or(""), "1");
}

TEST(HeaderMapTest, RemoveAndSerialize) {
    HeaderMap headers{{"Host", "example.com"}, {"Cookie", "a=1"}, {"cookie", "b=2"}};
    EXPECT_TRUE(headers.remove("COOKIE"));
    EXPECT_FALSE(headers.remove("Cookie"));
    EXPECT_EQ(headers.serialize(), "Host: example.com\r\n");
}
