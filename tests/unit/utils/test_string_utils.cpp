//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/utils/string_utils.hpp"

#include <gtest/gtest.h>

namespace eca::string_utils
{
    TEST(StringUtilsTest, Trim) {
        EXPECT_EQ(trim("  at Foo.bar(Foo.java:1)\t"), "at Foo.bar(Foo.java:1)");
        EXPECT_EQ(trim_left("\t x "), "x ");
        EXPECT_EQ(trim_right(" x \r"), " x");
        EXPECT_EQ(trim("   "), "");
        EXPECT_EQ(trim(""), "");
    }

    TEST(StringUtilsTest, SplitKeepsEmptyParts) {
        const auto parts = split("a::b", ':');
        ASSERT_EQ(parts.size(), 3u);
        EXPECT_EQ(parts[1], "");
        EXPECT_EQ(parts[2], "b");
    }

    TEST(StringUtilsTest, SplitLinesHandlesCrLf) {
        const auto lines = split_lines("first\r\nsecond\n\nfourth\n");
        ASSERT_EQ(lines.size(), 4u);
        EXPECT_EQ(lines[0], "first");
        EXPECT_EQ(lines[1], "second");
        EXPECT_EQ(lines[2], "");
        EXPECT_EQ(lines[3], "fourth");
        EXPECT_TRUE(split_lines("").empty());
    }

    TEST(StringUtilsTest, Join) {
        const std::vector<std::string> parts = {"a", "b", "c"};
        EXPECT_EQ(join(parts, "|"), "a|b|c");
        EXPECT_EQ(join(std::vector<std::string>{}, "|"), "");
    }

    TEST(StringUtilsTest, Prefix) {
        EXPECT_TRUE(starts_with("org.springframework.web", "org.springframework."));
        EXPECT_FALSE(starts_with("org", "org.springframework."));
    }

    TEST(StringUtilsTest, CaseAndReplace) {
        EXPECT_EQ(to_lower("WARN"), "warn");
        EXPECT_EQ(to_upper("severe"), "SEVERE");
        EXPECT_EQ(replace_all("com.example.Foo", '.', '/'), "com/example/Foo");
    }

    TEST(StringUtilsTest, TruncateAndCount) {
        EXPECT_EQ(truncate("abcdef", 3), "abc...");
        EXPECT_EQ(truncate("abc", 3), "abc");
        EXPECT_EQ(count_char("{ { } }", '{'), 2u);
    }
}
