/*
 * test_form_codec.cpp - Tests for urlencoded form parsing
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "utils/form_codec.hpp"

using namespace rampart::utils;

TEST(UrlDecodeTest, DecodesPercentAndPlus) {
    EXPECT_EQ(urlDecode("a%20b+c"), "a b c");
    EXPECT_EQ(urlDecode("%3c%3E"), "<>");
    EXPECT_EQ(urlDecode("a+b", false), "a+b");
}

TEST(UrlDecodeTest, InvalidEscapesAreKeptLiterally) {
    EXPECT_EQ(urlDecode("100%"), "100%");
    EXPECT_EQ(urlDecode("%zz"), "%zz");
    EXPECT_EQ(urlDecode("%4"), "%4");
}

TEST(UrlEncodeTest, EncodesReservedCharacters) {
    EXPECT_EQ(urlEncode("a b&c=d"), "a+b%26c%3Dd");
    EXPECT_EQ(urlEncode("safe-._~"), "safe-._~");
    EXPECT_EQ(urlEncode("\xff"), "%FF");
}

TEST(ParseFormTest, SplitsFields) {
    auto fields = parseForm("a=1&b=&c&&d=x%3Dy");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0].name, "a");
    EXPECT_EQ(fields[0].value, "1");
    EXPECT_TRUE(fields[1].hasValue);
    EXPECT_EQ(fields[1].value, "");
    EXPECT_EQ(fields[2].name, "c");
    EXPECT_FALSE(fields[2].hasValue);
    EXPECT_EQ(fields[3].value, "x=y");
}

TEST(ParseFormTest, EmptyBody) {
    EXPECT_TRUE(parseForm("").empty());
}

TEST(SerializeFormTest, ReencodesFields) {
    std::vector<FormField> fields{{"name", "a b", true}, {"flag", "", false},
                                  {"q", "<&>", true}};
    EXPECT_EQ(serializeForm(fields), "name=a+b&flag&q=%3C%26%3E");
}

TEST(FindFormValueTest, ReturnsFirstMatch) {
    EXPECT_EQ(findFormValue("x=1&csrf_token=abc&csrf_token=def", "csrf_token"),
              "abc");
    EXPECT_FALSE(findFormValue("csrf_token", "csrf_token").has_value());
    EXPECT_FALSE(findFormValue("a=1", "b").has_value());
}
