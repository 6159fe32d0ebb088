/*
 * test_secret_compare.cpp - Tests for constant-time secret comparison
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <string>

#include "security/secret_compare.hpp"

using rampart::security::constantTimeEquals;

TEST(ConstantTimeEqualsTest, EqualInputs) {
    EXPECT_TRUE(constantTimeEquals("abc123", "abc123"));
}

TEST(ConstantTimeEqualsTest, BothEmpty) {
    EXPECT_TRUE(constantTimeEquals("", ""));
}

TEST(ConstantTimeEqualsTest, DifferentLengths) {
    EXPECT_FALSE(constantTimeEquals("abc", "abcd"));
    EXPECT_FALSE(constantTimeEquals("", "a"));
}

TEST(ConstantTimeEqualsTest, DifferenceInFirstByte) {
    EXPECT_FALSE(constantTimeEquals("xbc123", "abc123"));
}

TEST(ConstantTimeEqualsTest, DifferenceInLastByte) {
    EXPECT_FALSE(constantTimeEquals("abc123", "abc124"));
}

TEST(ConstantTimeEqualsTest, EmbeddedNulBytes) {
    const std::string a("ab\0cd", 5);
    const std::string b("ab\0ce", 5);
    EXPECT_TRUE(constantTimeEquals(a, a));
    EXPECT_FALSE(constantTimeEquals(a, b));
}
