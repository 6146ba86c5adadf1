/**
 * @file request_parsing_test.cpp
 * @brief Unit tests for request parameter parsing
 */

#include <gtest/gtest.h>
#include "handlers/request_parsing.h"

#include <limits>

using namespace handlers;

// --- Content-Length ---

TEST(RequestParsingTest, ContentLength) {
    EXPECT_EQ(parseContentLength("1024"), 1024);
    EXPECT_EQ(parseContentLength(" 5242880 "), 5242880);
    EXPECT_FALSE(parseContentLength("").has_value());
    EXPECT_FALSE(parseContentLength("0").has_value());
    EXPECT_FALSE(parseContentLength("-1").has_value());
    EXPECT_FALSE(parseContentLength("12kb").has_value());
}

// --- page ---

TEST(RequestParsingTest, PageParam) {
    EXPECT_EQ(parsePageParam(""), 1);
    EXPECT_EQ(parsePageParam("3"), 3);
    EXPECT_EQ(parsePageParam("0"), 1);
    EXPECT_EQ(parsePageParam("-7"), 1);
    EXPECT_EQ(parsePageParam("99999999999"), std::numeric_limits<int>::max());
    EXPECT_EQ(parsePageParam("999999999999999999999999"), std::numeric_limits<int>::max());
}

TEST(RequestParsingTest, PageParamNonNumeric) {
    EXPECT_FALSE(parsePageParam("abc").has_value());
    EXPECT_FALSE(parsePageParam("2.5").has_value());
    EXPECT_FALSE(parsePageParam("1;DROP").has_value());
}

// --- id ---

TEST(RequestParsingTest, ImageId) {
    EXPECT_EQ(parseImageId("42"), 42);
    EXPECT_FALSE(parseImageId("0").has_value());
    EXPECT_FALSE(parseImageId("-3").has_value());
    EXPECT_FALSE(parseImageId("abc").has_value());
    EXPECT_FALSE(parseImageId("").has_value());
}

// --- storage filename ---

TEST(RequestParsingTest, StorageFilename) {
    EXPECT_TRUE(isStorageFilename("0123456789abcdef0123456789abcdef.png"));
    EXPECT_TRUE(isStorageFilename("ffffffffffffffffffffffffffffffff.jpg"));
    EXPECT_TRUE(isStorageFilename("00000000000000000000000000000000.gif"));

    EXPECT_FALSE(isStorageFilename("0123456789ABCDEF0123456789abcdef.png"));
    EXPECT_FALSE(isStorageFilename("0123456789abcdef0123456789abcdef.jpeg"));
    EXPECT_FALSE(isStorageFilename("0123456789abcdef0123456789abcdef.exe"));
    EXPECT_FALSE(isStorageFilename("../../etc/passwd"));
    EXPECT_FALSE(isStorageFilename("cat.png"));
    EXPECT_FALSE(isStorageFilename(""));
}
