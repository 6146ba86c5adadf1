/**
 * @file handler_utils_test.cpp
 * @brief Unit tests for shared response builders
 */

#include <gtest/gtest.h>
#include "handlers/handler_utils.h"

#include <stdexcept>

using common::ErrorCode;

TEST(HandlerUtilsTest, ErrorResponseMapsStatusAndBody) {
    auto resp = common::handler::errorResponse(ErrorCode::VALIDATION_TOO_LARGE, "File is too large");

    EXPECT_EQ(resp->getStatusCode(), drogon::k413RequestEntityTooLarge);
    auto json = resp->getJsonObject();
    ASSERT_TRUE(json);
    EXPECT_EQ((*json)["status"].asString(), "error");
    EXPECT_EQ((*json)["message"].asString(), "File is too large");
    EXPECT_EQ((*json)["code"].asString(), "VALIDATION_TOO_LARGE");
}

TEST(HandlerUtilsTest, LengthRequiredAndNotFound) {
    EXPECT_EQ(common::handler::errorResponse(ErrorCode::REQUEST_LENGTH_REQUIRED, "Wrong Content-Length")
                  ->getStatusCode(), drogon::k411LengthRequired);
    EXPECT_EQ(common::handler::errorResponse(ErrorCode::IMAGE_NOT_FOUND, "Not found")
                  ->getStatusCode(), drogon::k404NotFound);
}

TEST(HandlerUtilsTest, InternalErrorHidesDetails) {
    std::runtime_error cause("password authentication failed for user postgres");

    auto resp = common::handler::internalError("HandlerUtilsTest", cause);

    EXPECT_EQ(resp->getStatusCode(), drogon::k500InternalServerError);
    EXPECT_EQ((*resp->getJsonObject())["message"].asString(), "Internal server error");
}

TEST(HandlerUtilsTest, JsonResponseDefaultsToOk) {
    Json::Value body;
    body["status"] = "success";
    EXPECT_EQ(common::handler::jsonResponse(body)->getStatusCode(), drogon::k200OK);
}
