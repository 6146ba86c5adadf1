#pragma once

#include "../common/error_codes.h"

#include <string>
#include <json/json.h>
#include <drogon/HttpResponse.h>
#include <spdlog/spdlog.h>

/**
 * @file handler_utils.h
 * @brief Response builders shared by the Image Service handlers
 *
 * Provides:
 *   - jsonResponse(): JSON body with an explicit status
 *   - errorResponse(): {status:"error", message, code} with the status mapped from the ErrorCode
 *   - internalError(): sanitized 500 (logs the real error, returns a generic message)
 */

namespace common::handler {

inline drogon::HttpResponsePtr jsonResponse(const Json::Value& body, int httpStatus = 200) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(httpStatus));
    return resp;
}

inline drogon::HttpResponsePtr errorResponse(ErrorCode code, const std::string& publicMessage) {
    ErrorResponse error(code, publicMessage);
    return jsonResponse(error.toJson(), error.getHttpStatus());
}

/**
 * Logs exception details server-side; the client only sees a generic message.
 */
inline drogon::HttpResponsePtr internalError(
    const std::string& logContext, const std::exception& e) {
    spdlog::error("[{}] {}", logContext, e.what());
    return errorResponse(ErrorCode::SYSTEM_INTERNAL_ERROR, "Internal server error");
}

} // namespace common::handler
