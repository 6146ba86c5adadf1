/**
 * @file error_codes.h
 * @brief Standardized error codes for the Image Service
 *
 * Format: COMPONENT_ERROR_TYPE_DETAIL
 * The numeric range selects the HTTP status, except for the few codes
 * that carry a status of their own (too large, not found, length required).
 *
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <json/json.h>

namespace common {

/**
 * @brief Error code enumeration
 */
enum class ErrorCode {
    // Success
    SUCCESS = 0,

    // Metadata store errors (1000-1999)
    METADATA_WRITE_FAILED = 1001,
    METADATA_READ_FAILED = 1002,
    METADATA_DELETE_FAILED = 1003,

    // File store errors (2000-2999)
    STORAGE_WRITE_FAILED = 2001,
    STORAGE_READ_FAILED = 2002,

    // Lookup errors (3000-3999)
    IMAGE_NOT_FOUND = 3001,

    // Request errors (4000-4999)
    REQUEST_MALFORMED = 4001,
    REQUEST_INVALID_PAGE = 4002,
    REQUEST_INVALID_ID = 4003,
    REQUEST_LENGTH_REQUIRED = 4004,

    // Validation errors (5000-5999)
    VALIDATION_TOO_LARGE = 5001,
    VALIDATION_UNSUPPORTED_TYPE = 5002,
    VALIDATION_TYPE_MISMATCH = 5003,
    VALIDATION_EMPTY_FILE = 5004,
    VALIDATION_MISSING_FILENAME = 5005,
    VALIDATION_CORRUPT_IMAGE = 5006,

    // System errors (9000-9999)
    SYSTEM_INTERNAL_ERROR = 9001,
};

/**
 * @brief Convert error code to string
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";

        case ErrorCode::METADATA_WRITE_FAILED: return "METADATA_WRITE_FAILED";
        case ErrorCode::METADATA_READ_FAILED: return "METADATA_READ_FAILED";
        case ErrorCode::METADATA_DELETE_FAILED: return "METADATA_DELETE_FAILED";

        case ErrorCode::STORAGE_WRITE_FAILED: return "STORAGE_WRITE_FAILED";
        case ErrorCode::STORAGE_READ_FAILED: return "STORAGE_READ_FAILED";

        case ErrorCode::IMAGE_NOT_FOUND: return "IMAGE_NOT_FOUND";

        case ErrorCode::REQUEST_MALFORMED: return "REQUEST_MALFORMED";
        case ErrorCode::REQUEST_INVALID_PAGE: return "REQUEST_INVALID_PAGE";
        case ErrorCode::REQUEST_INVALID_ID: return "REQUEST_INVALID_ID";
        case ErrorCode::REQUEST_LENGTH_REQUIRED: return "REQUEST_LENGTH_REQUIRED";

        case ErrorCode::VALIDATION_TOO_LARGE: return "VALIDATION_TOO_LARGE";
        case ErrorCode::VALIDATION_UNSUPPORTED_TYPE: return "VALIDATION_UNSUPPORTED_TYPE";
        case ErrorCode::VALIDATION_TYPE_MISMATCH: return "VALIDATION_TYPE_MISMATCH";
        case ErrorCode::VALIDATION_EMPTY_FILE: return "VALIDATION_EMPTY_FILE";
        case ErrorCode::VALIDATION_MISSING_FILENAME: return "VALIDATION_MISSING_FILENAME";
        case ErrorCode::VALIDATION_CORRUPT_IMAGE: return "VALIDATION_CORRUPT_IMAGE";

        case ErrorCode::SYSTEM_INTERNAL_ERROR: return "SYSTEM_INTERNAL_ERROR";

        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Convert error code to HTTP status code
 */
inline int errorCodeToHttpStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION_TOO_LARGE: return 413;
        case ErrorCode::IMAGE_NOT_FOUND: return 404;
        case ErrorCode::REQUEST_LENGTH_REQUIRED: return 411;
        default: break;
    }

    int numericCode = static_cast<int>(code);

    if (numericCode == 0) {
        return 200;
    } else if (numericCode >= 1000 && numericCode < 3000) {
        return 500;  // Store errors -> Internal Server Error
    } else if (numericCode >= 4000 && numericCode < 6000) {
        return 400;  // Request and validation errors -> Bad Request
    }

    return 500;
}

/**
 * @brief Error response builder
 *
 * Body shape: {"status": "error", "message": "...", "code": "IMAGE_NOT_FOUND"}
 */
class ErrorResponse {
private:
    ErrorCode code_;
    std::string message_;

public:
    ErrorResponse(ErrorCode code, const std::string& message)
        : code_(code), message_(message) {}

    Json::Value toJson() const {
        Json::Value json;
        json["status"] = "error";
        json["message"] = message_;
        json["code"] = errorCodeToString(code_);
        return json;
    }

    int getHttpStatus() const {
        return errorCodeToHttpStatus(code_);
    }

    ErrorCode getCode() const {
        return code_;
    }

    const std::string& getMessage() const {
        return message_;
    }
};

} // namespace common
