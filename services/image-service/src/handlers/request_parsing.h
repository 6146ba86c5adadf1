#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * @file request_parsing.h
 * @brief Framework-independent parsing of request parameters
 *
 * Each function returns std::nullopt for input the handler must reject.
 */

namespace handlers {

/**
 * @brief Content-Length header value
 * @return Positive length, or std::nullopt if missing, malformed or zero
 */
std::optional<int64_t> parseContentLength(const std::string& header);

/**
 * @brief "page" query value
 *
 * Empty means page 1. Values below 1 become 1 and values beyond INT_MAX
 * become INT_MAX.
 *
 * @return std::nullopt for non-numeric input
 */
std::optional<int> parsePageParam(const std::string& value);

/**
 * @brief Image id path segment
 * @return Positive id, or std::nullopt otherwise
 */
std::optional<int64_t> parseImageId(const std::string& value);

/**
 * @brief True for names the upload service generates: 32 lowercase hex chars + .jpg/.png/.gif
 */
bool isStorageFilename(const std::string& name);

} // namespace handlers
