#pragma once

#include <cstdint>
#include <string>
#include <json/json.h>

/**
 * @file query_helpers.h
 * @brief Typed extraction from IQueryExecutor JSON rows
 *
 * Column values arrive as native JSON numbers for integer columns and as
 * strings for NUMERIC/TEXT/TIMESTAMP. These helpers accept either form.
 *
 * @date 2026-10-19
 */

namespace common::db {

/**
 * @brief Extract a 64-bit integer field
 * @return defaultValue if the field is missing, null, or unparseable
 */
int64_t getInt64(const Json::Value& row, const std::string& field, int64_t defaultValue = 0);

/**
 * @brief Extract a string field
 * @return defaultValue if the field is missing or null
 */
std::string getString(const Json::Value& row, const std::string& field,
                      const std::string& defaultValue = "");

/**
 * @brief Convert an executeScalar() result to a 64-bit integer
 */
int64_t scalarToInt64(const Json::Value& value, int64_t defaultValue = 0);

} // namespace common::db
