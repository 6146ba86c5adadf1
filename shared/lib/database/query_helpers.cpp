/**
 * @file query_helpers.cpp
 * @brief Typed extraction from IQueryExecutor JSON rows
 */

#include "query_helpers.h"
#include <stdexcept>

namespace common::db {

int64_t scalarToInt64(const Json::Value& value, int64_t defaultValue) {
    if (value.isNull()) return defaultValue;
    if (value.isInt64()) return value.asInt64();
    if (value.isDouble()) return static_cast<int64_t>(value.asDouble());
    if (value.isString()) {
        const std::string& s = value.asString();
        if (s.empty()) return defaultValue;
        try {
            size_t pos = 0;
            long long v = std::stoll(s, &pos);
            return pos == s.size() ? static_cast<int64_t>(v) : defaultValue;
        } catch (const std::exception&) {
            return defaultValue;
        }
    }
    return defaultValue;
}

int64_t getInt64(const Json::Value& row, const std::string& field, int64_t defaultValue) {
    if (!row.isObject() || !row.isMember(field)) return defaultValue;
    return scalarToInt64(row[field], defaultValue);
}

std::string getString(const Json::Value& row, const std::string& field,
                      const std::string& defaultValue) {
    if (!row.isObject() || !row.isMember(field) || row[field].isNull()) return defaultValue;
    const Json::Value& v = row[field];
    if (v.isString()) return v.asString();
    if (v.isInt64()) return std::to_string(v.asInt64());
    if (v.isBool()) return v.asBool() ? "true" : "false";
    return v.asString();
}

} // namespace common::db
