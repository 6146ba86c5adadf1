/**
 * @file db_pool_config.cpp
 * @brief PostgreSQL connection settings
 */

#include "db_pool_config.h"
#include <sstream>

namespace common {

namespace {

std::string quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\\' || c == '\'') {
            out += '\\';
        }
        out += c;
    }
    out += '\'';
    return out;
}

} // namespace

std::string DbPoolConfig::buildConnString() const {
    std::ostringstream oss;
    oss << "host=" << quote(host)
        << " port=" << port
        << " dbname=" << quote(database)
        << " user=" << quote(user)
        << " password=" << quote(password)
        << " connect_timeout=" << connectTimeoutSec;
    return oss.str();
}

std::string DbPoolConfig::describe() const {
    std::ostringstream oss;
    oss << "host=" << host << " port=" << port
        << " dbname=" << database << " user=" << user
        << " password=" << (password.empty() ? "(empty)" : "***");
    return oss.str();
}

} // namespace common
