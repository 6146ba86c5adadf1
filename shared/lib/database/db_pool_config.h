/**
 * @file db_pool_config.h
 * @brief PostgreSQL connection settings
 *
 * @date 2026-10-19
 */

#pragma once

#include <cstddef>
#include <string>

namespace common {

struct DbPoolConfig {
    std::string host = "db";
    int port = 5432;
    std::string database = "images_db";
    std::string user = "postgres";
    std::string password;

    size_t minSize = 2;
    size_t maxSize = 10;
    int acquireTimeoutSec = 5;
    int connectTimeoutSec = 10;

    /**
     * @brief Build a libpq keyword/value connection string
     *
     * Values are single-quoted with backslash and quote escaped, so
     * passwords containing spaces or quotes survive.
     */
    std::string buildConnString() const;

    /**
     * @brief Same string with the password masked, for logging
     */
    std::string describe() const;
};

} // namespace common
