#pragma once

/**
 * @file app_config.h
 * @brief Image Service application configuration
 *
 * Loaded from environment variables at startup.
 */

#include "db_pool_config.h"
#include "exception/exceptions.h"

#include <imghost/utils/string_utils.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <spdlog/spdlog.h>

struct AppConfig {
    // PostgreSQL
    std::string dbHost = "db";
    int dbPort = 5432;
    std::string dbName = "images_db";
    std::string dbUser = "postgres";
    std::string dbPassword;
    int dbPoolMin = 2;
    int dbPoolMax = 10;
    int dbPoolTimeoutSec = 5;

    // HTTP server
    int serverPort = 8000;
    int threadNum = 4;

    // Filesystem layout
    std::string appBase = "/app";
    std::string uploadDir;   // default: $APP_BASE/images
    std::string logDir;      // default: $APP_BASE/logs

    // Upload policy
    int maxFileSizeMB = 5;
    int pageSize = 10;
    std::string publicBasePath = "/images";
    bool enforceSignatureCheck = true;

    // Logging
    std::string logLevel = "info";
    bool logToFile = true;
    std::string logFile;     // default: $LOG_DIR/image-service.log

    static int envStoi(const char* val, int defaultVal, int minVal, int maxVal) {
        auto parsed = imghost::utils::parseInt64(imghost::utils::trim(val));
        if (!parsed) {
            spdlog::warn("Invalid integer env value '{}', using default {}", val, defaultVal);
            return defaultVal;
        }
        int64_t clamped = std::clamp<int64_t>(*parsed, minVal, maxVal);
        if (clamped != *parsed) {
            spdlog::warn("Env value {} out of range [{}, {}], clamped to {}", *parsed, minVal, maxVal, clamped);
        }
        return static_cast<int>(clamped);
    }

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("DB_HOST")) config.dbHost = val;
        if (auto val = std::getenv("DB_PORT")) config.dbPort = envStoi(val, 5432, 1, 65535);
        if (auto val = std::getenv("DB_NAME")) config.dbName = val;
        if (auto val = std::getenv("DB_USER")) config.dbUser = val;
        if (auto val = std::getenv("DB_PASSWORD")) config.dbPassword = val;
        if (auto val = std::getenv("DB_POOL_MIN")) config.dbPoolMin = envStoi(val, 2, 0, 100);
        if (auto val = std::getenv("DB_POOL_MAX")) config.dbPoolMax = envStoi(val, 10, 1, 100);
        if (auto val = std::getenv("DB_POOL_TIMEOUT")) config.dbPoolTimeoutSec = envStoi(val, 5, 1, 300);
        config.dbPoolMin = std::min(config.dbPoolMin, config.dbPoolMax);

        if (auto val = std::getenv("SERVER_PORT")) config.serverPort = envStoi(val, 8000, 1, 65535);
        if (auto val = std::getenv("THREAD_NUM")) config.threadNum = envStoi(val, 4, 1, 256);

        if (auto val = std::getenv("APP_BASE")) config.appBase = val;
        config.uploadDir = config.appBase + "/images";
        config.logDir = config.appBase + "/logs";
        if (auto val = std::getenv("UPLOAD_DIR")) config.uploadDir = val;
        if (auto val = std::getenv("LOG_DIR")) config.logDir = val;

        if (auto val = std::getenv("MAX_FILE_SIZE_MB")) config.maxFileSizeMB = envStoi(val, 5, 1, 100);
        if (auto val = std::getenv("PAGE_SIZE")) config.pageSize = envStoi(val, 10, 1, 100);
        if (auto val = std::getenv("PUBLIC_BASE_PATH")) config.publicBasePath = val;
        if (auto val = std::getenv("ENFORCE_SIGNATURE_CHECK")) {
            config.enforceSignatureCheck = imghost::utils::parseBool(val, true);
        }

        if (auto val = std::getenv("LOG_LEVEL")) config.logLevel = val;
        if (auto val = std::getenv("LOG_TO_FILE")) config.logToFile = imghost::utils::parseBool(val, true);
        config.logFile = config.logDir + "/image-service.log";
        if (auto val = std::getenv("LOG_FILE")) config.logFile = val;

        return config;
    }

    void validateRequiredCredentials() const {
        if (dbPassword.empty()) {
            throw common::ConfigException("DB_PASSWORD environment variable not set");
        }
        spdlog::info("All required credentials loaded from environment");
    }

    int64_t maxFileSizeBytes() const {
        return static_cast<int64_t>(maxFileSizeMB) * 1024 * 1024;
    }

    /**
     * @brief Largest request body accepted by the HTTP layer
     *
     * The file limit plus 64 KiB for multipart boundaries and part headers.
     */
    size_t maxRequestBodyBytes() const {
        return static_cast<size_t>(maxFileSizeBytes()) + 64 * 1024;
    }

    common::DbPoolConfig dbPoolConfig() const {
        common::DbPoolConfig pool;
        pool.host = dbHost;
        pool.port = dbPort;
        pool.database = dbName;
        pool.user = dbUser;
        pool.password = dbPassword;
        pool.minSize = static_cast<size_t>(dbPoolMin);
        pool.maxSize = static_cast<size_t>(dbPoolMax);
        pool.acquireTimeoutSec = dbPoolTimeoutSec;
        return pool;
    }
};
