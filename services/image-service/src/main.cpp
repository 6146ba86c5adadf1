/**
 * @file main.cpp
 * @brief Image Service - self-hosted image upload and hosting
 *
 * Accepts JPEG/PNG/GIF uploads over HTTP, stores them on local disk,
 * records metadata in PostgreSQL, and serves listings, deletions and the
 * image bytes themselves.
 *
 * @date 2026-10-19
 * @version 1.0.0
 */

#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>

#include "logging/logger.h"
#include "i_query_executor.h"
#include "db_connection_pool.h"

#include <imghost/utils/time_utils.h>

#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"
#include "handlers/health_handler.h"
#include "handlers/image_handler.h"

namespace {

void printBanner() {
    std::cout << R"(
  ___                              ____                  _
 |_ _|_ __ ___   __ _  __ _  ___  / ___|  ___ _ ____   _(_) ___ ___
  | || '_ ` _ \ / _` |/ _` |/ _ \ \___ \ / _ \ '__\ \ / / |/ __/ _ \
  | || | | | | | (_| | (_| |  __/  ___) |  __/ |   \ V /| | (_|  __/
 |___|_| |_| |_|\__,_|\__, |\___| |____/ \___|_|    \_/ |_|\___\___|
                      |___/
)" << std::endl;
    std::cout << "  Image Service - upload, list and serve images" << std::endl;
    std::cout << "  Version: 1.0.0" << std::endl;
    std::cout << std::endl;
}

/**
 * @brief Make sure a directory exists before something writes into it
 */
bool ensureDirectory(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        std::cerr << "Cannot create directory " << path << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

/**
 * @brief Database health: round-trip time, server version and pool occupancy
 */
Json::Value checkDatabase(common::IQueryExecutor* executor, const common::DbConnectionPool* pool) {
    Json::Value result;
    result["name"] = "database";

    auto stats = pool->getStats();
    Json::Value poolJson;
    poolJson["available"] = static_cast<Json::UInt64>(stats.availableConnections);
    poolJson["total"] = static_cast<Json::UInt64>(stats.totalConnections);
    poolJson["max"] = static_cast<Json::UInt64>(stats.maxConnections);
    result["pool"] = poolJson;

    auto start = std::chrono::steady_clock::now();
    try {
        Json::Value version = executor->executeScalar("SELECT version()");
        result["status"] = "UP";
        result["responseTimeMs"] = static_cast<Json::Int64>(imghost::utils::elapsedMillis(start));
        result["version"] = version.asString();
    } catch (const std::exception& e) {
        spdlog::warn("Database health check failed: {}", e.what());
        result["status"] = "DOWN";
        result["responseTimeMs"] = static_cast<Json::Int64>(imghost::utils::elapsedMillis(start));
        result["error"] = "Database unavailable";
    }
    return result;
}

} // anonymous namespace

/**
 * @brief Main entry point
 */
int main(int /* argc */, char* /* argv */[]) {
    printBanner();

    AppConfig config = AppConfig::fromEnvironment();

    if (config.logToFile && !ensureDirectory(config.logDir)) {
        return 1;
    }
    common::Logger::initialize("image-service", config.logLevel, config.logToFile, config.logFile);

    spdlog::info("Starting Image Service...");
    spdlog::info("Upload directory: {}, max file size: {} MB, signature check: {}",
                 config.uploadDir, config.maxFileSizeMB, config.enforceSignatureCheck ? "on" : "off");

    try {
        config.validateRequiredCredentials();
    } catch (const common::ConfigException& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    auto container = std::make_unique<infrastructure::ServiceContainer>();
    if (!container->initialize(config)) {
        spdlog::critical("Startup aborted: dependencies failed to initialize");
        return 1;
    }

    // Startup connection test
    Json::Value dbStatus = checkDatabase(container->queryExecutor(), container->dbPool());
    if (dbStatus["status"].asString() != "UP") {
        spdlog::critical("Startup aborted: database connection test failed");
        return 1;
    }
    spdlog::info("Connected to {}", dbStatus["version"].asString());

    try {
        auto& app = drogon::app();

        app.setLogPath(ensureDirectory(config.logDir) ? config.logDir : "")
           .setLogLevel(trantor::Logger::kInfo)
           .addListener("0.0.0.0", config.serverPort)
           .setThreadNum(config.threadNum)
           .setClientMaxBodySize(config.maxRequestBodyBytes())
           .setClientMaxMemoryBodySize(config.maxRequestBodyBytes());

        // Enable CORS
        app.registerPreSendingAdvice([](const drogon::HttpRequestPtr& /* req */,
                                        const drogon::HttpResponsePtr& resp) {
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
        });

        // Handle OPTIONS requests for CORS preflight
        app.registerHandler(
            "/{path}",
            [](const drogon::HttpRequestPtr& /* req */,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& /* path */) {
                auto resp = drogon::HttpResponse::newHttpResponse();
                resp->setStatusCode(drogon::k204NoContent);
                callback(resp);
            },
            {drogon::Options}
        );

        common::IQueryExecutor* executor = container->queryExecutor();
        const common::DbConnectionPool* pool = container->dbPool();
        handlers::HealthHandler healthHandler(
            [executor, pool]() { return checkDatabase(executor, pool); },
            []() { return imghost::utils::getCurrentIso8601(); });
        healthHandler.registerRoutes(app);

        handlers::ImageHandler imageHandler(
            container->uploadService(),
            container->imageListService(),
            container->imageDeleteService(),
            container->fileStorage(),
            config.maxRequestBodyBytes());
        imageHandler.registerRoutes(app);

        spdlog::info("Server starting on http://0.0.0.0:{}", config.serverPort);
        app.run();

    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        return 1;
    }

    container->shutdown();
    spdlog::info("Server stopped");
    common::Logger::flush();
    return 0;
}
