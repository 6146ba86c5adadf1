/** @file health_handler.cpp
 *  @brief HealthHandler implementation
 */

#include "health_handler.h"
#include "handler_utils.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace handlers {

namespace {

constexpr const char* kServiceName = "image-service";
constexpr const char* kServiceVersion = "1.0.0";

} // namespace

HealthHandler::HealthHandler(std::function<Json::Value()> checkDatabase,
                             std::function<std::string()> getCurrentTimestamp)
    : checkDatabase_(std::move(checkDatabase)),
      getCurrentTimestamp_(std::move(getCurrentTimestamp)) {

    if (!checkDatabase_ || !getCurrentTimestamp_) {
        throw std::invalid_argument("HealthHandler: health check functions cannot be nullptr");
    }
    spdlog::info("[HealthHandler] Initialized");
}

void HealthHandler::registerRoutes(drogon::HttpAppFramework& app) {
    app.registerHandler(
        "/api/health",
        [this](const drogon::HttpRequestPtr& /* req */,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            callback(common::handler::jsonResponse(serviceHealth()));
        },
        {drogon::Get}
    );

    app.registerHandler(
        "/api/health/database",
        [this](const drogon::HttpRequestPtr& /* req */,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            spdlog::debug("GET /api/health/database");
            auto [body, status] = databaseHealth();
            callback(common::handler::jsonResponse(body, status));
        },
        {drogon::Get}
    );

    spdlog::info("[HealthHandler] Routes registered");
}

Json::Value HealthHandler::serviceHealth() const {
    Json::Value result;
    result["service"] = kServiceName;
    result["status"] = "UP";
    result["version"] = kServiceVersion;
    result["timestamp"] = getCurrentTimestamp_();
    return result;
}

std::pair<Json::Value, int> HealthHandler::databaseHealth() const {
    Json::Value result;
    try {
        result = checkDatabase_();
    } catch (const std::exception& e) {
        spdlog::error("[HealthHandler] Database check threw: {}", e.what());
        result["name"] = "database";
        result["status"] = "DOWN";
        result["error"] = "Database check failed";
    }
    const bool up = result["status"].asString() == "UP";
    return {result, up ? 200 : 503};
}

} // namespace handlers
