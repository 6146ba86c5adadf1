#pragma once

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>
#include <string>
#include <utility>

namespace handlers {

/**
 * @brief Health check endpoints handler
 *
 * - GET /api/health          - service liveness
 * - GET /api/health/database - database connectivity (503 when down)
 *
 * Checks are injected as std::function so the handler does not depend on
 * the connection pool directly.
 */
class HealthHandler {
public:
    /**
     * @param checkDatabase Returns {"name","status","responseTimeMs","version"}; status "UP" when healthy
     * @param getCurrentTimestamp Returns the current ISO 8601 timestamp
     * @throws std::invalid_argument if either function is empty
     */
    HealthHandler(std::function<Json::Value()> checkDatabase,
                  std::function<std::string()> getCurrentTimestamp);

    void registerRoutes(drogon::HttpAppFramework& app);

    /**
     * @brief Body of GET /api/health
     */
    Json::Value serviceHealth() const;

    /**
     * @brief Body and HTTP status of GET /api/health/database
     */
    std::pair<Json::Value, int> databaseHealth() const;

private:
    std::function<Json::Value()> checkDatabase_;
    std::function<std::string()> getCurrentTimestamp_;
};

} // namespace handlers
