#pragma once

/**
 * @file service_container.h
 * @brief Centralized service container for Image Service dependency management
 *
 * Owns the connection pool, query executor, file store, repository and
 * services. Provides non-owning pointer accessors for handler construction.
 */

#include <memory>

struct AppConfig;

// Forward declarations - Infrastructure
namespace common {
    class DbConnectionPool;
    class IQueryExecutor;
}

namespace domain::ports {
    class IFileStorage;
}

// Forward declarations - Repositories
namespace repositories {
    class IImageRepository;
}

// Forward declarations - Services
namespace services {
    class ImageValidator;
    class UploadService;
    class ImageListService;
    class ImageDeleteService;
}

namespace infrastructure {

class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     *
     * Opens the pool, bootstraps the schema, prepares the upload directory
     * (sweeping stale temp files) and wires the services.
     *
     * @param config Application configuration
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    // --- Infrastructure Accessors ---
    common::DbConnectionPool* dbPool() const;
    common::IQueryExecutor* queryExecutor() const;
    domain::ports::IFileStorage* fileStorage() const;

    // --- Service Accessors ---
    services::UploadService* uploadService() const;
    services::ImageListService* imageListService() const;
    services::ImageDeleteService* imageDeleteService() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure
