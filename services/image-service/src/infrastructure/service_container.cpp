/**
 * @file service_container.cpp
 * @brief Image Service ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"

#include <spdlog/spdlog.h>
#include <chrono>

// Infrastructure
#include "db_connection_pool.h"
#include "postgresql_query_executor.h"
#include "../adapters/local_file_storage.h"

// Repositories
#include "../repositories/image_repository.h"

// Services
#include "../services/image_validator.h"
#include "../services/upload_service.h"
#include "../services/image_list_service.h"
#include "../services/image_delete_service.h"

namespace infrastructure {

namespace {

// A temp file this old cannot belong to an upload still in progress
constexpr std::chrono::hours kStaleTempFileAge{1};

} // namespace

struct ServiceContainer::Impl {
    // Infrastructure
    std::unique_ptr<common::DbConnectionPool> dbPool;
    std::unique_ptr<common::IQueryExecutor> queryExecutor;
    std::unique_ptr<adapters::LocalFileStorage> fileStorage;

    // Repositories
    std::unique_ptr<repositories::ImageRepository> imageRepo;

    // Services
    std::unique_ptr<services::ImageValidator> imageValidator;
    std::unique_ptr<services::UploadService> uploadService;
    std::unique_ptr<services::ImageListService> imageListService;
    std::unique_ptr<services::ImageDeleteService> imageDeleteService;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("Initializing Image Service dependencies...");

    try {
        // Step 1: Database connection pool
        common::DbPoolConfig poolConfig = config.dbPoolConfig();
        spdlog::info("Database: {}", poolConfig.describe());
        impl_->dbPool = std::make_unique<common::DbConnectionPool>(
            poolConfig.buildConnString(),
            poolConfig.minSize,
            poolConfig.maxSize,
            poolConfig.acquireTimeoutSec);
        if (!impl_->dbPool->initialize()) {
            spdlog::critical("Failed to initialize database connection pool");
            return false;
        }

        // Step 2: Query Executor
        impl_->queryExecutor = std::make_unique<common::PostgreSQLQueryExecutor>(impl_->dbPool.get());
        spdlog::info("Query Executor initialized (DB type: {})", impl_->queryExecutor->getDatabaseType());

        // Step 3: Repository + schema
        impl_->imageRepo = std::make_unique<repositories::ImageRepository>(impl_->queryExecutor.get());
        impl_->imageRepo->ensureSchema();

        // Step 4: File store
        impl_->fileStorage = std::make_unique<adapters::LocalFileStorage>(config.uploadDir);
        impl_->fileStorage->sweepStaleTempFiles(kStaleTempFileAge);

        // Step 5: Services
        services::ImageValidator::Options validatorOptions;
        validatorOptions.maxFileSize = config.maxFileSizeBytes();
        validatorOptions.enforceSignatureCheck = config.enforceSignatureCheck;
        impl_->imageValidator = std::make_unique<services::ImageValidator>(validatorOptions);

        impl_->uploadService = std::make_unique<services::UploadService>(
            impl_->imageValidator.get(),
            impl_->fileStorage.get(),
            impl_->imageRepo.get(),
            config.publicBasePath);

        impl_->imageListService = std::make_unique<services::ImageListService>(
            impl_->imageRepo.get(),
            config.publicBasePath,
            config.pageSize);

        impl_->imageDeleteService = std::make_unique<services::ImageDeleteService>(
            impl_->imageRepo.get(),
            impl_->fileStorage.get());

        spdlog::info("All Image Service dependencies initialized successfully");
        return true;

    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize Image Service: {}", e.what());
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    // Delete in reverse order of initialization
    impl_->imageDeleteService.reset();
    impl_->imageListService.reset();
    impl_->uploadService.reset();
    impl_->imageValidator.reset();
    impl_->fileStorage.reset();
    impl_->imageRepo.reset();
    impl_->queryExecutor.reset();
    if (impl_->dbPool) {
        impl_->dbPool->shutdown();
        impl_->dbPool.reset();
    }
}

// --- Accessors ---

common::DbConnectionPool* ServiceContainer::dbPool() const { return impl_->dbPool.get(); }
common::IQueryExecutor* ServiceContainer::queryExecutor() const { return impl_->queryExecutor.get(); }
domain::ports::IFileStorage* ServiceContainer::fileStorage() const { return impl_->fileStorage.get(); }

services::UploadService* ServiceContainer::uploadService() const { return impl_->uploadService.get(); }
services::ImageListService* ServiceContainer::imageListService() const { return impl_->imageListService.get(); }
services::ImageDeleteService* ServiceContainer::imageDeleteService() const { return impl_->imageDeleteService.get(); }

} // namespace infrastructure
