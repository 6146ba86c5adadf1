#include "image_delete_service.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace services {

namespace {

DeleteResult failure(common::ErrorCode code, const std::string& message) {
    DeleteResult result;
    result.errorCode = code;
    result.message = message;
    return result;
}

} // namespace

ImageDeleteService::ImageDeleteService(repositories::IImageRepository* imageRepo,
                                       domain::ports::IFileStorage* storage)
    : imageRepo_(imageRepo)
    , storage_(storage)
{
    if (!imageRepo_ || !storage_) {
        throw std::invalid_argument("ImageDeleteService: dependencies cannot be nullptr");
    }
}

DeleteResult ImageDeleteService::remove(int64_t id) {
    // Step 1: Lookup
    std::optional<domain::models::ImageRecord> record;
    try {
        record = imageRepo_->findById(id);
    } catch (const std::exception& e) {
        spdlog::error("[ImageDeleteService] Lookup of id={} failed: {}", id, e.what());
        return failure(common::ErrorCode::METADATA_READ_FAILED,
                       "Image " + std::to_string(id) + " could not be deleted");
    }
    if (!record) {
        return failure(common::ErrorCode::IMAGE_NOT_FOUND, "Not found");
    }

    // Step 2: Row delete
    try {
        if (!imageRepo_->deleteById(id)) {
            // Lost a race with a concurrent delete
            spdlog::info("[ImageDeleteService] id={} was deleted concurrently", id);
            return failure(common::ErrorCode::IMAGE_NOT_FOUND, "Not found");
        }
    } catch (const std::exception& e) {
        spdlog::error("[ImageDeleteService] Row delete for id={} ({}) failed: {}",
                      id, record->filename, e.what());
        return failure(common::ErrorCode::METADATA_DELETE_FAILED,
                       "Image " + std::to_string(id) + " could not be deleted");
    }

    // Step 3: File delete, best effort
    DeleteResult result;
    result.success = true;
    result.message = "Image " + std::to_string(id) + " deleted";
    try {
        if (storage_->remove(record->filename) == domain::ports::IFileStorage::RemoveOutcome::REMOVED) {
            result.fileRemoved = true;
        } else {
            spdlog::warn("[ImageDeleteService] File {} for id={} was already missing", record->filename, id);
        }
    } catch (const std::exception& e) {
        spdlog::error("[ImageDeleteService] File {} for id={} left orphaned: {}", record->filename, id, e.what());
    }

    spdlog::info("[ImageDeleteService] Deleted id={} ({})", id, record->filename);
    return result;
}

} // namespace services
