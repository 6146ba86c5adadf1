#include "upload_service.h"
#include "public_url.h"
#include "exception/exceptions.h"

#include <imghost/utils/string_utils.h>

#include <spdlog/spdlog.h>
#include <uuid/uuid.h>

#include <stdexcept>

namespace services {

namespace {

constexpr size_t kMaxOriginalNameBytes = 255;

UploadResult failure(common::ErrorCode code, const std::string& message) {
    UploadResult result;
    result.errorCode = code;
    result.message = message;
    return result;
}

} // namespace

UploadService::UploadService(const ImageValidator* validator,
                             domain::ports::IFileStorage* storage,
                             repositories::IImageRepository* imageRepo,
                             std::string publicBasePath)
    : validator_(validator)
    , storage_(storage)
    , imageRepo_(imageRepo)
    , publicBasePath_(std::move(publicBasePath))
{
    if (!validator_ || !storage_ || !imageRepo_) {
        throw std::invalid_argument("UploadService: dependencies cannot be nullptr");
    }
}

std::string UploadService::generateStorageName(domain::models::ImageType type) {
    uuid_t uuid;
    uuid_generate_random(uuid);
    return imghost::utils::bytesToHex(uuid, sizeof(uuid)) + "." + domain::models::toExtension(type);
}

UploadResult UploadService::upload(const std::vector<uint8_t>& content,
                                   const std::string& originalName,
                                   int64_t declaredSize,
                                   const std::string& declaredContentType)
{
    const std::string displayName = imghost::utils::sanitizeFilename(originalName, kMaxOriginalNameBytes);
    if (displayName.empty()) {
        spdlog::warn("[UploadService] Rejected upload without a usable filename");
        return failure(common::ErrorCode::VALIDATION_MISSING_FILENAME, "Filename is missing");
    }

    // Step 1: Validate (no side effects on rejection)
    UploadCandidate candidate;
    candidate.fileName = displayName;
    candidate.declaredContentType = declaredContentType;
    candidate.declaredSize = declaredSize;
    candidate.content = &content;

    ValidationResult validation = validator_->validate(candidate);
    if (!validation.valid) {
        spdlog::warn("[UploadService] Rejected {} ({} bytes): {} - {}",
                     displayName, content.size(),
                     common::errorCodeToString(validation.errorCode), validation.message);
        return failure(validation.errorCode, validation.message);
    }

    // Step 2: Assign storage name
    domain::models::ImageRecord record;
    record.filename = generateStorageName(validation.detectedType);
    record.originalName = displayName;
    record.size = static_cast<int64_t>(content.size());
    record.fileType = domain::models::toExtension(validation.detectedType);

    // Step 3: Publish file
    try {
        storage_->write(record.filename, content);
    } catch (const std::exception& e) {
        spdlog::error("[UploadService] File write failed for {} ({}): {}",
                      record.filename, displayName, e.what());
        return failure(common::ErrorCode::STORAGE_WRITE_FAILED, "Uploading file error");
    }

    // Step 4: Record metadata, compensating the file write on failure
    try {
        record.id = imageRepo_->insert(record);
    } catch (const std::exception& e) {
        spdlog::error("[UploadService] Metadata insert failed for {}: {}", record.filename, e.what());
        try {
            if (storage_->remove(record.filename) == domain::ports::IFileStorage::RemoveOutcome::REMOVED) {
                spdlog::info("[UploadService] Removed {} after failed insert", record.filename);
            } else {
                spdlog::warn("[UploadService] {} already gone after failed insert", record.filename);
            }
        } catch (const std::exception& cleanupError) {
            spdlog::error("[UploadService] Orphan file {} left after failed insert: {}",
                          record.filename, cleanupError.what());
        }
        return failure(common::ErrorCode::METADATA_WRITE_FAILED, "Uploading file error");
    }

    UploadResult result;
    result.success = true;
    result.id = record.id;
    result.filename = record.filename;
    result.url = buildPublicUrl(publicBasePath_, record.filename);
    result.message = "File successfully uploaded.";

    spdlog::info("[UploadService] Stored {} as {} (id={}, {} bytes)",
                 displayName, record.filename, record.id, record.size);
    return result;
}

} // namespace services
