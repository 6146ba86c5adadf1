#pragma once

#include "image_validator.h"
#include "../common/error_codes.h"
#include "../domain/ports/i_file_storage.h"
#include "../repositories/i_image_repository.h"

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file upload_service.h
 * @brief Upload Service - image intake business logic
 *
 * Pipeline: sanitize name -> validate -> assign storage name -> atomic file
 * write -> metadata insert -> public URL.
 *
 * The file store and the metadata store are not updated atomically. A failed
 * insert is compensated by deleting the file that was just written.
 *
 * Does NOT handle:
 * - HTTP request/response (handler's job)
 * - SQL (repository's job)
 */

namespace services {

struct UploadResult {
    bool success = false;
    int64_t id = 0;
    std::string filename;       ///< Storage filename
    std::string url;            ///< Public URL
    common::ErrorCode errorCode = common::ErrorCode::SUCCESS;
    std::string message;
};

class UploadService {
public:
    /**
     * @brief Constructor with Dependency Injection
     * @param validator Image validator (non-owning)
     * @param storage File store (non-owning)
     * @param imageRepo Metadata repository (non-owning)
     * @param publicBasePath URL prefix for stored files (e.g., "/images")
     * @throws std::invalid_argument if any pointer is nullptr
     */
    UploadService(const ImageValidator* validator,
                  domain::ports::IFileStorage* storage,
                  repositories::IImageRepository* imageRepo,
                  std::string publicBasePath);

    ~UploadService() = default;

    /**
     * @brief Validate and persist one image
     *
     * @param content File bytes
     * @param originalName Client-supplied filename
     * @param declaredSize Size the client announced (0 if unknown)
     * @param declaredContentType Part Content-Type (may be empty)
     */
    UploadResult upload(const std::vector<uint8_t>& content,
                        const std::string& originalName,
                        int64_t declaredSize,
                        const std::string& declaredContentType = "");

    /**
     * @brief Fresh storage filename: 32 lowercase hex chars + "." + extension
     */
    static std::string generateStorageName(domain::models::ImageType type);

private:
    const ImageValidator* validator_;
    domain::ports::IFileStorage* storage_;
    repositories::IImageRepository* imageRepo_;
    std::string publicBasePath_;
};

} // namespace services
