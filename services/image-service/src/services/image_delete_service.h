#pragma once

#include "../common/error_codes.h"
#include "../domain/ports/i_file_storage.h"
#include "../repositories/i_image_repository.h"

#include <cstdint>
#include <string>

/**
 * @file image_delete_service.h
 * @brief Deletion of a stored image and its metadata
 *
 * The row is deleted first, then the file. A file that cannot be removed is
 * logged and left behind; the row delete is never rolled back.
 */

namespace services {

struct DeleteResult {
    bool success = false;
    bool fileRemoved = false;   ///< false when the file was already gone or could not be removed
    common::ErrorCode errorCode = common::ErrorCode::SUCCESS;
    std::string message;
};

class ImageDeleteService {
public:
    /**
     * @param imageRepo Metadata repository (non-owning)
     * @param storage File store (non-owning)
     * @throws std::invalid_argument if either is nullptr
     */
    ImageDeleteService(repositories::IImageRepository* imageRepo,
                       domain::ports::IFileStorage* storage);

    DeleteResult remove(int64_t id);

private:
    repositories::IImageRepository* imageRepo_;
    domain::ports::IFileStorage* storage_;
};

} // namespace services
