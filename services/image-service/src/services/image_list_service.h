#pragma once

#include "../common/error_codes.h"
#include "../domain/models/image_record.h"
#include "../domain/models/pagination.h"
#include "../repositories/i_image_repository.h"

#include <string>
#include <vector>
#include <json/json.h>

/**
 * @file image_list_service.h
 * @brief Paginated listing of stored images
 */

namespace services {

struct ListResult {
    bool success = false;
    std::vector<domain::models::ImageRecord> records;
    domain::models::Pagination pagination;
    common::ErrorCode errorCode = common::ErrorCode::SUCCESS;
    std::string message;
};

/**
 * @brief Page/offset listing over the metadata store, newest first
 */
class ImageListService {
public:
    static constexpr int kMaxPageSize = 100;

    /**
     * @param imageRepo Metadata repository (non-owning)
     * @param publicBasePath URL prefix for record URLs
     * @param defaultPageSize Used when a caller passes pageSize < 1
     * @throws std::invalid_argument if imageRepo is nullptr
     */
    ImageListService(repositories::IImageRepository* imageRepo,
                     std::string publicBasePath,
                     int defaultPageSize = 10);

    /**
     * @brief Fetch one page
     *
     * page < 1 is treated as 1; pageSize is clamped to [1, 100] with values
     * below 1 replaced by the default. A page past the end yields an empty
     * record list with accurate totals.
     */
    ListResult list(int page, int pageSize = 0);

    /**
     * @brief API body: {status, page, pagination, data}
     */
    Json::Value toJson(const ListResult& result) const;

private:
    repositories::IImageRepository* imageRepo_;
    std::string publicBasePath_;
    int defaultPageSize_;
};

} // namespace services
