#include "image_list_service.h"
#include "public_url.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace services {

ImageListService::ImageListService(repositories::IImageRepository* imageRepo,
                                   std::string publicBasePath,
                                   int defaultPageSize)
    : imageRepo_(imageRepo)
    , publicBasePath_(std::move(publicBasePath))
    , defaultPageSize_(std::clamp(defaultPageSize, 1, kMaxPageSize))
{
    if (!imageRepo_) {
        throw std::invalid_argument("ImageListService: imageRepo cannot be nullptr");
    }
}

ListResult ImageListService::list(int page, int pageSize) {
    const int effectivePage = std::max(page, 1);
    const int effectiveSize = pageSize < 1 ? defaultPageSize_ : std::min(pageSize, kMaxPageSize);

    ListResult result;
    try {
        const int64_t total = imageRepo_->countAll();
        result.pagination = domain::models::Pagination::compute(effectivePage, effectiveSize, total);

        if (result.pagination.offset() < total) {
            result.records = imageRepo_->findPage(effectiveSize, result.pagination.offset());
        }
    } catch (const std::exception& e) {
        spdlog::error("[ImageListService] Listing page {} failed: {}", effectivePage, e.what());
        result.errorCode = common::ErrorCode::METADATA_READ_FAILED;
        result.message = "Error getting image list";
        return result;
    }

    result.success = true;
    spdlog::debug("[ImageListService] Page {}/{}: {} records",
                  effectivePage, result.pagination.totalPages, result.records.size());
    return result;
}

Json::Value ImageListService::toJson(const ListResult& result) const {
    Json::Value json;
    json["status"] = "success";
    json["page"] = result.pagination.currentPage;
    json["pagination"] = result.pagination.toJson();

    Json::Value data(Json::arrayValue);
    for (const auto& record : result.records) {
        data.append(record.toJson(buildPublicUrl(publicBasePath_, record.filename)));
    }
    json["data"] = data;
    return json;
}

} // namespace services
