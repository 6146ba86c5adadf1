/**
 * @file pagination.cpp
 * @brief Pagination summary math
 */

#include "pagination.h"

namespace domain {
namespace models {

Pagination Pagination::compute(int page, int pageSize, int64_t totalItems) {
    Pagination p;
    p.currentPage = page;
    p.pageSize = pageSize;
    p.totalItems = totalItems < 0 ? 0 : totalItems;
    p.totalPages = (p.totalItems + pageSize - 1) / pageSize;
    p.hasPrev = page > 1;
    p.hasNext = page < p.totalPages;
    return p;
}

Json::Value Pagination::toJson() const {
    Json::Value json;
    json["current_page"] = currentPage;
    json["page_size"] = pageSize;
    json["total_pages"] = static_cast<Json::Int64>(totalPages);
    json["total_items"] = static_cast<Json::Int64>(totalItems);
    json["has_prev"] = hasPrev;
    json["has_next"] = hasNext;
    return json;
}

} // namespace models
} // namespace domain
