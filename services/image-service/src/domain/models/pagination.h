/**
 * @file pagination.h
 * @brief Page/offset pagination summary
 */

#pragma once

#include <cstdint>
#include <json/json.h>

namespace domain {
namespace models {

struct Pagination {
    int currentPage = 1;
    int pageSize = 10;
    int64_t totalItems = 0;
    int64_t totalPages = 0;
    bool hasPrev = false;
    bool hasNext = false;

    /**
     * @brief Derive the summary for a page
     *
     * totalPages = ceil(totalItems / pageSize); a page past the end keeps
     * its number and reports hasNext = false.
     *
     * @pre page >= 1, pageSize >= 1
     */
    static Pagination compute(int page, int pageSize, int64_t totalItems);

    /**
     * @brief Row offset of the first record on currentPage
     */
    int64_t offset() const {
        return static_cast<int64_t>(currentPage - 1) * pageSize;
    }

    Json::Value toJson() const;
};

} // namespace models
} // namespace domain
