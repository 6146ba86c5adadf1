/**
 * @file image_repository.h
 * @brief PostgreSQL-backed image metadata repository
 *
 * All statements are parameterized and run through IQueryExecutor.
 */

#pragma once

#include "i_image_repository.h"
#include "i_query_executor.h"

#include <json/json.h>

namespace repositories {

class ImageRepository : public IImageRepository {
public:
    /**
     * @param queryExecutor Query executor (non-owning)
     * @throws std::invalid_argument if queryExecutor is nullptr
     */
    explicit ImageRepository(common::IQueryExecutor* queryExecutor);

    ~ImageRepository() override = default;

    ImageRepository(const ImageRepository&) = delete;
    ImageRepository& operator=(const ImageRepository&) = delete;

    void ensureSchema() override;

    int64_t insert(const domain::models::ImageRecord& record) override;

    std::optional<domain::models::ImageRecord> findById(int64_t id) override;

    std::vector<domain::models::ImageRecord> findPage(int limit, int64_t offset) override;

    int64_t countAll() override;

    bool deleteById(int64_t id) override;

private:
    /**
     * @brief Map one result row to a domain record
     * @throws common::DatabaseException on an unparseable upload_time
     */
    static domain::models::ImageRecord rowToRecord(const Json::Value& row);

    common::IQueryExecutor* queryExecutor_;
};

} // namespace repositories
