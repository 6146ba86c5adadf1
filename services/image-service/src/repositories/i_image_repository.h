/**
 * @file i_image_repository.h
 * @brief Metadata store interface for image records
 */

#pragma once

#include "../domain/models/image_record.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace repositories {

/**
 * @brief Persistent store of ImageRecord rows
 *
 * Every method throws common::DatabaseException when the store cannot be
 * reached or the statement fails. "Not found" is not an error.
 */
class IImageRepository {
public:
    virtual ~IImageRepository() = default;

    /**
     * @brief Create the images table and indexes if missing
     */
    virtual void ensureSchema() = 0;

    /**
     * @brief Insert a record; id and uploadTime are assigned by the store
     * @return Assigned id
     */
    virtual int64_t insert(const domain::models::ImageRecord& record) = 0;

    virtual std::optional<domain::models::ImageRecord> findById(int64_t id) = 0;

    /**
     * @brief Records ordered newest first (upload_time DESC, id DESC)
     */
    virtual std::vector<domain::models::ImageRecord> findPage(int limit, int64_t offset) = 0;

    virtual int64_t countAll() = 0;

    /**
     * @return true if a row was removed, false if no row had this id
     */
    virtual bool deleteById(int64_t id) = 0;
};

} // namespace repositories
