#include "image_repository.h"
#include "query_helpers.h"
#include "exception/exceptions.h"

#include <imghost/utils/time_utils.h>

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

namespace {

// upload_time is stored as UTC wall-clock time; ::text yields "YYYY-MM-DD HH:MM:SS[.ffffff]"
const char* const kSelectColumns =
    "SELECT id, filename, original_name, size, upload_time::text AS upload_time, file_type "
    "FROM images ";

const char* const kSchemaStatements[] = {
    "CREATE TABLE IF NOT EXISTS images ("
    "id SERIAL PRIMARY KEY, "
    "filename TEXT NOT NULL, "
    "original_name TEXT NOT NULL, "
    "size INTEGER NOT NULL, "
    "upload_time TIMESTAMP NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC'), "
    "file_type TEXT NOT NULL)",
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_images_filename ON images (filename)",
    "CREATE INDEX IF NOT EXISTS idx_images_upload_time ON images (upload_time DESC, id DESC)",
};

} // namespace

// ============================================================================
// Constructor
// ============================================================================

ImageRepository::ImageRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("ImageRepository: queryExecutor cannot be nullptr");
    }
    spdlog::debug("[ImageRepository] Initialized (DB type: {})", queryExecutor_->getDatabaseType());
}

// ============================================================================
// Schema
// ============================================================================

void ImageRepository::ensureSchema()
{
    for (const char* statement : kSchemaStatements) {
        try {
            queryExecutor_->executeCommand(statement);
        } catch (const common::DatabaseException& e) {
            spdlog::error("[ImageRepository] Schema bootstrap failed: {}", e.what());
            throw;
        }
    }
    spdlog::info("[ImageRepository] Schema ready (table: images)");
}

// ============================================================================
// CRUD Operations
// ============================================================================

int64_t ImageRepository::insert(const domain::models::ImageRecord& record)
{
    spdlog::debug("[ImageRepository] Inserting image: {}", record.filename);

    const char* query =
        "INSERT INTO images (filename, original_name, size, upload_time, file_type) "
        "VALUES ($1, $2, $3, NOW() AT TIME ZONE 'UTC', $4) RETURNING id";

    std::vector<std::string> params = {
        record.filename,
        record.originalName,
        std::to_string(record.size),
        record.fileType
    };

    try {
        Json::Value rows = queryExecutor_->executeQuery(query, params);
        if (rows.empty()) {
            throw common::DatabaseException("INSERT returned no id");
        }
        int64_t id = common::db::getInt64(rows[0], "id", 0);
        if (id <= 0) {
            throw common::DatabaseException("INSERT returned an invalid id");
        }
        spdlog::info("[ImageRepository] Image inserted: {} (id={})", record.filename, id);
        return id;
    } catch (const common::DatabaseException& e) {
        spdlog::error("[ImageRepository] Insert failed for {}: {}", record.filename, e.what());
        throw;
    }
}

std::optional<domain::models::ImageRecord> ImageRepository::findById(int64_t id)
{
    std::string query = std::string(kSelectColumns) + "WHERE id = $1";

    try {
        Json::Value rows = queryExecutor_->executeQuery(query, {std::to_string(id)});
        if (rows.empty()) {
            spdlog::debug("[ImageRepository] Image not found: id={}", id);
            return std::nullopt;
        }
        return rowToRecord(rows[0]);
    } catch (const common::DatabaseException& e) {
        spdlog::error("[ImageRepository] Find by id={} failed: {}", id, e.what());
        throw;
    }
}

std::vector<domain::models::ImageRecord> ImageRepository::findPage(int limit, int64_t offset)
{
    spdlog::debug("[ImageRepository] Finding page (limit: {}, offset: {})", limit, offset);

    std::string query = std::string(kSelectColumns) +
        "ORDER BY upload_time DESC, id DESC LIMIT $1 OFFSET $2";

    try {
        Json::Value rows = queryExecutor_->executeQuery(
            query, {std::to_string(limit), std::to_string(offset)});

        std::vector<domain::models::ImageRecord> records;
        records.reserve(rows.size());
        for (const auto& row : rows) {
            records.push_back(rowToRecord(row));
        }
        return records;
    } catch (const common::DatabaseException& e) {
        spdlog::error("[ImageRepository] Find page failed: {}", e.what());
        throw;
    }
}

int64_t ImageRepository::countAll()
{
    try {
        Json::Value count = queryExecutor_->executeScalar("SELECT COUNT(*) FROM images");
        return common::db::scalarToInt64(count, 0);
    } catch (const common::DatabaseException& e) {
        spdlog::error("[ImageRepository] Count failed: {}", e.what());
        throw;
    }
}

bool ImageRepository::deleteById(int64_t id)
{
    try {
        int affected = queryExecutor_->executeCommand(
            "DELETE FROM images WHERE id = $1", {std::to_string(id)});
        spdlog::debug("[ImageRepository] Delete id={} affected {} rows", id, affected);
        return affected > 0;
    } catch (const common::DatabaseException& e) {
        spdlog::error("[ImageRepository] Delete id={} failed: {}", id, e.what());
        throw;
    }
}

// ============================================================================
// Row mapping
// ============================================================================

domain::models::ImageRecord ImageRepository::rowToRecord(const Json::Value& row)
{
    domain::models::ImageRecord record;
    record.id = common::db::getInt64(row, "id");
    record.filename = common::db::getString(row, "filename");
    record.originalName = common::db::getString(row, "original_name");
    record.size = common::db::getInt64(row, "size");
    record.fileType = common::db::getString(row, "file_type");

    const std::string uploadTime = common::db::getString(row, "upload_time");
    auto parsed = imghost::utils::parseTimestamp(uploadTime);
    if (!parsed) {
        throw common::DatabaseException("unparseable upload_time '" + uploadTime +
                                        "' for id " + std::to_string(record.id));
    }
    record.uploadTime = *parsed;
    return record;
}

} // namespace repositories
