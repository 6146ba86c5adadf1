/**
 * @file image_record.h
 * @brief Metadata row describing one stored image
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <json/json.h>

namespace domain {
namespace models {

/**
 * @brief One row of the images table
 *
 * Every field is assigned once at insertion and never updated.
 */
struct ImageRecord {
    int64_t id = 0;                 ///< Store-assigned primary key
    std::string filename;           ///< Storage name (32 hex chars + extension), unique
    std::string originalName;       ///< Sanitized client filename, display only
    int64_t size = 0;               ///< Stored byte length
    std::chrono::system_clock::time_point uploadTime;
    std::string fileType;           ///< "jpg", "png" or "gif"

    /**
     * @brief Size in KiB rounded to 2 decimals
     */
    double sizeKb() const;

    /**
     * @brief API representation
     * @param url Public URL of the stored file
     */
    Json::Value toJson(const std::string& url) const;
};

} // namespace models
} // namespace domain
