/**
 * @file image_record.cpp
 * @brief ImageRecord JSON mapping
 */

#include "image_record.h"

#include <imghost/utils/time_utils.h>

#include <cmath>

namespace domain {
namespace models {

double ImageRecord::sizeKb() const {
    return std::round(static_cast<double>(size) / 1024.0 * 100.0) / 100.0;
}

Json::Value ImageRecord::toJson(const std::string& url) const {
    Json::Value json;
    json["id"] = static_cast<Json::Int64>(id);
    json["filename"] = filename;
    json["original_name"] = originalName;
    json["size"] = static_cast<Json::Int64>(size);
    json["size_kb"] = sizeKb();
    json["upload_time"] = imghost::utils::formatIso8601(uploadTime);
    json["file_type"] = fileType;
    json["url"] = url;
    return json;
}

} // namespace models
} // namespace domain
