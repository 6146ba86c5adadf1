/**
 * @file public_url.h
 * @brief Public URL construction for stored images
 */

#pragma once

#include <string>

namespace services {

/**
 * @brief Join a URL prefix and a storage filename with exactly one slash
 *
 * buildPublicUrl("/images", "a.png")  -> "/images/a.png"
 * buildPublicUrl("/images/", "a.png") -> "/images/a.png"
 * buildPublicUrl("", "a.png")         -> "/a.png"
 */
std::string buildPublicUrl(const std::string& basePath, const std::string& filename);

} // namespace services
