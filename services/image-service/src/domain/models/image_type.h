/**
 * @file image_type.h
 * @brief Supported image formats and magic-byte classification
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace domain {
namespace models {

/**
 * @brief Closed set of accepted image formats
 */
enum class ImageType {
    JPG,
    PNG,
    GIF,
    UNKNOWN
};

/**
 * @brief Classify content by its leading signature bytes
 *
 * - JPG: FF D8 FF
 * - PNG: 89 50 4E 47 0D 0A 1A 0A
 * - GIF: "GIF87a" or "GIF89a"
 *
 * @return UNKNOWN for any other (or too short) content
 */
ImageType detectImageType(const uint8_t* data, size_t len);
ImageType detectImageType(const std::vector<uint8_t>& content);

/**
 * @brief Cheap structural sanity check behind a recognized signature
 *
 * - PNG: an IHDR chunk of length 13 directly follows the signature
 * - JPG: content ends with the EOI marker FF D9
 * - GIF: content ends with the trailer byte 0x3B
 *
 * Trailing NUL padding is ignored for JPG and GIF. Always false for UNKNOWN.
 */
bool hasValidStructure(ImageType type, const uint8_t* data, size_t len);

/**
 * @brief Map a filename's extension (case-insensitive) to a type
 *
 * jpg/jpeg -> JPG, png -> PNG, gif -> GIF; anything else, or no extension, -> UNKNOWN
 */
ImageType imageTypeFromExtension(const std::string& filename);

/**
 * @brief Map a declared MIME type to a type
 *
 * Parameters after ';' and letter case are ignored.
 * image/jpeg, image/jpg, image/pjpeg -> JPG; image/png -> PNG; image/gif -> GIF
 */
ImageType imageTypeFromContentType(const std::string& contentType);

/**
 * @brief Normalized extension stored in file_type ("jpg", "png", "gif", "" for UNKNOWN)
 */
std::string toExtension(ImageType type);

/**
 * @brief MIME type served for the type (application/octet-stream for UNKNOWN)
 */
std::string toContentType(ImageType type);

} // namespace models
} // namespace domain
