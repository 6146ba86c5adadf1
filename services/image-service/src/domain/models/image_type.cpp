/**
 * @file image_type.cpp
 * @brief Image format classification
 */

#include "image_type.h"

#include <imghost/utils/string_utils.h>

#include <cstring>

namespace domain {
namespace models {

namespace {

constexpr uint8_t kJpegMagic[] = {0xFF, 0xD8, 0xFF};
constexpr uint8_t kPngMagic[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr char kGif87a[] = "GIF87a";
constexpr char kGif89a[] = "GIF89a";
constexpr size_t kGifMagicLen = 6;

bool hasPrefix(const uint8_t* data, size_t len, const void* magic, size_t magicLen) {
    return len >= magicLen && std::memcmp(data, magic, magicLen) == 0;
}

} // namespace

ImageType detectImageType(const uint8_t* data, size_t len) {
    if (!data) {
        return ImageType::UNKNOWN;
    }
    if (hasPrefix(data, len, kJpegMagic, sizeof(kJpegMagic))) {
        return ImageType::JPG;
    }
    if (hasPrefix(data, len, kPngMagic, sizeof(kPngMagic))) {
        return ImageType::PNG;
    }
    if (hasPrefix(data, len, kGif87a, kGifMagicLen) || hasPrefix(data, len, kGif89a, kGifMagicLen)) {
        return ImageType::GIF;
    }
    return ImageType::UNKNOWN;
}

ImageType detectImageType(const std::vector<uint8_t>& content) {
    return detectImageType(content.data(), content.size());
}

bool hasValidStructure(ImageType type, const uint8_t* data, size_t len) {
    if (!data) {
        return false;
    }

    if (type == ImageType::PNG) {
        constexpr uint8_t kIhdr[] = {0x00, 0x00, 0x00, 0x0D, 'I', 'H', 'D', 'R'};
        constexpr size_t kMinPngLen = sizeof(kPngMagic) + sizeof(kIhdr) + 13 + 4;
        return len >= kMinPngLen && std::memcmp(data + sizeof(kPngMagic), kIhdr, sizeof(kIhdr)) == 0;
    }

    while (len > 0 && data[len - 1] == 0x00) {
        --len;
    }
    switch (type) {
        case ImageType::JPG:
            return len >= sizeof(kJpegMagic) + 2 && data[len - 2] == 0xFF && data[len - 1] == 0xD9;
        case ImageType::GIF:
            return len > kGifMagicLen && data[len - 1] == 0x3B;
        default:
            return false;
    }
}

ImageType imageTypeFromExtension(const std::string& filename) {
    const std::string ext = imghost::utils::fileExtension(filename);
    if (ext == "jpg" || ext == "jpeg") return ImageType::JPG;
    if (ext == "png") return ImageType::PNG;
    if (ext == "gif") return ImageType::GIF;
    return ImageType::UNKNOWN;
}

ImageType imageTypeFromContentType(const std::string& contentType) {
    const std::string mime = imghost::utils::toLower(
        imghost::utils::trim(imghost::utils::split(contentType, ';').front()));
    if (mime == "image/jpeg" || mime == "image/jpg" || mime == "image/pjpeg") return ImageType::JPG;
    if (mime == "image/png") return ImageType::PNG;
    if (mime == "image/gif") return ImageType::GIF;
    return ImageType::UNKNOWN;
}

std::string toExtension(ImageType type) {
    switch (type) {
        case ImageType::JPG: return "jpg";
        case ImageType::PNG: return "png";
        case ImageType::GIF: return "gif";
        default: return "";
    }
}

std::string toContentType(ImageType type) {
    switch (type) {
        case ImageType::JPG: return "image/jpeg";
        case ImageType::PNG: return "image/png";
        case ImageType::GIF: return "image/gif";
        default: return "application/octet-stream";
    }
}

} // namespace models
} // namespace domain
