#include "request_parsing.h"

#include <imghost/utils/string_utils.h>

#include <algorithm>
#include <cctype>
#include <limits>

namespace handlers {

std::optional<int64_t> parseContentLength(const std::string& header) {
    auto length = imghost::utils::parseInt64(imghost::utils::trim(header));
    if (!length || *length <= 0) {
        return std::nullopt;
    }
    return length;
}

std::optional<int> parsePageParam(const std::string& value) {
    const std::string trimmed = imghost::utils::trim(value);
    if (trimmed.empty()) {
        return 1;
    }
    auto page = imghost::utils::parseInt64(trimmed);
    if (!page) {
        // All-digit strings too long for int64 are still pages, just very far ones
        bool allDigits = std::all_of(trimmed.begin(), trimmed.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
        if (!allDigits) {
            return std::nullopt;
        }
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(std::clamp<int64_t>(*page, 1, std::numeric_limits<int>::max()));
}

std::optional<int64_t> parseImageId(const std::string& value) {
    auto id = imghost::utils::parseInt64(value);
    if (!id || *id <= 0) {
        return std::nullopt;
    }
    return id;
}

bool isStorageFilename(const std::string& name) {
    constexpr size_t kHexLen = 32;
    if (name.size() != kHexLen + 4 || name[kHexLen] != '.') {
        return false;
    }
    for (size_t i = 0; i < kHexLen; ++i) {
        char c = name[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    const std::string ext = name.substr(kHexLen + 1);
    return ext == "jpg" || ext == "png" || ext == "gif";
}

} // namespace handlers
