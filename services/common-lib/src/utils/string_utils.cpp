/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "imghost/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace imghost {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return str.substr(start, end - start);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(str);

    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }
    // getline drops the empty token after a trailing delimiter (and yields nothing for "")
    if (str.empty() || str.back() == delimiter) {
        tokens.push_back("");
    }
    return tokens;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::string bytesToHex(const uint8_t* data, size_t len) {
    static const char kDigits[] = "0123456789abcdef";
    if (!data || len == 0) {
        return "";
    }
    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hex += kDigits[data[i] >> 4];
        hex += kDigits[data[i] & 0x0F];
    }
    return hex;
}

std::string baseName(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string fileExtension(const std::string& filename) {
    std::string base = baseName(filename);
    size_t dot = base.rfind('.');
    if (dot == std::string::npos) {
        return "";
    }
    return toLower(base.substr(dot + 1));
}

namespace {

constexpr size_t kMaxKeptExtensionBytes = 16;

// Largest cut <= maxBytes that does not land on a continuation byte (10xxxxxx)
size_t utf8Boundary(const std::string& str, size_t maxBytes) {
    if (maxBytes >= str.size()) {
        return str.size();
    }
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut;
}

} // namespace

std::string sanitizeFilename(const std::string& filename, size_t maxBytes) {
    std::string cleaned;
    for (char c : baseName(filename)) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F) {
            continue;
        }
        cleaned += c;
    }
    cleaned = trim(cleaned);

    if (cleaned.size() <= maxBytes) {
        return cleaned;
    }

    // Shorten the stem and keep the extension so the name still says what the file is
    size_t dot = cleaned.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        std::string ext = cleaned.substr(dot);
        if (ext.size() <= kMaxKeptExtensionBytes && ext.size() < maxBytes) {
            std::string stem = cleaned.substr(0, dot);
            stem.resize(utf8Boundary(stem, maxBytes - ext.size()));
            return stem + ext;
        }
    }

    cleaned.resize(utf8Boundary(cleaned, maxBytes));
    return cleaned;
}

std::optional<int64_t> parseInt64(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    bool negative = str[0] == '-';
    size_t i = negative ? 1 : 0;
    if (i == str.size()) {
        return std::nullopt;
    }

    uint64_t limit = negative
        ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
        : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    uint64_t value = 0;
    for (; i < str.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(str[i] - '0');
        if (value > (limit - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }

    if (negative) {
        return value == limit ? std::numeric_limits<int64_t>::min()
                              : -static_cast<int64_t>(value);
    }
    return static_cast<int64_t>(value);
}

bool parseBool(const std::string& str, bool defaultValue) {
    std::string v = toLower(trim(str));
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return defaultValue;
}

} // namespace utils
} // namespace imghost
