/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used across the image hosting services.
 *
 * @version 1.0.0
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace imghost {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII)
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 */
std::string trim(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * Empty input yields a single empty token; a trailing delimiter yields a
 * trailing empty token.
 */
std::vector<std::string> split(const std::string& str, char delimiter);

bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Convert binary data to lowercase hex
 * @return Hex string (2 chars per byte), empty for null/zero-length input
 */
std::string bytesToHex(const uint8_t* data, size_t len);

/**
 * @brief Last path component, accepting both '/' and '\\' separators
 *
 * "a/b\\c.png" -> "c.png", "dir/" -> ""
 */
std::string baseName(const std::string& path);

/**
 * @brief Lowercased extension after the last dot of the base name
 *
 * "Cat.JPEG" -> "jpeg", "archive.tar.gz" -> "gz", "README" -> "", ".hidden" -> "hidden"
 */
std::string fileExtension(const std::string& filename);

/**
 * @brief Make a client-supplied filename safe to store and display
 *
 * Strips directory components, removes ASCII control characters, trims
 * surrounding whitespace and truncates to maxBytes without splitting a
 * UTF-8 sequence. When truncating, the extension (up to 16 bytes) is kept
 * and the stem is shortened instead.
 */
std::string sanitizeFilename(const std::string& filename, size_t maxBytes = 255);

/**
 * @brief Strict decimal parse of a signed 64-bit integer
 *
 * Accepts an optional leading '-' followed by digits only. No whitespace,
 * no '+', no trailing characters.
 *
 * @return Parsed value, or std::nullopt on invalid input or overflow
 */
std::optional<int64_t> parseInt64(const std::string& str);

/**
 * @brief Parse common boolean spellings (true/false, 1/0, yes/no, on/off)
 * @return defaultValue for anything else
 */
bool parseBool(const std::string& str, bool defaultValue);

} // namespace utils
} // namespace imghost
