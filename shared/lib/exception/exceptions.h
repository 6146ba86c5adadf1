/**
 * @file exceptions.h
 * @brief Exception hierarchy shared by the image hosting services
 *
 * Infrastructure layers (database, file storage, configuration) throw these;
 * the service layer catches them and converts them to ErrorCode results.
 *
 * @date 2026-10-19
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/**
 * @brief Base exception for all image hosting exceptions
 */
class ImageHostException : public std::runtime_error {
public:
    explicit ImageHostException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Database operation failed (connection, query, constraint)
 */
class DatabaseException : public ImageHostException {
public:
    explicit DatabaseException(const std::string& message)
        : ImageHostException("Database error: " + message) {}
};

/**
 * @brief File store operation failed (write, rename, read, remove)
 */
class StorageException : public ImageHostException {
public:
    StorageException(const std::string& path, const std::string& message)
        : ImageHostException("Storage error [" + path + "]: " + message), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Configuration error
 */
class ConfigException : public ImageHostException {
public:
    explicit ConfigException(const std::string& message)
        : ImageHostException("Configuration error: " + message) {}
};

/**
 * @brief Connection pool exhausted
 */
class PoolExhaustedException : public DatabaseException {
public:
    explicit PoolExhaustedException(const std::string& poolType)
        : DatabaseException(poolType + " connection pool exhausted") {}
};

} // namespace common
