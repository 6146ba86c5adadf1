/**
 * @file i_file_storage.h
 * @brief Port interface for the image file store
 *
 * Files live in one flat namespace keyed by storage filename.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace domain {
namespace ports {

/**
 * @brief Port interface for file storage
 *
 * Implementations throw common::StorageException on I/O failure.
 */
class IFileStorage {
public:
    enum class RemoveOutcome {
        REMOVED,
        NOT_FOUND
    };

    virtual ~IFileStorage() = default;

    /**
     * @brief Publish content under filename atomically
     *
     * Readers never observe a partially written file.
     */
    virtual void write(const std::string& filename, const std::vector<uint8_t>& content) = 0;

    /**
     * @brief Read a stored file
     * @return Content, or std::nullopt if no such file exists
     */
    virtual std::optional<std::vector<uint8_t>> read(const std::string& filename) = 0;

    /**
     * @brief Delete a stored file
     * @return NOT_FOUND if it was already absent
     */
    virtual RemoveOutcome remove(const std::string& filename) = 0;

    virtual bool exists(const std::string& filename) = 0;

    /**
     * @brief Delete leftover temporary files older than maxAge
     * @return Number of files removed
     */
    virtual int sweepStaleTempFiles(std::chrono::seconds maxAge) = 0;
};

} // namespace ports
} // namespace domain
