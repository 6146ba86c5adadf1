/**
 * @file local_file_storage.h
 * @brief Local filesystem adapter for the image file store
 */

#pragma once

#include "../domain/ports/i_file_storage.h"

#include <filesystem>

namespace adapters {

/**
 * @brief Flat-directory implementation of IFileStorage
 *
 * write() streams into ".upload-<random>" in the same directory, closes it
 * and renames it over the final name, so a crash leaves at most a temp file
 * (swept at startup) and never a truncated image.
 */
class LocalFileStorage : public domain::ports::IFileStorage {
public:
    static constexpr const char* kTempPrefix = ".upload-";

    /**
     * @param baseDir Directory holding the images; created if missing
     * @throws common::StorageException if the directory cannot be created
     */
    explicit LocalFileStorage(const std::string& baseDir);

    void write(const std::string& filename, const std::vector<uint8_t>& content) override;

    std::optional<std::vector<uint8_t>> read(const std::string& filename) override;

    RemoveOutcome remove(const std::string& filename) override;

    bool exists(const std::string& filename) override;

    int sweepStaleTempFiles(std::chrono::seconds maxAge) override;

    const std::filesystem::path& baseDir() const { return baseDir_; }

private:
    /**
     * @brief Resolve a plain filename inside baseDir_
     * @throws common::StorageException for names containing separators or dot segments
     */
    std::filesystem::path resolve(const std::string& filename) const;

    std::filesystem::path baseDir_;
};

} // namespace adapters
