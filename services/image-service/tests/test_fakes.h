/**
 * @file test_fakes.h
 * @brief In-memory stand-ins for the file store and metadata repository
 */

#pragma once

#include "domain/ports/i_file_storage.h"
#include "repositories/i_image_repository.h"
#include "exception/exceptions.h"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_fakes {

/**
 * @brief Minimal content with a real signature and a plausible structure, padded to size bytes
 */
inline std::vector<uint8_t> makePng(size_t size = 64) {
    std::vector<uint8_t> data = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
                                 0x00, 0x00, 0x00, 0x0D, 'I', 'H', 'D', 'R'};
    data.resize(std::max<size_t>(size, 33), 0x00);
    return data;
}

inline std::vector<uint8_t> makeJpeg(size_t size = 64) {
    std::vector<uint8_t> data = {0xFF, 0xD8, 0xFF, 0xE0};
    data.resize(std::max<size_t>(size, 6), 0x11);
    data[data.size() - 2] = 0xFF;
    data[data.size() - 1] = 0xD9;
    return data;
}

inline std::vector<uint8_t> makeGif(size_t size = 64) {
    std::vector<uint8_t> data = {'G', 'I', 'F', '8', '9', 'a'};
    data.resize(std::max<size_t>(size, 7), 0x11);
    data.back() = 0x3B;
    return data;
}

/**
 * @brief Windows PE header ("MZ")
 */
inline std::vector<uint8_t> makeExe(size_t size = 64) {
    std::vector<uint8_t> data = {'M', 'Z', 0x90, 0x00};
    data.resize(std::max(size, data.size()), 0x00);
    return data;
}

class FakeFileStorage : public domain::ports::IFileStorage {
public:
    std::map<std::string, std::vector<uint8_t>> files;
    bool failWrite = false;
    bool failRemove = false;
    int writeCalls = 0;
    int removeCalls = 0;

    void write(const std::string& filename, const std::vector<uint8_t>& content) override {
        ++writeCalls;
        if (failWrite) {
            throw common::StorageException(filename, "disk full");
        }
        files[filename] = content;
    }

    std::optional<std::vector<uint8_t>> read(const std::string& filename) override {
        auto it = files.find(filename);
        if (it == files.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    RemoveOutcome remove(const std::string& filename) override {
        ++removeCalls;
        if (failRemove) {
            throw common::StorageException(filename, "permission denied");
        }
        return files.erase(filename) > 0 ? RemoveOutcome::REMOVED : RemoveOutcome::NOT_FOUND;
    }

    bool exists(const std::string& filename) override {
        return files.count(filename) > 0;
    }

    int sweepStaleTempFiles(std::chrono::seconds /* maxAge */) override {
        return 0;
    }
};

class FakeImageRepository : public repositories::IImageRepository {
public:
    std::vector<domain::models::ImageRecord> rows;   ///< Insertion order
    bool failInsert = false;
    bool failRead = false;
    bool failDelete = false;
    bool deleteReportsMissing = false;
    int64_t nextId = 1;
    int findPageCalls = 0;

    void ensureSchema() override {}

    int64_t insert(const domain::models::ImageRecord& record) override {
        if (failInsert) {
            throw common::DatabaseException("insert failed");
        }
        domain::models::ImageRecord stored = record;
        stored.id = nextId++;
        stored.uploadTime = std::chrono::system_clock::now();
        rows.push_back(stored);
        return stored.id;
    }

    std::optional<domain::models::ImageRecord> findById(int64_t id) override {
        if (failRead) {
            throw common::DatabaseException("connection lost");
        }
        for (const auto& row : rows) {
            if (row.id == id) {
                return row;
            }
        }
        return std::nullopt;
    }

    std::vector<domain::models::ImageRecord> findPage(int limit, int64_t offset) override {
        ++findPageCalls;
        if (failRead) {
            throw common::DatabaseException("connection lost");
        }
        // Newest first: later inserts have higher ids
        std::vector<domain::models::ImageRecord> ordered(rows.rbegin(), rows.rend());
        std::vector<domain::models::ImageRecord> page;
        for (int64_t i = offset; i < static_cast<int64_t>(ordered.size()) &&
                                 static_cast<int64_t>(page.size()) < limit; ++i) {
            page.push_back(ordered[static_cast<size_t>(i)]);
        }
        return page;
    }

    int64_t countAll() override {
        if (failRead) {
            throw common::DatabaseException("connection lost");
        }
        return static_cast<int64_t>(rows.size());
    }

    bool deleteById(int64_t id) override {
        if (failDelete) {
            throw common::DatabaseException("delete failed");
        }
        if (deleteReportsMissing) {
            return false;
        }
        auto it = std::find_if(rows.begin(), rows.end(),
                               [id](const domain::models::ImageRecord& r) { return r.id == id; });
        if (it == rows.end()) {
            return false;
        }
        rows.erase(it);
        return true;
    }
};

} // namespace test_fakes
