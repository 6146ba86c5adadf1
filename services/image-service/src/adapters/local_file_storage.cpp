/**
 * @file local_file_storage.cpp
 * @brief Local filesystem adapter implementation
 */

#include "local_file_storage.h"
#include "exception/exceptions.h"

#include <imghost/utils/string_utils.h>

#include <spdlog/spdlog.h>
#include <uuid/uuid.h>

#include <fstream>

namespace fs = std::filesystem;

namespace adapters {

namespace {

std::string randomSuffix() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    return imghost::utils::bytesToHex(uuid, sizeof(uuid));
}

} // namespace

LocalFileStorage::LocalFileStorage(const std::string& baseDir)
    : baseDir_(baseDir)
{
    std::error_code ec;
    fs::create_directories(baseDir_, ec);
    if (ec || !fs::is_directory(baseDir_)) {
        throw common::StorageException(baseDir, "cannot create directory: " +
            (ec ? ec.message() : std::string("not a directory")));
    }
    spdlog::info("[LocalFileStorage] Using directory {}", baseDir_.string());
}

fs::path LocalFileStorage::resolve(const std::string& filename) const {
    if (filename.empty() || filename == "." || filename == ".." ||
        filename.find_first_of("/\\") != std::string::npos ||
        filename.find('\0') != std::string::npos) {
        throw common::StorageException(filename, "invalid storage filename");
    }
    return baseDir_ / filename;
}

void LocalFileStorage::write(const std::string& filename, const std::vector<uint8_t>& content) {
    const fs::path target = resolve(filename);
    const fs::path temp = baseDir_ / (std::string(kTempPrefix) + randomSuffix());

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw common::StorageException(temp.string(), "failed to create temp file");
        }
        out.write(reinterpret_cast<const char*>(content.data()),
                  static_cast<std::streamsize>(content.size()));
        out.close();
        if (out.fail()) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            throw common::StorageException(temp.string(), "failed to write content");
        }
    }

    // No fsync: readers never see a partial file, but a power loss right after
    // the rename may leave an empty file under the final name.
    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw common::StorageException(target.string(), "failed to publish file: " + ec.message());
    }

    spdlog::debug("[LocalFileStorage] Wrote {} ({} bytes)", filename, content.size());
}

std::optional<std::vector<uint8_t>> LocalFileStorage::read(const std::string& filename) {
    const fs::path path = resolve(filename);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        throw common::StorageException(path.string(), "failed to open file");
    }
    auto size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> content(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(content.data()), size)) {
        throw common::StorageException(path.string(), "failed to read file");
    }
    return content;
}

domain::ports::IFileStorage::RemoveOutcome LocalFileStorage::remove(const std::string& filename) {
    const fs::path path = resolve(filename);

    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throw common::StorageException(path.string(), "failed to delete file: " + ec.message());
    }
    return removed ? RemoveOutcome::REMOVED : RemoveOutcome::NOT_FOUND;
}

bool LocalFileStorage::exists(const std::string& filename) {
    std::error_code ec;
    return fs::is_regular_file(resolve(filename), ec);
}

int LocalFileStorage::sweepStaleTempFiles(std::chrono::seconds maxAge) {
    int swept = 0;
    const auto now = fs::file_time_type::clock::now();

    std::error_code ec;
    for (fs::directory_iterator it(baseDir_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (!imghost::utils::startsWith(name, kTempPrefix)) {
            continue;
        }

        std::error_code entryEc;
        auto mtime = fs::last_write_time(it->path(), entryEc);
        if (entryEc || now - mtime < maxAge) {
            continue;
        }
        if (fs::remove(it->path(), entryEc)) {
            ++swept;
        } else if (entryEc) {
            spdlog::warn("[LocalFileStorage] Could not remove stale temp file {}: {}", name, entryEc.message());
        }
    }
    if (ec) {
        spdlog::warn("[LocalFileStorage] Temp file sweep stopped early: {}", ec.message());
    }

    if (swept > 0) {
        spdlog::info("[LocalFileStorage] Removed {} stale temp files", swept);
    }
    return swept;
}

} // namespace adapters
