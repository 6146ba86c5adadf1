/**
 * @file upload_service_test.cpp
 * @brief Unit tests for UploadService
 *
 * Runs against in-memory storage and repository fakes.
 */

#include <gtest/gtest.h>
#include "services/upload_service.h"
#include "handlers/request_parsing.h"
#include "../test_fakes.h"

#include <memory>

using namespace services;
using common::ErrorCode;

class UploadServiceTest : public ::testing::Test {
protected:
    static constexpr int64_t kMiB = 1024 * 1024;

    test_fakes::FakeFileStorage storage_;
    test_fakes::FakeImageRepository repo_;
    std::unique_ptr<ImageValidator> validator_;
    std::unique_ptr<UploadService> service_;

    void SetUp() override {
        validator_ = std::make_unique<ImageValidator>(ImageValidator::Options{5 * kMiB, true});
        service_ = std::make_unique<UploadService>(validator_.get(), &storage_, &repo_, "/images");
    }
};

// --- Success path ---

TEST_F(UploadServiceTest, StoresFileAndRecord) {
    // Arrange
    auto content = test_fakes::makePng(static_cast<size_t>(4 * kMiB));

    // Act
    auto result = service_->upload(content, "cat.png", static_cast<int64_t>(content.size()), "image/png");

    // Assert
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.id, 1);
    EXPECT_TRUE(handlers::isStorageFilename(result.filename)) << result.filename;
    EXPECT_EQ(result.filename.substr(33), "png");
    EXPECT_EQ(result.url, "/images/" + result.filename);
    EXPECT_EQ(result.message, "File successfully uploaded.");

    ASSERT_EQ(storage_.files.count(result.filename), 1u);
    EXPECT_EQ(storage_.files[result.filename], content);

    ASSERT_EQ(repo_.rows.size(), 1u);
    EXPECT_EQ(repo_.rows[0].filename, result.filename);
    EXPECT_EQ(repo_.rows[0].originalName, "cat.png");
    EXPECT_EQ(repo_.rows[0].size, 4 * kMiB);
    EXPECT_EQ(repo_.rows[0].fileType, "png");
}

TEST_F(UploadServiceTest, NormalizesJpegExtension) {
    auto result = service_->upload(test_fakes::makeJpeg(), "Holiday.JPEG", 0);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.filename.substr(33), "jpg");
    EXPECT_EQ(repo_.rows[0].fileType, "jpg");
    EXPECT_EQ(repo_.rows[0].originalName, "Holiday.JPEG");
}

TEST_F(UploadServiceTest, StripsClientDirectoryFromOriginalName) {
    auto result = service_->upload(test_fakes::makeGif(), "C:\\Users\\me\\anim.gif", 0);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(repo_.rows[0].originalName, "anim.gif");
}

TEST_F(UploadServiceTest, SameNameTwiceGetsDistinctStorageNames) {
    auto first = service_->upload(test_fakes::makePng(), "cat.png", 0);
    auto second = service_->upload(test_fakes::makePng(), "cat.png", 0);

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_NE(first.filename, second.filename);
    EXPECT_EQ(storage_.files.size(), 2u);
}

TEST_F(UploadServiceTest, OverlongNameKeepsExtensionAndIsAccepted) {
    // Arrange
    std::string longName = std::string(300, 'a') + ".png";

    // Act
    auto result = service_->upload(test_fakes::makePng(), longName, 0, "image/png");

    // Assert
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.filename.substr(33), "png");
    ASSERT_EQ(repo_.rows.size(), 1u);
    EXPECT_EQ(repo_.rows[0].originalName.size(), 255u);
    EXPECT_EQ(repo_.rows[0].originalName.substr(251), ".png");
}

// --- Rejections leave nothing behind ---

TEST_F(UploadServiceTest, RenamedExecutableLeavesNoTrace) {
    auto result = service_->upload(test_fakes::makeExe(), "cat.png", 0, "image/png");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::VALIDATION_TYPE_MISMATCH);
    EXPECT_EQ(storage_.writeCalls, 0);
    EXPECT_TRUE(repo_.rows.empty());
}

TEST_F(UploadServiceTest, OversizedFileLeavesNoTrace) {
    auto content = test_fakes::makeJpeg(static_cast<size_t>(6 * kMiB));

    auto result = service_->upload(content, "big.jpg", static_cast<int64_t>(content.size()));

    EXPECT_EQ(result.errorCode, ErrorCode::VALIDATION_TOO_LARGE);
    EXPECT_TRUE(storage_.files.empty());
    EXPECT_TRUE(repo_.rows.empty());
}

TEST_F(UploadServiceTest, MissingFilename) {
    auto result = service_->upload(test_fakes::makePng(), "  ", 0);
    EXPECT_EQ(result.errorCode, ErrorCode::VALIDATION_MISSING_FILENAME);

    result = service_->upload(test_fakes::makePng(), "uploads/", 0);
    EXPECT_EQ(result.errorCode, ErrorCode::VALIDATION_MISSING_FILENAME);
    EXPECT_EQ(storage_.writeCalls, 0);
}

// --- Store failures ---

TEST_F(UploadServiceTest, StorageFailureSkipsInsert) {
    storage_.failWrite = true;

    auto result = service_->upload(test_fakes::makePng(), "cat.png", 0);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::STORAGE_WRITE_FAILED);
    EXPECT_EQ(result.message, "Uploading file error");
    EXPECT_TRUE(repo_.rows.empty());
}

TEST_F(UploadServiceTest, InsertFailureRemovesWrittenFile) {
    // Arrange
    repo_.failInsert = true;

    // Act
    auto result = service_->upload(test_fakes::makePng(), "cat.png", 0);

    // Assert
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::METADATA_WRITE_FAILED);
    EXPECT_EQ(storage_.writeCalls, 1);
    EXPECT_EQ(storage_.removeCalls, 1);
    EXPECT_TRUE(storage_.files.empty());
}

TEST_F(UploadServiceTest, InsertFailureSurvivesCleanupFailure) {
    repo_.failInsert = true;
    storage_.failRemove = true;

    auto result = service_->upload(test_fakes::makePng(), "cat.png", 0);

    EXPECT_EQ(result.errorCode, ErrorCode::METADATA_WRITE_FAILED);
}

// --- Construction ---

TEST_F(UploadServiceTest, RejectsNullDependencies) {
    EXPECT_THROW(UploadService(nullptr, &storage_, &repo_, "/images"), std::invalid_argument);
    EXPECT_THROW(UploadService(validator_.get(), nullptr, &repo_, "/images"), std::invalid_argument);
    EXPECT_THROW(UploadService(validator_.get(), &storage_, nullptr, "/images"), std::invalid_argument);
}

TEST(UploadServiceNamingTest, GenerateStorageName) {
    std::string name = UploadService::generateStorageName(domain::models::ImageType::GIF);
    EXPECT_TRUE(handlers::isStorageFilename(name)) << name;
    EXPECT_NE(name, UploadService::generateStorageName(domain::models::ImageType::GIF));
}
