/**
 * @file image_type_test.cpp
 * @brief Unit tests for image format classification
 */

#include <gtest/gtest.h>
#include "domain/models/image_type.h"
#include "../test_fakes.h"

using namespace domain::models;

// --- Signature detection ---

TEST(ImageTypeTest, DetectsSignatures) {
    EXPECT_EQ(detectImageType(test_fakes::makeJpeg()), ImageType::JPG);
    EXPECT_EQ(detectImageType(test_fakes::makePng()), ImageType::PNG);
    EXPECT_EQ(detectImageType(test_fakes::makeGif()), ImageType::GIF);

    std::vector<uint8_t> gif87 = {'G', 'I', 'F', '8', '7', 'a', 0x01};
    EXPECT_EQ(detectImageType(gif87), ImageType::GIF);
}

TEST(ImageTypeTest, RejectsUnknownAndShortContent) {
    EXPECT_EQ(detectImageType(test_fakes::makeExe()), ImageType::UNKNOWN);
    EXPECT_EQ(detectImageType(std::vector<uint8_t>{}), ImageType::UNKNOWN);
    EXPECT_EQ(detectImageType(std::vector<uint8_t>{0xFF, 0xD8}), ImageType::UNKNOWN);
    EXPECT_EQ(detectImageType(std::vector<uint8_t>{0x89, 'P', 'N', 'G'}), ImageType::UNKNOWN);
    EXPECT_EQ(detectImageType(nullptr, 10), ImageType::UNKNOWN);

    std::vector<uint8_t> gif88 = {'G', 'I', 'F', '8', '8', 'a'};
    EXPECT_EQ(detectImageType(gif88), ImageType::UNKNOWN);
}

// --- Extension mapping ---

TEST(ImageTypeTest, FromExtension_CaseInsensitive) {
    EXPECT_EQ(imageTypeFromExtension("cat.jpg"), ImageType::JPG);
    EXPECT_EQ(imageTypeFromExtension("cat.JPEG"), ImageType::JPG);
    EXPECT_EQ(imageTypeFromExtension("cat.Png"), ImageType::PNG);
    EXPECT_EQ(imageTypeFromExtension("anim.gif"), ImageType::GIF);
}

TEST(ImageTypeTest, FromExtension_Unsupported) {
    EXPECT_EQ(imageTypeFromExtension("doc.pdf"), ImageType::UNKNOWN);
    EXPECT_EQ(imageTypeFromExtension("noext"), ImageType::UNKNOWN);
    EXPECT_EQ(imageTypeFromExtension("photo.png.exe"), ImageType::UNKNOWN);
    EXPECT_EQ(imageTypeFromExtension(""), ImageType::UNKNOWN);
}

// --- MIME mapping ---

TEST(ImageTypeTest, FromContentType) {
    EXPECT_EQ(imageTypeFromContentType("image/jpeg"), ImageType::JPG);
    EXPECT_EQ(imageTypeFromContentType("IMAGE/PNG; charset=binary"), ImageType::PNG);
    EXPECT_EQ(imageTypeFromContentType(" image/gif "), ImageType::GIF);
    EXPECT_EQ(imageTypeFromContentType("application/octet-stream"), ImageType::UNKNOWN);
    EXPECT_EQ(imageTypeFromContentType(""), ImageType::UNKNOWN);
}

TEST(ImageTypeTest, ExtensionAndContentType) {
    EXPECT_EQ(toExtension(ImageType::JPG), "jpg");
    EXPECT_EQ(toExtension(ImageType::UNKNOWN), "");
    EXPECT_EQ(toContentType(ImageType::PNG), "image/png");
    EXPECT_EQ(toContentType(ImageType::UNKNOWN), "application/octet-stream");
    EXPECT_EQ(toContentType(ImageType::GIF), "image/gif");
    EXPECT_EQ(toContentType(ImageType::JPG), "image/jpeg");
}

// --- Structure ---

TEST(ImageTypeTest, StructureOfWellFormedContent) {
    auto png = test_fakes::makePng();
    auto jpeg = test_fakes::makeJpeg();
    auto gif = test_fakes::makeGif();

    EXPECT_TRUE(hasValidStructure(ImageType::PNG, png.data(), png.size()));
    EXPECT_TRUE(hasValidStructure(ImageType::JPG, jpeg.data(), jpeg.size()));
    EXPECT_TRUE(hasValidStructure(ImageType::GIF, gif.data(), gif.size()));

    // NUL padding after the trailer is tolerated
    jpeg.resize(jpeg.size() + 16, 0x00);
    EXPECT_TRUE(hasValidStructure(ImageType::JPG, jpeg.data(), jpeg.size()));
}

TEST(ImageTypeTest, StructureRejectsGarbageBehindSignature) {
    // PNG signature followed by random bytes instead of IHDR
    std::vector<uint8_t> png = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
    png.resize(64, 0x42);
    EXPECT_FALSE(hasValidStructure(ImageType::PNG, png.data(), png.size()));

    // Truncated JPEG: no EOI marker
    auto jpeg = test_fakes::makeJpeg();
    jpeg.resize(jpeg.size() - 2);
    EXPECT_FALSE(hasValidStructure(ImageType::JPG, jpeg.data(), jpeg.size()));

    // GIF without trailer
    auto gif = test_fakes::makeGif();
    gif.back() = 0x00;
    gif.push_back(0x01);
    EXPECT_FALSE(hasValidStructure(ImageType::GIF, gif.data(), gif.size()));

    EXPECT_FALSE(hasValidStructure(ImageType::UNKNOWN, png.data(), png.size()));
    EXPECT_FALSE(hasValidStructure(ImageType::PNG, nullptr, 0));
}
