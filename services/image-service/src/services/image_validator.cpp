/**
 * @file image_validator.cpp
 * @brief Image validation rules
 */

#include "image_validator.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace services {

using domain::models::ImageType;

ImageValidator::ImageValidator(const Options& options)
    : options_(options)
{
    if (options_.maxFileSize <= 0) {
        throw std::invalid_argument("ImageValidator: maxFileSize must be positive");
    }
}

ValidationResult ImageValidator::validate(const UploadCandidate& candidate) const {
    const size_t contentSize = candidate.content ? candidate.content->size() : 0;
    const int64_t effectiveSize = std::max<int64_t>(candidate.declaredSize,
                                                    static_cast<int64_t>(contentSize));

    if (effectiveSize > options_.maxFileSize) {
        return ValidationResult::reject(common::ErrorCode::VALIDATION_TOO_LARGE,
            "File exceeds maximum file size " + std::to_string(options_.maxFileSize) + " bytes.");
    }

    if (contentSize == 0) {
        return ValidationResult::reject(common::ErrorCode::VALIDATION_EMPTY_FILE, "File is empty");
    }

    const ImageType extensionType = domain::models::imageTypeFromExtension(candidate.fileName);
    if (extensionType == ImageType::UNKNOWN) {
        return ValidationResult::reject(common::ErrorCode::VALIDATION_UNSUPPORTED_TYPE,
            "Unsupported file type. Allowed: jpg, jpeg, png, gif");
    }

    if (!options_.enforceSignatureCheck) {
        return ValidationResult::accept(extensionType);
    }

    const ImageType sniffed = domain::models::detectImageType(*candidate.content);
    if (sniffed != extensionType) {
        spdlog::debug("[ImageValidator] {}: extension says {}, content says {}",
                      candidate.fileName, domain::models::toExtension(extensionType),
                      sniffed == ImageType::UNKNOWN ? "unknown" : domain::models::toExtension(sniffed));
        return ValidationResult::reject(common::ErrorCode::VALIDATION_TYPE_MISMATCH,
            "File content does not match its extension");
    }

    if (!domain::models::hasValidStructure(sniffed, candidate.content->data(), contentSize)) {
        return ValidationResult::reject(common::ErrorCode::VALIDATION_CORRUPT_IMAGE,
            "Invalid or corrupted image file.");
    }

    const ImageType declared = domain::models::imageTypeFromContentType(candidate.declaredContentType);
    if (declared != ImageType::UNKNOWN && declared != sniffed) {
        return ValidationResult::reject(common::ErrorCode::VALIDATION_TYPE_MISMATCH,
            "Declared content type does not match file content");
    }

    return ValidationResult::accept(sniffed);
}

} // namespace services
