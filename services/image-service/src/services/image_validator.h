/**
 * @file image_validator.h
 * @brief Accept/reject decision for uploaded image content
 */

#pragma once

#include "../common/error_codes.h"
#include "../domain/models/image_type.h"

#include <cstdint>
#include <string>
#include <vector>

namespace services {

/**
 * @brief Everything the validator looks at for one upload
 */
struct UploadCandidate {
    std::string fileName;               ///< Client filename (already sanitized)
    std::string declaredContentType;    ///< Part Content-Type, may be empty
    int64_t declaredSize = 0;           ///< Size the client claimed, 0 if unknown
    const std::vector<uint8_t>* content = nullptr;
};

struct ValidationResult {
    bool valid = false;
    common::ErrorCode errorCode = common::ErrorCode::SUCCESS;
    std::string message;
    domain::models::ImageType detectedType = domain::models::ImageType::UNKNOWN;

    static ValidationResult accept(domain::models::ImageType type) {
        ValidationResult r;
        r.valid = true;
        r.detectedType = type;
        return r;
    }

    static ValidationResult reject(common::ErrorCode code, const std::string& message) {
        ValidationResult r;
        r.errorCode = code;
        r.message = message;
        return r;
    }
};

/**
 * @brief Stateless image validator
 *
 * Checks, first failure wins:
 *  1. size over the limit          -> VALIDATION_TOO_LARGE
 *  2. empty content                -> VALIDATION_EMPTY_FILE
 *  3. extension not jpg/jpeg/png/gif -> VALIDATION_UNSUPPORTED_TYPE
 *  4. signature bytes disagree with the extension -> VALIDATION_TYPE_MISMATCH
 *  5. body does not look like a complete image of that type -> VALIDATION_CORRUPT_IMAGE
 *  6. declared image MIME type disagrees with the signature -> VALIDATION_TYPE_MISMATCH
 *
 * Checks 4 to 6 are skipped when signature enforcement is off.
 */
class ImageValidator {
public:
    struct Options {
        int64_t maxFileSize = 5 * 1024 * 1024;
        bool enforceSignatureCheck = true;
    };

    /**
     * @throws std::invalid_argument if maxFileSize is not positive
     */
    explicit ImageValidator(const Options& options);

    ValidationResult validate(const UploadCandidate& candidate) const;

private:
    Options options_;
};

} // namespace services
