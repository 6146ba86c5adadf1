/** @file image_handler.cpp
 *  @brief ImageHandler implementation
 */

#include "image_handler.h"
#include "handler_utils.h"
#include "request_parsing.h"
#include "exception/exceptions.h"

#include "../domain/models/image_type.h"
#include "../domain/ports/i_file_storage.h"
#include "../services/upload_service.h"
#include "../services/image_list_service.h"
#include "../services/image_delete_service.h"

#include <drogon/MultiPartParser.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace handlers {

using common::ErrorCode;
using common::handler::errorResponse;
using common::handler::jsonResponse;

namespace {

constexpr const char* kFileField = "file";

/**
 * @brief MIME type the client declared for the file part ("" when not an image type)
 */
std::string declaredContentType(const drogon::HttpFile& file) {
    switch (file.getContentType()) {
        case drogon::CT_IMAGE_JPG: return "image/jpeg";
        case drogon::CT_IMAGE_PNG: return "image/png";
        case drogon::CT_IMAGE_GIF: return "image/gif";
        default: return "";
    }
}

} // anonymous namespace

ImageHandler::ImageHandler(services::UploadService* uploadService,
                           services::ImageListService* listService,
                           services::ImageDeleteService* deleteService,
                           domain::ports::IFileStorage* storage,
                           size_t maxRequestBodyBytes)
    : uploadService_(uploadService)
    , listService_(listService)
    , deleteService_(deleteService)
    , storage_(storage)
    , maxRequestBodyBytes_(maxRequestBodyBytes)
{
    if (!uploadService_ || !listService_ || !deleteService_ || !storage_) {
        throw std::invalid_argument("ImageHandler: dependencies cannot be nullptr");
    }
    spdlog::info("[ImageHandler] Initialized (max request body: {} bytes)", maxRequestBodyBytes_);
}

void ImageHandler::registerRoutes(drogon::HttpAppFramework& app) {
    app.registerHandler(
        "/upload",
        [this](const drogon::HttpRequestPtr& req, Callback&& callback) {
            handleUpload(req, std::move(callback));
        },
        {drogon::Post}
    );

    app.registerHandler(
        "/images-list",
        [this](const drogon::HttpRequestPtr& req, Callback&& callback) {
            handleList(req, std::move(callback));
        },
        {drogon::Get}
    );

    app.registerHandler(
        "/delete/{id}",
        [this](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            handleDelete(req, std::move(callback), id);
        },
        {drogon::Delete}
    );

    app.registerHandler(
        "/images/{filename}",
        [this](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& filename) {
            handleServeImage(req, std::move(callback), filename);
        },
        {drogon::Get}
    );

    spdlog::info("[ImageHandler] Routes registered");
}

void ImageHandler::handleUpload(const drogon::HttpRequestPtr& req, Callback&& callback) {
    try {
        // Content-Length is checked before the body is parsed
        auto contentLength = parseContentLength(req->getHeader("content-length"));
        if (!contentLength) {
            callback(errorResponse(ErrorCode::REQUEST_LENGTH_REQUIRED, "Wrong Content-Length"));
            return;
        }
        if (static_cast<uint64_t>(*contentLength) > maxRequestBodyBytes_) {
            spdlog::warn("[ImageHandler] Upload refused: Content-Length {} exceeds {}",
                         *contentLength, maxRequestBodyBytes_);
            callback(errorResponse(ErrorCode::VALIDATION_TOO_LARGE, "File is too large"));
            return;
        }

        if (req->contentType() != drogon::CT_MULTIPART_FORM_DATA) {
            callback(errorResponse(ErrorCode::REQUEST_MALFORMED, "Expecting multipart/form-data"));
            return;
        }

        drogon::MultiPartParser parser;
        if (parser.parse(req) != 0) {
            callback(errorResponse(ErrorCode::REQUEST_MALFORMED, "Malformed multipart data"));
            return;
        }

        const drogon::HttpFile* filePart = nullptr;
        for (const auto& file : parser.getFiles()) {
            if (file.getItemName() == kFileField) {
                filePart = &file;
                break;
            }
        }
        if (!filePart) {
            callback(errorResponse(ErrorCode::REQUEST_MALFORMED, "File field not found"));
            return;
        }
        if (filePart->getFileName().empty()) {
            callback(errorResponse(ErrorCode::VALIDATION_MISSING_FILENAME, "Filename is missing"));
            return;
        }

        const auto* data = reinterpret_cast<const uint8_t*>(filePart->fileData());
        std::vector<uint8_t> content(data, data + filePart->fileLength());

        services::UploadResult result = uploadService_->upload(
            content,
            filePart->getFileName(),
            static_cast<int64_t>(filePart->fileLength()),
            declaredContentType(*filePart));

        if (!result.success) {
            callback(errorResponse(result.errorCode, result.message));
            return;
        }

        Json::Value body;
        body["status"] = "success";
        body["message"] = result.message;
        body["filename"] = result.filename;
        body["url"] = result.url;
        callback(jsonResponse(body));

    } catch (const std::exception& e) {
        callback(common::handler::internalError("ImageHandler::upload", e));
    }
}

void ImageHandler::handleList(const drogon::HttpRequestPtr& req, Callback&& callback) {
    try {
        auto page = parsePageParam(req->getParameter("page"));
        if (!page) {
            callback(errorResponse(ErrorCode::REQUEST_INVALID_PAGE, "Invalid page number"));
            return;
        }

        services::ListResult result = listService_->list(*page);
        if (!result.success) {
            callback(errorResponse(result.errorCode, result.message));
            return;
        }
        callback(jsonResponse(listService_->toJson(result)));

    } catch (const std::exception& e) {
        callback(common::handler::internalError("ImageHandler::list", e));
    }
}

void ImageHandler::handleDelete(const drogon::HttpRequestPtr& /* req */,
                                Callback&& callback,
                                const std::string& idParam) {
    try {
        auto id = parseImageId(idParam);
        if (!id) {
            callback(errorResponse(ErrorCode::REQUEST_INVALID_ID, "Invalid image id"));
            return;
        }

        services::DeleteResult result = deleteService_->remove(*id);
        if (!result.success) {
            callback(errorResponse(result.errorCode, result.message));
            return;
        }

        Json::Value body;
        body["status"] = "success";
        body["message"] = result.message;
        callback(jsonResponse(body));

    } catch (const std::exception& e) {
        callback(common::handler::internalError("ImageHandler::delete", e));
    }
}

void ImageHandler::handleServeImage(const drogon::HttpRequestPtr& /* req */,
                                    Callback&& callback,
                                    const std::string& filename) {
    try {
        if (!isStorageFilename(filename)) {
            callback(errorResponse(ErrorCode::IMAGE_NOT_FOUND, "Not Found"));
            return;
        }

        auto content = storage_->read(filename);
        if (!content) {
            callback(errorResponse(ErrorCode::IMAGE_NOT_FOUND, "Not Found"));
            return;
        }

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setContentTypeString(
            domain::models::toContentType(domain::models::imageTypeFromExtension(filename)));
        resp->setBody(std::string(content->begin(), content->end()));
        // Storage names are never reused, so the bytes behind a URL never change
        resp->addHeader("Cache-Control", "public, max-age=31536000, immutable");
        callback(resp);

    } catch (const common::StorageException& e) {
        spdlog::error("[ImageHandler] Cannot read {}: {}", filename, e.what());
        callback(errorResponse(ErrorCode::STORAGE_READ_FAILED, "Error reading image"));
    } catch (const std::exception& e) {
        callback(common::handler::internalError("ImageHandler::serve", e));
    }
}

} // namespace handlers
