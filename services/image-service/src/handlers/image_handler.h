#pragma once

#include <drogon/HttpAppFramework.h>
#include <cstddef>
#include <functional>

namespace domain::ports {
    class IFileStorage;
}

namespace services {
    class UploadService;
    class ImageListService;
    class ImageDeleteService;
}

namespace handlers {

/**
 * @brief Image endpoints handler
 *
 * - POST   /upload            - multipart upload, field "file"
 * - GET    /images-list       - paginated listing (?page=N)
 * - DELETE /delete/{id}       - delete record and file
 * - GET    /images/{filename} - raw image bytes
 *
 * All collaborators are non-owning; the ServiceContainer outlives the handler.
 */
class ImageHandler {
public:
    /**
     * @param maxRequestBodyBytes Content-Length above which an upload is refused with 413
     * @throws std::invalid_argument if any pointer is nullptr
     */
    ImageHandler(services::UploadService* uploadService,
                 services::ImageListService* listService,
                 services::ImageDeleteService* deleteService,
                 domain::ports::IFileStorage* storage,
                 size_t maxRequestBodyBytes);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

    /**
     * @brief POST /upload
     *
     * Response (200):
     * {
     *   "status": "success",
     *   "message": "File successfully uploaded.",
     *   "filename": "3f2a...9c.png",
     *   "url": "/images/3f2a...9c.png"
     * }
     */
    void handleUpload(const drogon::HttpRequestPtr& req, Callback&& callback);

    /**
     * @brief GET /images-list?page=N
     *
     * Response (200):
     * {
     *   "status": "success",
     *   "page": 1,
     *   "pagination": {"current_page": 1, "page_size": 10, "total_pages": 3,
     *                  "total_items": 25, "has_prev": false, "has_next": true},
     *   "data": [{"id": 7, "filename": "...", "original_name": "cat.png", "size": 2048,
     *             "size_kb": 2.0, "upload_time": "2026-10-19T12:00:00Z",
     *             "file_type": "png", "url": "/images/..."}]
     * }
     */
    void handleList(const drogon::HttpRequestPtr& req, Callback&& callback);

    /**
     * @brief DELETE /delete/{id}
     */
    void handleDelete(const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& idParam);

    /**
     * @brief GET /images/{filename}
     */
    void handleServeImage(const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& filename);

    services::UploadService* uploadService_;
    services::ImageListService* listService_;
    services::ImageDeleteService* deleteService_;
    domain::ports::IFileStorage* storage_;
    size_t maxRequestBodyBytes_;
};

} // namespace handlers
