#include "public_url.h"

namespace services {

std::string buildPublicUrl(const std::string& basePath, const std::string& filename) {
    std::string base = basePath;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    size_t start = filename.find_first_not_of('/');
    return base + "/" + (start == std::string::npos ? std::string() : filename.substr(start));
}

} // namespace services
