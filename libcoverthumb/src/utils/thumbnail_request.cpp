//
// Created by Giuseppe Francione on 08/12/25.
//

#include "../../include/thumbnail_request.hpp"
#include "../../include/book_format.hpp"
#include <stdexcept>

namespace coverthumb {

ThumbnailRequest::ThumbnailRequest(std::filesystem::path path, const std::string_view extension,
                                   const std::uint32_t requested_size)
    : path_(std::move(path)), extension_(normalize_extension(extension)), requested_size_(requested_size) {
    if (requested_size_ == 0 || requested_size_ > kMaxRequestedSize) {
        throw std::invalid_argument("requested size must be in 1.." + std::to_string(kMaxRequestedSize) +
                                    ", got " + std::to_string(requested_size_));
    }
}

ThumbnailRequest ThumbnailRequest::from_path(const std::filesystem::path& path, const std::uint32_t requested_size) {
    return {path, path.extension().string(), requested_size};
}

} // namespace coverthumb
