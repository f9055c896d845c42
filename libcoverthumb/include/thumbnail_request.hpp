//
// Created by Giuseppe Francione on 08/12/25.
//

#ifndef COVERTHUMB_THUMBNAIL_REQUEST_HPP
#define COVERTHUMB_THUMBNAIL_REQUEST_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace coverthumb {

/**
 * @brief Immutable description of one thumbnail request.
 *
 * The extension (lowercase, no dot) alone decides which extractor runs.
 */
class ThumbnailRequest {
public:
    static constexpr std::uint32_t kMaxRequestedSize = 4096;

    /**
     * @param path Source file.
     * @param extension Extension in any case, with or without a leading dot.
     * @param requested_size Square edge in pixels, 1..kMaxRequestedSize.
     * @throws std::invalid_argument on an out-of-range size.
     */
    ThumbnailRequest(std::filesystem::path path, std::string_view extension, std::uint32_t requested_size);

    /// Builds a request whose extension is taken from the path.
    static ThumbnailRequest from_path(const std::filesystem::path& path, std::uint32_t requested_size);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& extension() const noexcept { return extension_; }
    [[nodiscard]] std::uint32_t requested_size() const noexcept { return requested_size_; }

private:
    std::filesystem::path path_;
    std::string extension_;
    std::uint32_t requested_size_;
};

} // namespace coverthumb

#endif // COVERTHUMB_THUMBNAIL_REQUEST_HPP
