//
// Created by Giuseppe Francione on 10/12/25.
//

/**
 * @file coverthumb.hpp
 * @brief Public API for the coverthumb library.
 */

#ifndef COVERTHUMB_HPP
#define COVERTHUMB_HPP

#include "cache_config.hpp"
#include "cover_error.hpp"
#include "thumbnail_cache.hpp"
#include "thumbnail_request.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace coverthumb {

class ExtractorRegistry;

/**
 * @brief Entry point for shell integrations.
 *
 * @details Wires dispatcher, extractors, compositor and fingerprint cache
 * together. Every call is synchronous. The only state is the immutable
 * configuration, the loaded overlay icon and the cache counters.
 * Uses PIMPL idiom to hide internal dependencies.
 */
class Thumbnailer {
public:
    /**
     * @param config Cache and overlay configuration, typically
     *        CacheConfig::from_environment().
     */
    explicit Thumbnailer(CacheConfig config);
    ~Thumbnailer();

    Thumbnailer(const Thumbnailer&) = delete;
    Thumbnailer& operator=(const Thumbnailer&) = delete;
    Thumbnailer(Thumbnailer&&) noexcept;
    Thumbnailer& operator=(Thumbnailer&&) noexcept;

    /**
     * @brief Returns PNG bytes for a book, from cache when possible.
     *
     * @param path Source file.
     * @param extension Extension deciding the extractor (any case, optional dot).
     * @param size Square edge in pixels.
     * @throws CoverError for UnsupportedFormat, ContainerError, NoCoverFound,
     *         DecodeError and IoError; std::invalid_argument for a bad size.
     */
    std::vector<std::uint8_t> get_or_build_thumbnail(const std::filesystem::path& path,
                                                     std::string_view extension,
                                                     std::uint32_t size);

    /// Same as above with the extension taken from the path.
    std::vector<std::uint8_t> get_or_build_thumbnail(const std::filesystem::path& path, std::uint32_t size);

    std::vector<std::uint8_t> get_or_build_thumbnail(const ThumbnailRequest& request);

    /**
     * @brief Runs dispatcher, extractor and compositor without touching the cache.
     */
    std::vector<std::uint8_t> build_thumbnail(const ThumbnailRequest& request) const;

    /// @return Cache key for a request (reads the sampled windows of the file).
    [[nodiscard]] std::string cache_key(const ThumbnailRequest& request) const;

    [[nodiscard]] CacheStats stats() const;

    [[nodiscard]] const CacheConfig& config() const;

    [[nodiscard]] const ExtractorRegistry& registry() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace coverthumb

#endif // COVERTHUMB_HPP
