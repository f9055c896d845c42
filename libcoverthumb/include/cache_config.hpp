//
// Created by Giuseppe Francione on 08/12/25.
//

/**
 * @file cache_config.hpp
 * @brief Immutable configuration shared by the cache and the compositor.
 */

#ifndef COVERTHUMB_CACHE_CONFIG_HPP
#define COVERTHUMB_CACHE_CONFIG_HPP

#include <filesystem>
#include <vector>

namespace coverthumb {

/**
 * @brief Where thumbnails are persisted and where the overlay icon is found.
 *
 * Built once per process (typically with from_environment()) and passed
 * by value to every component that needs it. The with_* helpers return
 * modified copies; a CacheConfig never changes after construction.
 */
class CacheConfig {
public:
    /// No persistent cache, no filesystem overlay fallback, embedded overlay enabled.
    CacheConfig() = default;

    /**
     * @brief Resolves the per-user configuration.
     *
     * Cache directory: $XDG_CACHE_HOME/coverthumb/thumbnails, else
     * $HOME/.cache/coverthumb/thumbnails, else <temp>/coverthumb/thumbnails.
     * The directory is created if possible; failures show up later as
     * logged cache write failures.
     */
    static CacheConfig from_environment();

    /// @return Platform cache directory, without creating it.
    static std::filesystem::path default_cache_dir();

    /// @return Filesystem fallbacks for the overlay icon, relative to the running executable.
    static std::vector<std::filesystem::path> default_overlay_search_paths();

    [[nodiscard]] CacheConfig with_cache_dir(std::filesystem::path dir) const;
    [[nodiscard]] CacheConfig without_cache() const;
    [[nodiscard]] CacheConfig with_overlay_search_paths(std::vector<std::filesystem::path> paths) const;
    [[nodiscard]] CacheConfig with_embedded_overlay(bool enabled) const;

    /// @return Thumbnail directory; empty when nothing is persisted.
    [[nodiscard]] const std::filesystem::path& cache_dir() const noexcept { return cache_dir_; }

    /// @return True if thumbnails are read from and written to disk.
    [[nodiscard]] bool persistent() const noexcept { return !cache_dir_.empty(); }

    [[nodiscard]] const std::vector<std::filesystem::path>& overlay_search_paths() const noexcept {
        return overlay_search_paths_;
    }

    [[nodiscard]] bool use_embedded_overlay() const noexcept { return use_embedded_overlay_; }

private:
    std::filesystem::path cache_dir_;
    std::vector<std::filesystem::path> overlay_search_paths_;
    bool use_embedded_overlay_ = true;
};

} // namespace coverthumb

#endif // COVERTHUMB_CACHE_CONFIG_HPP
