//
// Created by Giuseppe Francione on 09/12/25.
//

/**
 * @file thumbnail_cache.hpp
 * @brief Content-addressed on-disk store of finished thumbnails.
 */

#ifndef COVERTHUMB_THUMBNAIL_CACHE_HPP
#define COVERTHUMB_THUMBNAIL_CACHE_HPP

#include "cache_config.hpp"
#include "thumbnail_request.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace coverthumb {

/**
 * @brief Counters describing cache activity since construction.
 */
struct CacheStats {
    std::uint64_t hits = 0;           ///< requests served from disk
    std::uint64_t misses = 0;         ///< requests that needed a build
    std::uint64_t builds = 0;         ///< times the build function was invoked
    std::uint64_t write_failures = 0; ///< CacheWriteFailure occurrences
};

/**
 * @brief Fingerprint cache in front of a thumbnail builder.
 *
 * @details Entries are `<cache_dir>/<md5-hex>.png`. They are never
 * modified or deleted: a changed source file gets a different key.
 * Writes are atomic and best effort, so a failed write is logged and
 * counted while the freshly built bytes are still returned.
 */
class ThumbnailCache {
public:
    /// Produces PNG bytes for a request; throws CoverError on failure.
    using BuildFn = std::function<std::vector<std::uint8_t>(const ThumbnailRequest&)>;

    ///< Cached files larger than this are ignored.
    static constexpr std::uintmax_t kMaxEntrySize = 64 * 1024 * 1024;

    ThumbnailCache(CacheConfig config, BuildFn build);

    /**
     * @brief Returns the cached thumbnail or builds, stores and returns it.
     * @throws CoverError from the fingerprint (IoError) or the builder.
     */
    std::vector<std::uint8_t> get_or_build(const ThumbnailRequest& request);

    /// @return The key a request would be stored under.
    [[nodiscard]] static std::string key_for(const ThumbnailRequest& request);

    /// @return Stored PNG for a key, or std::nullopt on a miss or unreadable entry.
    [[nodiscard]] std::optional<std::vector<std::uint8_t>> lookup(const std::string& key) const;

    /**
     * @brief Persists PNG bytes under a key.
     * @return false (after logging) if the entry could not be written.
     */
    bool store(const std::string& key, const std::vector<std::uint8_t>& png);

    [[nodiscard]] std::filesystem::path entry_path(const std::string& key) const {
        return config_.cache_dir() / key;
    }

    [[nodiscard]] CacheStats stats() const noexcept;

    [[nodiscard]] const CacheConfig& config() const noexcept { return config_; }

private:
    CacheConfig config_;
    BuildFn build_;
    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> builds_{0};
    std::atomic<std::uint64_t> write_failures_{0};
};

} // namespace coverthumb

#endif // COVERTHUMB_THUMBNAIL_CACHE_HPP
