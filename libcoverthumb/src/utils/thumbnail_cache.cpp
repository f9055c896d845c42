//
// Created by Giuseppe Francione on 09/12/25.
//

#include "../../include/thumbnail_cache.hpp"
#include "../../include/cover_error.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/fingerprint.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <system_error>

namespace coverthumb {

namespace {

constexpr std::string_view kTag = "ThumbnailCache";
constexpr std::array<std::uint8_t, 8> kPngSignature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

} // namespace

ThumbnailCache::ThumbnailCache(CacheConfig config, BuildFn build)
    : config_(std::move(config)), build_(std::move(build)) {}

std::string ThumbnailCache::key_for(const ThumbnailRequest& request) {
    return compute_cache_key(request.path(), request.extension(), request.requested_size());
}

std::optional<std::vector<std::uint8_t>> ThumbnailCache::lookup(const std::string& key) const {
    if (!config_.persistent()) return std::nullopt;

    const auto path = entry_path(key);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;

    auto data = read_file(path, kMaxEntrySize);
    if (!data || data->size() < kPngSignature.size() ||
        !std::equal(kPngSignature.begin(), kPngSignature.end(), data->begin())) {
        Logger::log(LogLevel::Debug, "Ignoring unreadable cache entry " + path.string(), kTag);
        return std::nullopt;
    }
    return data;
}

bool ThumbnailCache::store(const std::string& key, const std::vector<std::uint8_t>& png) {
    if (!config_.persistent()) return true;

    std::error_code ec;
    std::filesystem::create_directories(config_.cache_dir(), ec);
    if (!ec && write_file_atomic(entry_path(key), png, kTag)) {
        return true;
    }

    ++write_failures_;
    Logger::log(LogLevel::Warning,
        std::string(to_string(ErrorKind::CacheWriteFailure)) + ": " + entry_path(key).string() +
        (ec ? " (" + ec.message() + ")" : std::string()), kTag);
    return false;
}

std::vector<std::uint8_t> ThumbnailCache::get_or_build(const ThumbnailRequest& request) {
    const std::string key = key_for(request);

    if (auto cached = lookup(key)) {
        ++hits_;
        Logger::log(LogLevel::Debug, "Cache hit " + key + " for " + request.path().string(), kTag);
        return std::move(*cached);
    }

    ++misses_;
    Logger::log(LogLevel::Debug, "Cache miss " + key + " for " + request.path().string(), kTag);

    ++builds_;
    std::vector<std::uint8_t> png = build_(request);
    if (!store(key, png)) {
        Logger::log(LogLevel::Debug, "Returning unpersisted thumbnail " + key, kTag);
    }
    return png;
}

CacheStats ThumbnailCache::stats() const noexcept {
    return {hits_.load(), misses_.load(), builds_.load(), write_failures_.load()};
}

} // namespace coverthumb
