//
// Created by Giuseppe Francione on 10/12/25.
//

/**
 * @file coverthumb.cpp
 * @brief Implementation of the public Thumbnailer API.
 */

#include "../../include/coverthumb.hpp"
#include "../../include/compositor.hpp"
#include "../../include/extractor_registry.hpp"
#include "../../include/logger.hpp"
#include <fstream>

namespace coverthumb {

namespace {

constexpr std::string_view kTag = "Thumbnailer";

} // namespace

struct Thumbnailer::Impl {
    CacheConfig config;
    ExtractorRegistry registry;
    Compositor compositor;
    ThumbnailCache cache;

    explicit Impl(CacheConfig cfg)
        : config(std::move(cfg)),
          compositor(Compositor::load_overlay(config.use_embedded_overlay(), config.overlay_search_paths())),
          cache(config, [this](const ThumbnailRequest& r) { return build(r); }) {}

    [[nodiscard]] std::vector<std::uint8_t> build(const ThumbnailRequest& request) const {
        IExtractor* extractor = registry.find_by_extension(request.extension());
        if (!extractor) {
            const std::string msg = "unsupported extension '" + request.extension() + "'";
            Logger::log(LogLevel::Error, msg, kTag);
            throw CoverError(ErrorKind::UnsupportedFormat, msg);
        }
        Logger::log(LogLevel::Debug,
                    std::string(extractor->get_name()) + " handles " + request.path().string(), kTag);

        std::ifstream file(request.path(), std::ios::binary);
        if (!file) {
            const std::string msg = "cannot open " + request.path().string();
            Logger::log(LogLevel::Error, msg, kTag);
            throw CoverError(ErrorKind::IoError, msg);
        }

        const auto cover = extractor->extract(file, request.requested_size());
        if (!cover || cover->empty()) {
            const std::string msg = "no cover found in " + request.path().string();
            Logger::log(LogLevel::Warning, msg, kTag);
            throw CoverError(ErrorKind::NoCoverFound, msg);
        }

        return compositor.compose(*cover, request.requested_size());
    }
};

Thumbnailer::Thumbnailer(CacheConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

Thumbnailer::~Thumbnailer() = default;
Thumbnailer::Thumbnailer(Thumbnailer&&) noexcept = default;
Thumbnailer& Thumbnailer::operator=(Thumbnailer&&) noexcept = default;

std::vector<std::uint8_t> Thumbnailer::get_or_build_thumbnail(const std::filesystem::path& path,
                                                              const std::string_view extension,
                                                              const std::uint32_t size) {
    return get_or_build_thumbnail(ThumbnailRequest(path, extension, size));
}

std::vector<std::uint8_t> Thumbnailer::get_or_build_thumbnail(const std::filesystem::path& path,
                                                              const std::uint32_t size) {
    return get_or_build_thumbnail(ThumbnailRequest::from_path(path, size));
}

std::vector<std::uint8_t> Thumbnailer::get_or_build_thumbnail(const ThumbnailRequest& request) {
    // fail fast: an unsupported extension never needs a fingerprint
    if (!impl_->registry.is_supported(request.extension())) {
        const std::string msg = "unsupported extension '" + request.extension() + "'";
        Logger::log(LogLevel::Error, msg, kTag);
        throw CoverError(ErrorKind::UnsupportedFormat, msg);
    }
    return impl_->cache.get_or_build(request);
}

std::vector<std::uint8_t> Thumbnailer::build_thumbnail(const ThumbnailRequest& request) const {
    return impl_->build(request);
}

std::string Thumbnailer::cache_key(const ThumbnailRequest& request) const {
    return ThumbnailCache::key_for(request);
}

CacheStats Thumbnailer::stats() const {
    return impl_->cache.stats();
}

const CacheConfig& Thumbnailer::config() const {
    return impl_->config;
}

const ExtractorRegistry& Thumbnailer::registry() const {
    return impl_->registry;
}

} // namespace coverthumb
