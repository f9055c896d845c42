//
// Created by Giuseppe Francione on 08/12/25.
//

#include "../../include/cache_config.hpp"
#include "../../include/logger.hpp"
#include <cstdlib>
#include <system_error>

namespace coverthumb {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTag = "CacheConfig";

fs::path env_path(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return {};
    fs::path p(value);
    return p.is_absolute() ? p : fs::path();
}

} // namespace

fs::path CacheConfig::default_cache_dir() {
    if (const auto xdg = env_path("XDG_CACHE_HOME"); !xdg.empty()) {
        return xdg / "coverthumb" / "thumbnails";
    }
    if (const auto home = env_path("HOME"); !home.empty()) {
        return home / ".cache" / "coverthumb" / "thumbnails";
    }
    std::error_code ec;
    const auto tmp = fs::temp_directory_path(ec);
    return (ec ? fs::path("/tmp") : tmp) / "coverthumb" / "thumbnails";
}

std::vector<fs::path> CacheConfig::default_overlay_search_paths() {
    std::error_code ec;
    const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        Logger::log(LogLevel::Debug, "Cannot resolve executable path, no overlay fallbacks", kTag);
        return {};
    }
    const fs::path dir = exe.parent_path();
    return {
        dir / "icon.png",
        dir / "resources" / "icon.png",
        dir.parent_path() / "resources" / "icon.png",
        dir.parent_path() / "share" / "coverthumb" / "icon.png",
    };
}

CacheConfig CacheConfig::from_environment() {
    CacheConfig config;
    config.cache_dir_ = default_cache_dir();
    config.overlay_search_paths_ = default_overlay_search_paths();

    std::error_code ec;
    fs::create_directories(config.cache_dir_, ec);
    if (ec) {
        Logger::log(LogLevel::Warning,
            "Cannot create cache directory " + config.cache_dir_.string() + " (" + ec.message() + ")", kTag);
    } else {
        Logger::log(LogLevel::Debug, "Cache directory: " + config.cache_dir_.string(), kTag);
    }
    return config;
}

CacheConfig CacheConfig::with_cache_dir(fs::path dir) const {
    CacheConfig copy = *this;
    copy.cache_dir_ = std::move(dir);
    return copy;
}

CacheConfig CacheConfig::without_cache() const {
    CacheConfig copy = *this;
    copy.cache_dir_.clear();
    return copy;
}

CacheConfig CacheConfig::with_overlay_search_paths(std::vector<fs::path> paths) const {
    CacheConfig copy = *this;
    copy.overlay_search_paths_ = std::move(paths);
    return copy;
}

CacheConfig CacheConfig::with_embedded_overlay(const bool enabled) const {
    CacheConfig copy = *this;
    copy.use_embedded_overlay_ = enabled;
    return copy;
}

} // namespace coverthumb
