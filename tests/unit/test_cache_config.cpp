//
// Created by Giuseppe Francione on 14/12/25.
//

#include "../../libcoverthumb/include/cache_config.hpp"
#include "../../libcoverthumb/include/thumbnail_request.hpp"
#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

using namespace coverthumb;
using namespace coverthumb::test;

namespace {

// sets an environment variable for the lifetime of the object
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) old_ = old;
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }
    ~ScopedEnv() {
        if (old_) {
            ::setenv(name_, old_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
    std::optional<std::string> old_;
};

} // namespace

TEST_CASE("Default cache directory resolution", "[config]") {
    TempDir tmp;

    SECTION("XDG_CACHE_HOME wins when absolute") {
        ScopedEnv xdg("XDG_CACHE_HOME", tmp.path().c_str());
        CHECK(CacheConfig::default_cache_dir() == tmp.path() / "coverthumb" / "thumbnails");
    }

    SECTION("relative XDG_CACHE_HOME is ignored in favour of HOME") {
        ScopedEnv xdg("XDG_CACHE_HOME", "relative/cache");
        ScopedEnv home("HOME", tmp.path().c_str());
        CHECK(CacheConfig::default_cache_dir() == tmp.path() / ".cache" / "coverthumb" / "thumbnails");
    }

    SECTION("without either variable the temp directory is used") {
        ScopedEnv xdg("XDG_CACHE_HOME", nullptr);
        ScopedEnv home("HOME", nullptr);
        const auto dir = CacheConfig::default_cache_dir();
        CHECK(dir.filename() == "thumbnails");
        CHECK(dir.parent_path().filename() == "coverthumb");
    }

    SECTION("from_environment creates the directory") {
        ScopedEnv xdg("XDG_CACHE_HOME", tmp.path().c_str());
        const CacheConfig config = CacheConfig::from_environment();
        CHECK(config.persistent());
        CHECK(config.use_embedded_overlay());
        CHECK(std::filesystem::is_directory(config.cache_dir()));
    }
}

TEST_CASE("CacheConfig modifiers return adjusted copies", "[config]") {
    const CacheConfig base;
    CHECK_FALSE(base.persistent());
    CHECK(base.use_embedded_overlay());
    CHECK(base.overlay_search_paths().empty());

    const CacheConfig with_dir = base.with_cache_dir("/var/tmp/thumbs");
    CHECK(with_dir.persistent());
    CHECK(with_dir.cache_dir() == "/var/tmp/thumbs");
    CHECK_FALSE(base.persistent());

    CHECK_FALSE(with_dir.without_cache().persistent());

    const CacheConfig custom = base.with_overlay_search_paths({"/a/icon.png", "/b/icon.png"})
                                   .with_embedded_overlay(false);
    CHECK(custom.overlay_search_paths().size() == 2);
    CHECK_FALSE(custom.use_embedded_overlay());
}

TEST_CASE("ThumbnailRequest validation", "[config]") {
    SECTION("extension comes from the path, normalised") {
        const auto request = ThumbnailRequest::from_path("/books/Novel.EPUB", 256);
        CHECK(request.extension() == "epub");
        CHECK(request.requested_size() == 256);
        CHECK(request.path() == "/books/Novel.EPUB");
    }

    SECTION("explicit extension") {
        CHECK(ThumbnailRequest("/x/y", ".Cbr", 1).extension() == "cbr");
    }

    SECTION("size bounds") {
        CHECK_NOTHROW(ThumbnailRequest("/x.txt", "txt", 1));
        CHECK_NOTHROW(ThumbnailRequest("/x.txt", "txt", ThumbnailRequest::kMaxRequestedSize));
        CHECK_THROWS_AS(ThumbnailRequest("/x.txt", "txt", 0), std::invalid_argument);
        CHECK_THROWS_AS(ThumbnailRequest("/x.txt", "txt", ThumbnailRequest::kMaxRequestedSize + 1),
                        std::invalid_argument);
    }
}
