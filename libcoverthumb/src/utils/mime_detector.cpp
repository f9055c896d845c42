//
// Created by Giuseppe Francione on 11/10/25.
//

#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <magic.h>
#include <memory>
#include <string>
#include <type_traits>

namespace {

struct MagicCloser {
    void operator()(const magic_t m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

// loads the system database once; null when libmagic cannot be initialised
unique_magic open_cookie()
{
    unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) {
        Logger::log(LogLevel::Error, "magic_open failed", "libmagic");
        return nullptr;
    }
    if (magic_load(magic.get(), nullptr) != 0)
    {
        const char* err = magic_error(magic.get());
        Logger::log(LogLevel::Error, std::string("magic_load failed: ") + (err ? err : "unknown"), "libmagic");
        return nullptr;
    }
    return magic;
}

} // namespace

std::string coverthumb::MimeDetector::detect_buffer(const std::span<const std::uint8_t> data)
{
    // magic_t is not thread safe, so each thread keeps its own cookie
    thread_local const unique_magic magic = open_cookie();
    if (!magic) return {};
    const char* mime = magic_buffer(magic.get(), data.data(), data.size());
    return mime ? mime : "";
}
