//
// Created by Giuseppe Francione on 06/12/25.
//

#include "../../include/image_codec.hpp"
#include "../../include/cover_error.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <cstring>
#include <string>

namespace coverthumb {

RgbaImage decode_webp(const std::span<const std::uint8_t> bytes) {
    int width = 0, height = 0;
    if (!WebPGetInfo(bytes.data(), bytes.size(), &width, &height)) {
        Logger::log(LogLevel::Error, "WebP header is invalid", "webp_codec");
        throw CoverError(ErrorKind::DecodeError, "WebP header is invalid");
    }
    if (width <= 0 || height <= 0 ||
        static_cast<std::uint32_t>(width) > kMaxImageDimension ||
        static_cast<std::uint32_t>(height) > kMaxImageDimension) {
        throw CoverError(ErrorKind::DecodeError,
                         "WebP dimensions out of range: " + std::to_string(width) + "x" + std::to_string(height));
    }

    uint8_t* decoded = WebPDecodeRGBA(bytes.data(), bytes.size(), &width, &height);
    if (!decoded) {
        Logger::log(LogLevel::Error, "WebP decode failed (RGBA)", "webp_codec");
        throw CoverError(ErrorKind::DecodeError, "WebP decode failed");
    }

    RgbaImage image;
    image.width = static_cast<std::uint32_t>(width);
    image.height = static_cast<std::uint32_t>(height);
    image.pixels.resize(static_cast<std::size_t>(width) * height * 4);
    std::memcpy(image.pixels.data(), decoded, image.pixels.size());
    WebPFree(decoded);
    return image;
}

} // namespace coverthumb
