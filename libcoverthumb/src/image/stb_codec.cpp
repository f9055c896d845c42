//
// Created by Giuseppe Francione on 07/12/25.
//

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#define STBI_ONLY_GIF
#define STBI_ONLY_BMP
#define STBI_NO_STDIO

#include "../../include/image_codec.hpp"
#include "../../include/cover_error.hpp"
#include "../../include/logger.hpp"
#include <stb_image.h>
#include <stb_image_resize.h>
#include <cstring>
#include <stdexcept>
#include <string>

namespace coverthumb {

RgbaImage decode_stb(const std::span<const std::uint8_t> bytes) {
    int width = 0, height = 0, channels = 0;
    if (!stbi_info_from_memory(bytes.data(), static_cast<int>(bytes.size()), &width, &height, &channels)) {
        throw CoverError(ErrorKind::DecodeError, std::string("stb_image: ") + stbi_failure_reason());
    }
    if (static_cast<std::uint32_t>(width) > kMaxImageDimension ||
        static_cast<std::uint32_t>(height) > kMaxImageDimension) {
        throw CoverError(ErrorKind::DecodeError,
                         "image dimensions out of range: " + std::to_string(width) + "x" + std::to_string(height));
    }

    // request 4 channels (RGBA), first frame for animated GIFs
    unsigned char* data = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                                &width, &height, &channels, 4);
    if (!data) {
        const std::string msg = std::string("stb_image: ") + stbi_failure_reason();
        Logger::log(LogLevel::Error, msg, "stb_codec");
        throw CoverError(ErrorKind::DecodeError, msg);
    }

    RgbaImage image;
    image.width = static_cast<std::uint32_t>(width);
    image.height = static_cast<std::uint32_t>(height);
    image.pixels.resize(static_cast<std::size_t>(width) * height * 4);
    std::memcpy(image.pixels.data(), data, image.pixels.size());
    stbi_image_free(data);
    return image;
}

RgbaImage resize_image(const RgbaImage& src, const std::uint32_t width, const std::uint32_t height,
                       const ResampleFilter filter) {
    if (width == 0 || height == 0) {
        throw std::invalid_argument("resize target must be non-empty");
    }

    RgbaImage out;
    out.width = width;
    out.height = height;
    out.pixels.resize(static_cast<std::size_t>(width) * height * 4);

    const stbir_filter kernel = filter == ResampleFilter::CatmullRom ? STBIR_FILTER_CATMULLROM
                                                                      : STBIR_FILTER_DEFAULT;
    const int ok = stbir_resize_uint8_generic(
        src.pixels.data(), static_cast<int>(src.width), static_cast<int>(src.height), 0,
        out.pixels.data(), static_cast<int>(width), static_cast<int>(height), 0,
        4, 3, 0, STBIR_EDGE_CLAMP, kernel, STBIR_COLORSPACE_LINEAR, nullptr);
    if (!ok) {
        throw std::runtime_error("stbir_resize_uint8_generic failed");
    }
    return out;
}

} // namespace coverthumb
