//
// Created by Giuseppe Francione on 06/12/25.
//

#include "../../include/image_codec.hpp"
#include "../../include/cover_error.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <string>

namespace coverthumb {

RgbaImage::RgbaImage(const std::uint32_t w, const std::uint32_t h, const std::array<std::uint8_t, 4> fill)
    : width(w), height(h), pixels(static_cast<std::size_t>(w) * h * 4) {
    for (std::size_t i = 0; i < pixels.size(); i += 4) {
        pixels[i]     = fill[0];
        pixels[i + 1] = fill[1];
        pixels[i + 2] = fill[2];
        pixels[i + 3] = fill[3];
    }
}

RgbaImage decode_image(const std::span<const std::uint8_t> bytes) {
    if (bytes.empty()) {
        throw CoverError(ErrorKind::DecodeError, "empty image data");
    }

    const std::string mime = MimeDetector::detect_buffer(bytes);
    Logger::log(LogLevel::Debug, "Cover bytes sniffed as " + (mime.empty() ? "<unknown>" : mime), "image_codec");

    if (mime == "image/jpeg") return decode_jpeg(bytes);
    if (mime == "image/png") return decode_png(bytes);
    if (mime == "image/webp") return decode_webp(bytes);
    if (mime == "image/gif" || mime == "image/bmp" || mime == "image/x-ms-bmp") return decode_stb(bytes);

    const std::string msg = "unsupported image type: " + (mime.empty() ? std::string("unknown") : mime);
    Logger::log(LogLevel::Error, msg, "image_codec");
    throw CoverError(ErrorKind::DecodeError, msg);
}

} // namespace coverthumb
