//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/txt_extractor.hpp"
#include "../../include/byte_reader.hpp"
#include "../../include/cover_error.hpp"
#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include <string>

namespace coverthumb {

namespace {

constexpr std::array<std::uint8_t, 4> kFill = {245, 245, 245, 255};
constexpr std::array<std::uint8_t, 4> kBorder = {200, 200, 200, 255};

void paint(RgbaImage& img, const std::uint32_t x, const std::uint32_t y) {
    std::uint8_t* px = img.at(x, y);
    for (int c = 0; c < 4; ++c) px[c] = kBorder[c];
}

} // namespace

std::optional<CoverBytes> TxtExtractor::extract(std::istream& in, const std::uint32_t requested_size) {
    if (requested_size == 0) {
        throw CoverError(ErrorKind::DecodeError, "placeholder size must be positive");
    }
    in.clear();
    in.seekg(0, std::ios::beg);
    const auto probe = read_up_to(in, kProbeSize);
    Logger::log(LogLevel::Debug, "Text placeholder, probed " + std::to_string(probe.size()) + " bytes",
                "TxtExtractor");

    RgbaImage img(requested_size, requested_size, kFill);
    const std::uint32_t last = requested_size - 1;
    for (std::uint32_t i = 0; i < requested_size; ++i) {
        paint(img, i, 0);
        paint(img, i, last);
        paint(img, 0, i);
        paint(img, last, i);
    }
    return encode_png(img);
}

} // namespace coverthumb
