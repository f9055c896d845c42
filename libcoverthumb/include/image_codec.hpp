//
// Created by Giuseppe Francione on 06/12/25.
//

/**
 * @file image_codec.hpp
 * @brief RGBA8 image buffer with decoders, a PNG encoder and a resampler.
 *
 * Decoders: libpng, libjpeg, libwebp, and stb_image for GIF and BMP. The
 * decoder is chosen by sniffing the bytes with libmagic, never by name.
 */

#ifndef COVERTHUMB_IMAGE_CODEC_HPP
#define COVERTHUMB_IMAGE_CODEC_HPP

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace coverthumb {

///< Decoded images larger than this on either side are refused.
inline constexpr std::uint32_t kMaxImageDimension = 16384;

/**
 * @brief Owned 8-bit RGBA image, rows top to bottom, no padding.
 */
struct RgbaImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> pixels;

    RgbaImage() = default;

    /// Creates a width x height image filled with one colour.
    RgbaImage(std::uint32_t w, std::uint32_t h, std::array<std::uint8_t, 4> fill);

    [[nodiscard]] bool empty() const noexcept { return width == 0 || height == 0; }

    std::uint8_t* at(const std::uint32_t x, const std::uint32_t y) {
        return pixels.data() + (static_cast<std::size_t>(y) * width + x) * 4;
    }

    [[nodiscard]] const std::uint8_t* at(const std::uint32_t x, const std::uint32_t y) const {
        return pixels.data() + (static_cast<std::size_t>(y) * width + x) * 4;
    }
};

/**
 * @brief Resampling kernels offered by resize_image().
 */
enum class ResampleFilter {
    Default,   ///< stb's default (Mitchell when shrinking, Catmull-Rom when enlarging)
    CatmullRom ///< sharp cubic, used for small overlay icons
};

/**
 * @brief Decodes any supported raster format to RGBA8.
 *
 * @param bytes Encoded image.
 * @return The decoded image.
 * @throws CoverError(DecodeError) for unknown formats, corrupt data or
 *         images beyond kMaxImageDimension.
 */
RgbaImage decode_image(std::span<const std::uint8_t> bytes);

/// libpng decoder. @throws CoverError(DecodeError)
RgbaImage decode_png(std::span<const std::uint8_t> bytes);

/// libjpeg decoder (grayscale, YCbCr and Adobe CMYK). @throws CoverError(DecodeError)
RgbaImage decode_jpeg(std::span<const std::uint8_t> bytes);

/// libwebp decoder. @throws CoverError(DecodeError)
RgbaImage decode_webp(std::span<const std::uint8_t> bytes);

/// stb_image decoder for GIF (first frame) and BMP. @throws CoverError(DecodeError)
RgbaImage decode_stb(std::span<const std::uint8_t> bytes);

/**
 * @brief Encodes an image as an RGBA PNG in memory.
 *
 * Output is deterministic: identical pixels always give identical bytes.
 *
 * @throws CoverError(DecodeError) if libpng fails.
 */
std::vector<std::uint8_t> encode_png(const RgbaImage& image);

/**
 * @brief Resamples an image to exactly width x height.
 * @throws std::invalid_argument on a zero target size,
 *         std::runtime_error if stb_image_resize fails.
 */
RgbaImage resize_image(const RgbaImage& src, std::uint32_t width, std::uint32_t height,
                       ResampleFilter filter = ResampleFilter::Default);

} // namespace coverthumb

#endif // COVERTHUMB_IMAGE_CODEC_HPP
