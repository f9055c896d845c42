//
// Created by Giuseppe Francione on 06/12/25.
//

#include "../../include/image_codec.hpp"
#include "../../include/cover_error.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <cstring>
#include <string>

namespace coverthumb {

namespace {

constexpr int kCompressionLevel = 6;

/**
 * @brief libpng error handler that throws a C++ exception.
 * @param msg The error message from libpng.
 */
void png_error_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Error, std::string("libpng: ") + msg, "libpng");
    throw CoverError(ErrorKind::DecodeError, std::string("libpng: ") + msg);
}

void png_warning_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
}

/**
 * @brief RAII wrapper for libpng read structs.
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    explicit PngRead() = default;

    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
};

/**
 * @brief RAII wrapper for libpng write structs.
 */
struct PngWrite {
    png_structp png = nullptr;
    png_infop info = nullptr;

    explicit PngWrite() = default;

    ~PngWrite() {
        if (png || info) png_destroy_write_struct(&png, &info);
    }
};

struct MemorySource {
    const std::uint8_t* data;
    std::size_t size;
    std::size_t offset;
};

void read_from_memory(const png_structp png, const png_bytep out, const png_size_t length) {
    auto* src = static_cast<MemorySource*>(png_get_io_ptr(png));
    if (src->size - src->offset < length) {
        png_error(png, "unexpected end of PNG data");
    }
    std::memcpy(out, src->data + src->offset, length);
    src->offset += length;
}

void write_to_vector(const png_structp png, const png_bytep data, const png_size_t length) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + length);
}

void flush_noop(png_structp) {}

} // namespace

RgbaImage decode_png(const std::span<const std::uint8_t> bytes) {
    if (bytes.size() < 8 || png_sig_cmp(bytes.data(), 0, 8) != 0) {
        throw CoverError(ErrorKind::DecodeError, "not a PNG stream");
    }

    PngRead rd;
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!rd.png) throw CoverError(ErrorKind::DecodeError, "png_create_read_struct failed");
    png_set_error_fn(rd.png, nullptr, png_error_fn, png_warning_fn);
    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw CoverError(ErrorKind::DecodeError, "png_create_info_struct failed");
    if (setjmp(png_jmpbuf(rd.png))) throw CoverError(ErrorKind::DecodeError, "libpng read error");

    MemorySource src{bytes.data(), bytes.size(), 0};
    png_set_read_fn(rd.png, &src, read_from_memory);
    png_read_info(rd.png, rd.info);

    png_uint_32 width, height;
    int bit_depth, color_type;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);
    if (width == 0 || height == 0 || width > kMaxImageDimension || height > kMaxImageDimension) {
        throw CoverError(ErrorKind::DecodeError,
                         "PNG dimensions out of range: " + std::to_string(width) + "x" + std::to_string(height));
    }

    // normalise everything to RGBA8
    if (bit_depth == 16) png_set_strip_16(rd.png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
    if (png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(rd.png);
    if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(rd.png, 0xFF, PNG_FILLER_AFTER);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(rd.png);
    png_set_interlace_handling(rd.png);
    png_read_update_info(rd.png, rd.info);

    const size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
    if (rowbytes != static_cast<size_t>(width) * 4) {
        throw CoverError(ErrorKind::DecodeError, "Rowbytes mismatch, expected RGBA8");
    }

    RgbaImage image;
    image.width = width;
    image.height = height;
    image.pixels.resize(rowbytes * height);
    std::vector<png_bytep> rows(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = image.pixels.data() + y * rowbytes;
    }
    png_read_image(rd.png, rows.data());
    png_read_end(rd.png, nullptr);
    return image;
}

std::vector<std::uint8_t> encode_png(const RgbaImage& image) {
    if (image.empty()) {
        throw CoverError(ErrorKind::DecodeError, "cannot encode an empty image");
    }

    std::vector<std::uint8_t> out;

    PngWrite wr;
    wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!wr.png) throw CoverError(ErrorKind::DecodeError, "png_create_write_struct failed");
    png_set_error_fn(wr.png, nullptr, png_error_fn, png_warning_fn);
    wr.info = png_create_info_struct(wr.png);
    if (!wr.info) throw CoverError(ErrorKind::DecodeError, "png_create_info_struct failed (writer)");
    if (setjmp(png_jmpbuf(wr.png))) throw CoverError(ErrorKind::DecodeError, "libpng write error");

    png_set_write_fn(wr.png, &out, write_to_vector, flush_noop);
    png_set_compression_level(wr.png, kCompressionLevel);
    png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);

    png_set_IHDR(wr.png, wr.info, image.width, image.height, 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    png_write_info(wr.png, wr.info);

    const std::size_t stride = static_cast<std::size_t>(image.width) * 4;
    for (std::uint32_t y = 0; y < image.height; ++y) {
        png_write_row(wr.png, const_cast<png_bytep>(image.pixels.data() + y * stride));
    }
    png_write_end(wr.png, wr.info);
    return out;
}

} // namespace coverthumb
