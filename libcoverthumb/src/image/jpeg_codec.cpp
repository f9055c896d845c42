//
// Created by Giuseppe Francione on 06/12/25.
//

#include "../../include/image_codec.hpp"
#include "../../include/cover_error.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <string>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw coverthumb::CoverError(coverthumb::ErrorKind::DecodeError, std::string("libjpeg: ") + err->msg);
}

void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

/**
 * @brief Owns a decompress struct and destroys it on every path.
 */
struct JpegDecompress {
    jpeg_decompress_struct info{};
    bool created = false;

    ~JpegDecompress() {
        if (created) jpeg_destroy_decompress(&info);
    }
};

} // namespace

namespace coverthumb {

RgbaImage decode_jpeg(const std::span<const std::uint8_t> bytes) {
    JpegDecompress dec;
    JpegErrorMgr jerr{};
    dec.info.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.output_message = jpeg_output_message_log;

    jpeg_create_decompress(&dec.info);
    dec.created = true;

    jpeg_mem_src(&dec.info, bytes.data(), static_cast<unsigned long>(bytes.size()));
    if (jpeg_read_header(&dec.info, TRUE) != JPEG_HEADER_OK) {
        throw CoverError(ErrorKind::DecodeError, "Invalid JPEG header");
    }
    if (dec.info.image_width > kMaxImageDimension || dec.info.image_height > kMaxImageDimension) {
        throw CoverError(ErrorKind::DecodeError,
                         "JPEG dimensions out of range: " + std::to_string(dec.info.image_width) + "x" +
                         std::to_string(dec.info.image_height));
    }

    const bool cmyk = dec.info.jpeg_color_space == JCS_CMYK || dec.info.jpeg_color_space == JCS_YCCK;
    dec.info.out_color_space = cmyk ? JCS_CMYK : JCS_RGB;
    jpeg_start_decompress(&dec.info);

    const JDIMENSION width = dec.info.output_width;
    const JDIMENSION height = dec.info.output_height;
    const int channels = dec.info.output_components;

    RgbaImage image(width, height, {0, 0, 0, 255});
    std::vector<JSAMPLE> row(static_cast<std::size_t>(width) * channels);
    while (dec.info.output_scanline < height) {
        const JDIMENSION y = dec.info.output_scanline;
        JSAMPROW rows[1] = { row.data() };
        jpeg_read_scanlines(&dec.info, rows, 1);

        std::uint8_t* dst = image.at(0, y);
        for (JDIMENSION x = 0; x < width; ++x, dst += 4) {
            const JSAMPLE* src = row.data() + static_cast<std::size_t>(x) * channels;
            if (cmyk) {
                // Adobe writes inverted CMYK
                const int k = src[3];
                dst[0] = static_cast<std::uint8_t>(src[0] * k / 255);
                dst[1] = static_cast<std::uint8_t>(src[1] * k / 255);
                dst[2] = static_cast<std::uint8_t>(src[2] * k / 255);
            } else {
                dst[0] = src[0];
                dst[1] = src[1];
                dst[2] = src[2];
            }
        }
    }
    jpeg_finish_decompress(&dec.info);
    return image;
}

} // namespace coverthumb
