//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file book_format.hpp
 * @brief Defines the e-book format families and extension helpers.
 *
 * The extension alone decides which extractor runs; file content is
 * never sniffed to pick a format.
 */

#ifndef COVERTHUMB_BOOK_FORMAT_HPP
#define COVERTHUMB_BOOK_FORMAT_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace coverthumb {

/**
 * @brief Format families, one per extractor.
 *
 * Mobi covers the whole Palm-database family (mobi, azw, azw3, kf8, prc).
 * ComicArchive covers cbz and cbr.
 */
enum class BookFormat {
    Epub,
    Mobi,
    ComicArchive,
    Fb2,
    Txt,
    Unsupported
};

/**
 * @brief Lowercases an extension and strips a single leading dot.
 * @param ext Extension as given by the caller (".EPUB", "Epub", "epub").
 * @return Normalised extension ("epub").
 */
inline std::string normalize_extension(std::string_view ext) {
    if (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);
    std::string s(ext);
    std::ranges::transform(s, s.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief Maps a normalised extension to its format family.
 * @param ext Lowercase extension without dot.
 * @return The family, or BookFormat::Unsupported.
 */
inline BookFormat classify_extension(const std::string_view ext) {
    if (ext == "epub") return BookFormat::Epub;
    if (ext == "mobi" || ext == "azw" || ext == "azw3" || ext == "kf8" || ext == "prc")
        return BookFormat::Mobi;
    if (ext == "cbz" || ext == "cbr") return BookFormat::ComicArchive;
    if (ext == "fb2") return BookFormat::Fb2;
    if (ext == "txt") return BookFormat::Txt;
    return BookFormat::Unsupported;
}

/**
 * @brief Converts a BookFormat to a lowercase display name.
 */
inline std::string_view book_format_to_string(const BookFormat fmt) {
    switch (fmt) {
        case BookFormat::Epub:         return "epub";
        case BookFormat::Mobi:         return "mobi";
        case BookFormat::ComicArchive: return "comic";
        case BookFormat::Fb2:          return "fb2";
        case BookFormat::Txt:          return "txt";
        case BookFormat::Unsupported:  return "unsupported";
    }
    return "unsupported";
}

/**
 * @brief Checks whether an archive entry name has a raster image extension.
 *
 * Comparison is case-insensitive. Recognised: jpg, jpeg, png, gif, webp, bmp.
 */
inline bool has_image_extension(std::string_view name) {
    std::string s(name);
    std::ranges::transform(s, s.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    for (const std::string_view suffix : {".jpg", ".jpeg", ".png", ".gif", ".webp", ".bmp"}) {
        if (s.ends_with(suffix)) return true;
    }
    return false;
}

} // namespace coverthumb

#endif // COVERTHUMB_BOOK_FORMAT_HPP
