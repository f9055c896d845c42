//
// Created by Giuseppe Francione on 04/12/25.
//

/**
 * @file epub_extractor.hpp
 * @brief Defines the IExtractor implementation for EPUB books.
 */

#ifndef COVERTHUMB_EPUB_EXTRACTOR_HPP
#define COVERTHUMB_EPUB_EXTRACTOR_HPP

#include "extractor.hpp"
#include <array>
#include <span>
#include <string>
#include <string_view>

namespace coverthumb {

    class ArchiveReader;

    /**
     * @brief Implements IExtractor for EPUB (zip + OPF) using libarchive.
     *
     * @details Three ordered passes, the first hit wins:
     *  1. entry names containing "cover" or "front" (exact "cover." names
     *     first, then larger declared size);
     *  2. the OPF manifest: `<meta name="cover">` or an item with
     *     `properties="cover-image"`, else the first raster manifest item;
     *  3. the largest image entry in the archive.
     */
    class EpubExtractor final : public IExtractor {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "EpubExtractor";
        }

        [[nodiscard]] BookFormat get_format() const noexcept override {
            return BookFormat::Epub;
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { "epub" };
            return {kExts.data(), kExts.size()};
        }

        // --- operations ---

        /**
         * @brief Extracts the cover of an EPUB.
         * @return Cover bytes, or std::nullopt if the archive holds no image.
         * @throws CoverError(ContainerError) if the stream is not a readable zip.
         */
        std::optional<CoverBytes> extract(std::istream& in, std::uint32_t requested_size) override;

        /**
         * @brief Resolves the cover path declared by the package document.
         *
         * Follows META-INF/container.xml to the OPF, then its cover
         * declaration, falling back to the first raster manifest item.
         *
         * @return Archive path of an existing entry, or empty.
         */
        [[nodiscard]] static std::string resolve_manifest_cover(ArchiveReader& zip);

        /**
         * @brief Joins an OPF-relative href onto the OPF directory.
         *
         * Percent-escapes are decoded, any fragment is dropped and "." / ".."
         * segments are folded.
         */
        [[nodiscard]] static std::string join_archive_path(std::string_view base_dir, std::string_view href);
    };

} // namespace coverthumb

#endif // COVERTHUMB_EPUB_EXTRACTOR_HPP
