//
// Created by Giuseppe Francione on 05/12/25.
//

#ifndef COVERTHUMB_COMIC_EXTRACTOR_HPP
#define COVERTHUMB_COMIC_EXTRACTOR_HPP

#include "extractor.hpp"
#include <array>
#include <span>
#include <string_view>

namespace coverthumb {

    /**
     * @brief Implements IExtractor for comic book archives (CBZ and CBR).
     *
     * @details The first image entry in lexicographic name order is the
     * cover. Zip, RAR and RAR5 containers are all read through libarchive.
     */
    class ComicExtractor final : public IExtractor {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "ComicExtractor";
        }

        [[nodiscard]] BookFormat get_format() const noexcept override {
            return BookFormat::ComicArchive;
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 2> kExts = { "cbz", "cbr" };
            return {kExts.data(), kExts.size()};
        }

        std::optional<CoverBytes> extract(std::istream& in, std::uint32_t requested_size) override;
    };

} // namespace coverthumb

#endif // COVERTHUMB_COMIC_EXTRACTOR_HPP
