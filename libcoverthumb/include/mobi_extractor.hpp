//
// Created by Giuseppe Francione on 05/12/25.
//

/**
 * @file mobi_extractor.hpp
 * @brief Defines the IExtractor implementation for the Mobipocket family.
 */

#ifndef COVERTHUMB_MOBI_EXTRACTOR_HPP
#define COVERTHUMB_MOBI_EXTRACTOR_HPP

#include "extractor.hpp"
#include <array>
#include <span>
#include <string_view>

namespace coverthumb {

    /**
     * @brief Implements IExtractor for MOBI, AZW, AZW3, KF8 and PRC.
     *
     * @details Walks the Palm database record table, the MOBI header of
     * record 0 and its EXTH block. EXTH record 201 (CoverOffset) is added
     * to the first-image index to locate the cover record.
     */
    class MobiExtractor final : public IExtractor {
    public:
        static constexpr std::size_t kPdbHeaderSize = 78;
        static constexpr std::size_t kMobiHeaderSize = 256;
        static constexpr std::uint32_t kExthFlag = 0x40;
        static constexpr std::uint32_t kExthCoverOffset = 201;

        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "MobiExtractor";
        }

        [[nodiscard]] BookFormat get_format() const noexcept override {
            return BookFormat::Mobi;
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 5> kExts = { "mobi", "azw", "azw3", "kf8", "prc" };
            return {kExts.data(), kExts.size()};
        }

        /**
         * @brief Extracts the cover record of a Mobipocket database.
         * @return Record bytes if they start with a JPEG, PNG or GIF signature,
         *         std::nullopt otherwise or when the cover index is out of range.
         * @throws CoverError(ContainerError) on bad markers, a missing EXTH block
         *         or any short read.
         */
        std::optional<CoverBytes> extract(std::istream& in, std::uint32_t requested_size) override;
    };

} // namespace coverthumb

#endif // COVERTHUMB_MOBI_EXTRACTOR_HPP
