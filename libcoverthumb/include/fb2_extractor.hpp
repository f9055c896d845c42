//
// Created by Giuseppe Francione on 05/12/25.
//

/**
 * @file fb2_extractor.hpp
 * @brief Defines the IExtractor implementation for FictionBook 2 documents.
 */

#ifndef COVERTHUMB_FB2_EXTRACTOR_HPP
#define COVERTHUMB_FB2_EXTRACTOR_HPP

#include "extractor.hpp"
#include <array>
#include <optional>
#include <span>
#include <string_view>

namespace coverthumb {

    /**
     * @brief Implements IExtractor for FB2.
     *
     * @details Reads the `#id` reference inside `<coverpage>` (bounded to
     * kCoverpageScanLimit characters) and decodes the matching `<binary>`
     * payload with OpenSSL's base64 decoder. If the id has no binary, the
     * first binary of the document is used.
     */
    class Fb2Extractor final : public IExtractor {
    public:
        static constexpr std::size_t kCoverpageScanLimit = 500;
        static constexpr std::size_t kMaxDocumentSize = 64 * 1024 * 1024;

        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "Fb2Extractor";
        }

        [[nodiscard]] BookFormat get_format() const noexcept override {
            return BookFormat::Fb2;
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { "fb2" };
            return {kExts.data(), kExts.size()};
        }

        /**
         * @brief Extracts the cover of an FB2 document.
         * @return Decoded bytes, or std::nullopt when there is no coverpage,
         *         no binary, or the payload is not valid base64.
         */
        std::optional<CoverBytes> extract(std::istream& in, std::uint32_t requested_size) override;

        /**
         * @brief Decodes standard base64, ignoring whitespace.
         * @return Decoded bytes, or std::nullopt on an invalid payload.
         */
        [[nodiscard]] static std::optional<CoverBytes> decode_base64(std::string_view text);
    };

} // namespace coverthumb

#endif // COVERTHUMB_FB2_EXTRACTOR_HPP
