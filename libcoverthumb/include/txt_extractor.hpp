//
// Created by Giuseppe Francione on 05/12/25.
//

#ifndef COVERTHUMB_TXT_EXTRACTOR_HPP
#define COVERTHUMB_TXT_EXTRACTOR_HPP

#include "extractor.hpp"
#include <array>
#include <span>
#include <string_view>

namespace coverthumb {

    /**
     * @brief Synthesises a placeholder cover for plain text files.
     *
     * @details A flat light-grey square of the requested size with a
     * one-pixel darker border, encoded as PNG. Content is never inspected
     * beyond reading the first kProbeSize bytes.
     */
    class TxtExtractor final : public IExtractor {
    public:
        static constexpr std::size_t kProbeSize = 4096;

        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "TxtExtractor";
        }

        [[nodiscard]] BookFormat get_format() const noexcept override {
            return BookFormat::Txt;
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { "txt" };
            return {kExts.data(), kExts.size()};
        }

        /**
         * @brief Always produces a placeholder if the stream is readable.
         * @throws CoverError(IoError) if the stream cannot be read.
         */
        std::optional<CoverBytes> extract(std::istream& in, std::uint32_t requested_size) override;
    };

} // namespace coverthumb

#endif // COVERTHUMB_TXT_EXTRACTOR_HPP
