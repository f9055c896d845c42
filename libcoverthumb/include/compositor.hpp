//
// Created by Giuseppe Francione on 07/12/25.
//

/**
 * @file compositor.hpp
 * @brief Turns cover bytes into a branded square-bounded PNG thumbnail.
 */

#ifndef COVERTHUMB_COMPOSITOR_HPP
#define COVERTHUMB_COMPOSITOR_HPP

#include "image_codec.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace coverthumb {

/**
 * @brief Resizes a cover and stamps the brand icon in its bottom-right corner.
 *
 * @details The cover is scaled to fit within size x size keeping its
 * aspect ratio. The icon is scaled to fit clamp(size / 5, 24, 48) pixels
 * with a Catmull-Rom filter and alpha-blended kOverlayMargin pixels from
 * the right and bottom edges. Without an icon the cover is still produced.
 */
class Compositor {
public:
    static constexpr std::uint32_t kOverlayDivisor = 5;
    static constexpr std::uint32_t kOverlayMin = 24;
    static constexpr std::uint32_t kOverlayMax = 48;
    static constexpr std::uint32_t kOverlayMargin = 4;
    static constexpr std::uintmax_t kMaxOverlayFileSize = 4 * 1024 * 1024;

    /**
     * @param overlay Decoded brand icon, or std::nullopt to skip branding.
     */
    explicit Compositor(std::optional<RgbaImage> overlay = std::nullopt);

    /**
     * @brief Loads the brand icon.
     *
     * Tries the icon embedded at build time first (if enabled), then each
     * search path in order. Unreadable or undecodable candidates are logged
     * and skipped.
     *
     * @return The first icon that decodes, or std::nullopt.
     */
    static std::optional<RgbaImage> load_overlay(bool use_embedded,
                                                 const std::vector<std::filesystem::path>& search_paths);

    /**
     * @brief Produces the final thumbnail.
     * @param cover Encoded cover image.
     * @param size Bounding square edge in pixels.
     * @return PNG bytes.
     * @throws CoverError(DecodeError) if the cover cannot be decoded.
     */
    [[nodiscard]] std::vector<std::uint8_t> compose(std::span<const std::uint8_t> cover, std::uint32_t size) const;

    /// @return Dimensions of src scaled to fit a size x size box, each at least 1.
    [[nodiscard]] static std::pair<std::uint32_t, std::uint32_t>
    fit_dimensions(std::uint32_t width, std::uint32_t height, std::uint32_t size);

    /// @return Overlay edge for a thumbnail size: clamp(size / 5, 24, 48).
    [[nodiscard]] static std::uint32_t overlay_edge(std::uint32_t size) noexcept;

    /**
     * @brief Alpha-blends overlay onto base with its top-left at (x, y).
     *
     * Pixels outside base are clipped. Overlay alpha 0 leaves the base pixel
     * untouched; any other alpha blends RGB and forces base alpha to 255.
     */
    static void blend_overlay(RgbaImage& base, const RgbaImage& overlay, std::uint32_t x, std::uint32_t y);

    [[nodiscard]] bool has_overlay() const noexcept { return overlay_.has_value(); }

private:
    std::optional<RgbaImage> overlay_;
};

} // namespace coverthumb

#endif // COVERTHUMB_COMPOSITOR_HPP
