//
// Created by Giuseppe Francione on 07/12/25.
//

#include "../../include/compositor.hpp"
#include "../../include/cover_error.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "overlay_icon.h"
#include <algorithm>
#include <cmath>

namespace coverthumb {

namespace {

constexpr std::string_view kTag = "Compositor";

RgbaImage fit_within(const RgbaImage& src, const std::uint32_t size, const ResampleFilter filter) {
    const auto [w, h] = Compositor::fit_dimensions(src.width, src.height, size);
    if (w == src.width && h == src.height) return src;
    return resize_image(src, w, h, filter);
}

} // namespace

Compositor::Compositor(std::optional<RgbaImage> overlay)
    : overlay_(std::move(overlay)) {
    if (overlay_ && overlay_->empty()) overlay_.reset();
}

std::optional<RgbaImage> Compositor::load_overlay(const bool use_embedded,
                                                  const std::vector<std::filesystem::path>& search_paths) {
    if (use_embedded) {
        try {
            return decode_image({embedded_overlay_icon, embedded_overlay_icon_len});
        } catch (const CoverError& e) {
            Logger::log(LogLevel::Warning, std::string("Embedded overlay icon unusable: ") + e.what(), kTag);
        }
    }

    for (const auto& candidate : search_paths) {
        const auto bytes = read_file(candidate, kMaxOverlayFileSize);
        if (!bytes) continue;
        try {
            RgbaImage icon = decode_image(*bytes);
            Logger::log(LogLevel::Debug, "Overlay icon loaded from " + candidate.string(), kTag);
            return icon;
        } catch (const CoverError& e) {
            Logger::log(LogLevel::Warning, "Overlay icon " + candidate.string() + " unusable: " + e.what(), kTag);
        }
    }

    Logger::log(LogLevel::Warning, "No overlay icon available, thumbnails will be unbranded", kTag);
    return std::nullopt;
}

std::pair<std::uint32_t, std::uint32_t>
Compositor::fit_dimensions(const std::uint32_t width, const std::uint32_t height, const std::uint32_t size) {
    const double ratio = std::min(static_cast<double>(size) / width, static_cast<double>(size) / height);
    const auto scale = [ratio](const std::uint32_t side) {
        return std::max<std::uint32_t>(static_cast<std::uint32_t>(std::lround(side * ratio)), 1);
    };
    return {std::min(scale(width), size), std::min(scale(height), size)};
}

std::uint32_t Compositor::overlay_edge(const std::uint32_t size) noexcept {
    return std::clamp(size / kOverlayDivisor, kOverlayMin, kOverlayMax);
}

void Compositor::blend_overlay(RgbaImage& base, const RgbaImage& overlay,
                               const std::uint32_t x, const std::uint32_t y) {
    for (std::uint32_t oy = 0; oy < overlay.height; ++oy) {
        const std::uint64_t dy = static_cast<std::uint64_t>(y) + oy;
        if (dy >= base.height) break;
        for (std::uint32_t ox = 0; ox < overlay.width; ++ox) {
            const std::uint64_t dx = static_cast<std::uint64_t>(x) + ox;
            if (dx >= base.width) break;

            const std::uint8_t* src = overlay.at(ox, oy);
            if (src[3] == 0) continue;

            std::uint8_t* dst = base.at(static_cast<std::uint32_t>(dx), static_cast<std::uint32_t>(dy));
            const float alpha = static_cast<float>(src[3]) / 255.0f;
            for (int c = 0; c < 3; ++c) {
                const float fg = src[c];
                const float bg = dst[c];
                dst[c] = static_cast<std::uint8_t>(fg * alpha + bg * (1.0f - alpha));
            }
            dst[3] = 255;
        }
    }
}

std::vector<std::uint8_t> Compositor::compose(const std::span<const std::uint8_t> cover, const std::uint32_t size) const {
    if (size == 0) {
        throw CoverError(ErrorKind::DecodeError, "thumbnail size must be positive");
    }

    const RgbaImage decoded = decode_image(cover);
    RgbaImage base = fit_within(decoded, size, ResampleFilter::Default);

    if (overlay_) {
        const RgbaImage icon = fit_within(*overlay_, overlay_edge(size), ResampleFilter::CatmullRom);
        const auto offset = [](const std::uint32_t outer, const std::uint32_t inner) {
            return outer > inner + kOverlayMargin ? outer - (inner + kOverlayMargin) : 0u;
        };
        blend_overlay(base, icon, offset(base.width, icon.width), offset(base.height, icon.height));
    }

    return encode_png(base);
}

} // namespace coverthumb
