//
// Created by Giuseppe Francione on 02/12/25.
//

#ifndef COVERTHUMB_EXTRACTOR_HPP
#define COVERTHUMB_EXTRACTOR_HPP

#include "book_format.hpp"
#include <cstdint>
#include <istream>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

/**
 * @namespace coverthumb
 * @brief The main namespace for the coverthumb library.
 *
 * @details Holds the IExtractor interface with its per-format
 * implementations, the image codec and compositor, the fingerprint
 * cache and the Thumbnailer facade.
 */
namespace coverthumb {

/// Raw, un-decoded image bytes pulled out of a container (JPEG, PNG, GIF...).
using CoverBytes = std::vector<std::uint8_t>;

/**
 * @brief Interface for a cover extractor.
 *
 * Each implementation targets one BookFormat family and describes the
 * extensions it accepts. Implementations are stateless: every call to
 * extract() works only on the stream it is given, so the registry can
 * own a single instance per format and reuse it.
 */
class IExtractor {
public:
    virtual ~IExtractor() = default;

    // --- self-description ---

    /// @return Human-readable name of the extractor (e.g. "EpubExtractor").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return The format family handled by this extractor.
    [[nodiscard]] virtual BookFormat get_format() const noexcept = 0;

    /// @return Supported extensions, lowercase and without dot (e.g. "epub").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_extensions() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Pull the cover image bytes out of a book.
     *
     * @param in Seekable binary stream positioned anywhere; implementations
     *        seek as they need.
     * @param requested_size Target thumbnail edge in pixels. Only synthesising
     *        extractors use it.
     * @return The cover bytes, or std::nullopt if the container opened but no
     *         image satisfies the format's rules.
     * @throws CoverError (ContainerError, IoError) on structural or stream failure.
     */
    virtual std::optional<CoverBytes> extract(std::istream& in, std::uint32_t requested_size) = 0;
};

} // namespace coverthumb

#endif // COVERTHUMB_EXTRACTOR_HPP
