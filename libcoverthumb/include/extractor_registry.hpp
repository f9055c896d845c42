//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file extractor_registry.hpp
 * @brief Maps extensions to the IExtractor that handles them.
 */

#ifndef COVERTHUMB_EXTRACTOR_REGISTRY_HPP
#define COVERTHUMB_EXTRACTOR_REGISTRY_HPP

#include "extractor.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace coverthumb {

/**
 * @brief Registry (format dispatcher) of all built-in extractors.
 *
 * @details Owns one instance of each IExtractor implementation. Lookups
 * are stateless: the same extension always yields the same extractor.
 */
class ExtractorRegistry {
public:
    /**
     * @brief Construct and register all built-in extractors
     * (EPUB, MOBI family, comic archives, FB2, TXT).
     */
    ExtractorRegistry();

    /**
     * @brief Find the extractor for an extension.
     *
     * The extension is normalised first (case-insensitive, optional dot).
     *
     * @param ext File extension (e.g. "epub", ".AZW3").
     * @return Non-owning pointer, or nullptr when the extension is unsupported.
     */
    [[nodiscard]] IExtractor* find_by_extension(std::string_view ext) const;

    /// @return True if some extractor accepts the extension.
    [[nodiscard]] bool is_supported(std::string_view ext) const {
        return find_by_extension(ext) != nullptr;
    }

    /// @return Every supported extension, in registration order.
    [[nodiscard]] std::vector<std::string> supported_extensions() const;

    /**
     * @brief Access all registered extractors.
     */
    [[nodiscard]] const std::vector<std::unique_ptr<IExtractor>>& all() const { return extractors_; }

private:
    ///< Owned instances of all registered extractors.
    std::vector<std::unique_ptr<IExtractor>> extractors_;
};

} // namespace coverthumb

#endif // COVERTHUMB_EXTRACTOR_REGISTRY_HPP
