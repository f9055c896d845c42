//
// Created by Giuseppe Francione on 02/12/25.
//

#include "../../include/extractor_registry.hpp"
#include "../../include/comic_extractor.hpp"
#include "../../include/epub_extractor.hpp"
#include "../../include/fb2_extractor.hpp"
#include "../../include/mobi_extractor.hpp"
#include "../../include/txt_extractor.hpp"

namespace coverthumb {

ExtractorRegistry::ExtractorRegistry() {
    extractors_.push_back(std::make_unique<EpubExtractor>());
    extractors_.push_back(std::make_unique<MobiExtractor>());
    extractors_.push_back(std::make_unique<ComicExtractor>());
    extractors_.push_back(std::make_unique<Fb2Extractor>());
    extractors_.push_back(std::make_unique<TxtExtractor>());
}

IExtractor* ExtractorRegistry::find_by_extension(const std::string_view ext) const {
    const std::string normalized = normalize_extension(ext);
    if (normalized.empty()) return nullptr;

    for (const auto& extractor : extractors_) {
        for (const auto supported : extractor->get_supported_extensions()) {
            if (supported == normalized) {
                return extractor.get();
            }
        }
    }
    return nullptr;
}

std::vector<std::string> ExtractorRegistry::supported_extensions() const {
    std::vector<std::string> result;
    for (const auto& extractor : extractors_) {
        for (const auto supported : extractor->get_supported_extensions()) {
            result.emplace_back(supported);
        }
    }
    return result;
}

} // namespace coverthumb
