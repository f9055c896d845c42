//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/comic_extractor.hpp"
#include "../../include/archive_reader.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace coverthumb {

std::optional<CoverBytes> ComicExtractor::extract(std::istream& in, [[maybe_unused]] std::uint32_t requested_size) {
    ArchiveReader archive(in, ArchiveFlavor::ZipOrRar);

    std::vector<std::string> pages;
    for (const auto& e : archive.entries()) {
        if (has_image_extension(e.name)) pages.push_back(e.name);
    }
    if (pages.empty()) {
        Logger::log(LogLevel::Warning, "No image entries in comic archive", "ComicExtractor");
        return std::nullopt;
    }

    std::ranges::sort(pages);
    Logger::log(LogLevel::Debug, "First page: " + pages.front(), "ComicExtractor");
    return archive.read(pages.front());
}

} // namespace coverthumb
