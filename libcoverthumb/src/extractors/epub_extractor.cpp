//
// Created by Giuseppe Francione on 04/12/25.
//

#include "../../include/epub_extractor.hpp"
#include "../../include/archive_reader.hpp"
#include "../../include/logger.hpp"
#include "../../include/xml_scan.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace coverthumb {

namespace {

constexpr std::string_view kTag = "EpubExtractor";
constexpr std::string_view kContainerPath = "META-INF/container.xml";

std::string to_lower(const std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_raster_media_type(const std::string_view type) {
    return type == "image/jpeg" || type == "image/png" ||
           type == "image/gif" || type == "image/webp";
}

int hex_value(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hex_value(s[i + 1]);
            const int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

// pass 1: "cover"/"front" entry names
const ArchiveEntry* find_named_cover(const std::vector<ArchiveEntry>& entries) {
    struct Candidate {
        const ArchiveEntry* entry;
        bool exact;
    };
    std::vector<Candidate> candidates;
    for (const auto& e : entries) {
        const std::string lower = to_lower(e.name);
        if (!has_image_extension(lower)) continue;
        if (lower.find("cover") == std::string::npos && lower.find("front") == std::string::npos) continue;
        const bool exact = lower.find("cover.") != std::string::npos || lower.ends_with("cover");
        candidates.push_back({&e, exact});
    }
    std::ranges::stable_sort(candidates, [](const Candidate& a, const Candidate& b) {
        if (a.exact != b.exact) return a.exact;
        return a.entry->size > b.entry->size;
    });
    return candidates.empty() ? nullptr : candidates.front().entry;
}

// pass 3: largest image, earliest wins a tie
const ArchiveEntry* find_largest_image(const std::vector<ArchiveEntry>& entries) {
    const ArchiveEntry* best = nullptr;
    for (const auto& e : entries) {
        if (!has_image_extension(e.name)) continue;
        if (!best || e.size > best->size) best = &e;
    }
    return best;
}

std::optional<std::string> find_rootfile(const std::string_view container_xml) {
    for (const auto& tag : xml::find_tags(container_xml, "rootfile")) {
        if (auto path = xml::attribute_value(tag.attributes, "full-path")) {
            return path;
        }
    }
    return std::nullopt;
}

std::optional<std::string> find_cover_href(const std::string_view opf) {
    const auto items = xml::find_tags(opf, "item");

    for (const auto& meta : xml::find_tags(opf, "meta")) {
        if (xml::attribute_value(meta.attributes, "name") != "cover") continue;
        const auto id = xml::attribute_value(meta.attributes, "content");
        if (!id) continue;
        for (const auto& item : items) {
            if (xml::attribute_value(item.attributes, "id") == *id) {
                if (auto href = xml::attribute_value(item.attributes, "href")) {
                    return href;
                }
            }
        }
    }

    for (const auto& item : items) {
        const auto props = xml::attribute_value(item.attributes, "properties");
        if (!props) continue;
        // space separated token list
        std::string_view rest = *props;
        while (!rest.empty()) {
            const auto sp = rest.find(' ');
            if (rest.substr(0, sp) == "cover-image") {
                return xml::attribute_value(item.attributes, "href");
            }
            if (sp == std::string_view::npos) break;
            rest.remove_prefix(sp + 1);
        }
    }
    return std::nullopt;
}

std::optional<std::string> find_first_manifest_image(const std::string_view opf) {
    for (const auto& item : xml::find_tags(opf, "item")) {
        const auto type = xml::attribute_value(item.attributes, "media-type");
        if (!type || !is_raster_media_type(*type)) continue;
        if (auto href = xml::attribute_value(item.attributes, "href")) {
            return href;
        }
    }
    return std::nullopt;
}

} // namespace

std::string EpubExtractor::join_archive_path(const std::string_view base_dir, std::string_view href) {
    if (const auto hash = href.find('#'); hash != std::string_view::npos) {
        href = href.substr(0, hash);
    }
    std::string joined = base_dir.empty() ? std::string() : std::string(base_dir) + "/";
    joined += percent_decode(href);

    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= joined.size()) {
        auto slash = joined.find('/', start);
        if (slash == std::string::npos) slash = joined.size();
        const std::string part = joined.substr(start, slash - start);
        if (part == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
        start = slash + 1;
    }

    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += '/';
        out += p;
    }
    return out;
}

std::string EpubExtractor::resolve_manifest_cover(ArchiveReader& zip) {
    const auto container = zip.read_text(kContainerPath);
    if (!container) {
        Logger::log(LogLevel::Debug, "No META-INF/container.xml", kTag);
        return {};
    }
    const auto opf_path = find_rootfile(*container);
    if (!opf_path) {
        Logger::log(LogLevel::Debug, "container.xml has no rootfile", kTag);
        return {};
    }
    const auto opf = zip.read_text(*opf_path);
    if (!opf) {
        Logger::log(LogLevel::Debug, "Package document missing: " + *opf_path, kTag);
        return {};
    }

    const auto slash = opf_path->rfind('/');
    const std::string base = slash == std::string::npos ? std::string() : opf_path->substr(0, slash);

    if (const auto href = find_cover_href(*opf)) {
        std::string path = join_archive_path(base, *href);
        if (zip.contains(path)) return path;
        Logger::log(LogLevel::Debug, "Declared cover not in archive: " + path, kTag);
    }
    if (const auto href = find_first_manifest_image(*opf)) {
        std::string path = join_archive_path(base, *href);
        if (zip.contains(path)) return path;
    }
    return {};
}

std::optional<CoverBytes> EpubExtractor::extract(std::istream& in, [[maybe_unused]] std::uint32_t requested_size) {
    ArchiveReader zip(in, ArchiveFlavor::Zip);

    if (const auto* named = find_named_cover(zip.entries())) {
        Logger::log(LogLevel::Debug, "Cover by entry name: " + named->name, kTag);
        return zip.read(named->name);
    }

    if (const std::string path = resolve_manifest_cover(zip); !path.empty()) {
        Logger::log(LogLevel::Debug, "Cover from package manifest: " + path, kTag);
        return zip.read(path);
    }

    if (const auto* largest = find_largest_image(zip.entries())) {
        Logger::log(LogLevel::Debug, "Cover by largest image: " + largest->name, kTag);
        return zip.read(largest->name);
    }

    Logger::log(LogLevel::Warning, "No image entries in EPUB", kTag);
    return std::nullopt;
}

} // namespace coverthumb
