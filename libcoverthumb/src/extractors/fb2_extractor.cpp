//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/fb2_extractor.hpp"
#include "../../include/byte_reader.hpp"
#include "../../include/logger.hpp"
#include "../../include/xml_scan.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <climits>
#include <string>

namespace coverthumb {

namespace {

constexpr std::string_view kTag = "Fb2Extractor";

// id referenced from <coverpage>, bounded to the first kCoverpageScanLimit chars
std::optional<std::string> find_cover_id(const std::string_view doc, const std::size_t coverpage) {
    std::size_t limit = std::min(doc.size(), coverpage + Fb2Extractor::kCoverpageScanLimit);
    if (const auto close = doc.find("</coverpage>", coverpage); close != std::string_view::npos) {
        limit = std::min(limit, close);
    }
    const std::string_view window = doc.substr(coverpage, limit - coverpage);

    // also matches the namespaced l:href / xlink:href spellings
    constexpr std::string_view kHref = "href=\"#";
    const auto href = window.find(kHref);
    if (href == std::string_view::npos) return std::nullopt;
    const auto id_start = href + kHref.size();
    const auto id_end = window.find('"', id_start);
    if (id_end == std::string_view::npos || id_end == id_start) return std::nullopt;
    return std::string(window.substr(id_start, id_end - id_start));
}

} // namespace

std::optional<CoverBytes> Fb2Extractor::decode_base64(const std::string_view text) {
    std::string clean;
    clean.reserve(text.size());
    for (const char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) clean += c;
    }
    if (clean.empty() || clean.size() % 4 != 0 || clean.size() > INT_MAX) return std::nullopt;

    // padding is only legal in the last two positions
    const auto first_pad = clean.find('=');
    std::size_t padding = 0;
    if (first_pad != std::string::npos) {
        padding = clean.size() - first_pad;
        if (padding > 2 || clean.find_first_not_of('=', first_pad) != std::string::npos) {
            return std::nullopt;
        }
    }

    CoverBytes out(clean.size() / 4 * 3);
    const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (n < 0 || static_cast<std::size_t>(n) < padding) return std::nullopt;
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

std::optional<CoverBytes> Fb2Extractor::extract(std::istream& in, [[maybe_unused]] std::uint32_t requested_size) {
    in.clear();
    in.seekg(0, std::ios::beg);
    const auto raw = read_up_to(in, kMaxDocumentSize);
    const std::string_view doc(reinterpret_cast<const char*>(raw.data()), raw.size());

    const auto coverpage = doc.find("<coverpage>");
    if (coverpage == std::string_view::npos) {
        Logger::log(LogLevel::Debug, "Document has no <coverpage>", kTag);
        return std::nullopt;
    }
    const auto cover_id = find_cover_id(doc, coverpage);

    const auto binaries = xml::find_tags(doc, "binary");
    if (binaries.empty()) {
        Logger::log(LogLevel::Debug, "Document has no <binary> payloads", kTag);
        return std::nullopt;
    }

    const xml::Tag* chosen = nullptr;
    if (cover_id) {
        for (const auto& b : binaries) {
            if (xml::attribute_value(b.attributes, "id") == *cover_id) {
                chosen = &b;
                break;
            }
        }
    }
    if (!chosen) {
        Logger::log(LogLevel::Debug, "Cover binary not found by id, using the first binary", kTag);
        chosen = &binaries.front();
    }

    const auto payload_end = doc.find("</binary>", chosen->end);
    if (payload_end == std::string_view::npos) {
        Logger::log(LogLevel::Warning, "Unterminated <binary> payload", kTag);
        return std::nullopt;
    }

    auto bytes = decode_base64(doc.substr(chosen->end, payload_end - chosen->end));
    if (!bytes) {
        Logger::log(LogLevel::Warning, "Cover payload is not valid base64", kTag);
    }
    return bytes;
}

} // namespace coverthumb
