//
// Created by Giuseppe Francione on 04/12/25.
//

#include "../../include/xml_scan.hpp"
#include <cctype>

namespace coverthumb::xml {

namespace {

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_name_end(const char c) {
    return is_space(c) || c == '>' || c == '/';
}

} // namespace

std::vector<Tag> find_tags(const std::string_view xml, const std::string_view local_name) {
    std::vector<Tag> tags;
    std::size_t pos = 0;
    while ((pos = xml.find('<', pos)) != std::string_view::npos) {
        const std::string_view rest = xml.substr(pos);
        if (rest.starts_with("<!--")) {
            const auto close = xml.find("-->", pos + 4);
            if (close == std::string_view::npos) break;
            pos = close + 3;
            continue;
        }
        if (rest.starts_with("<![CDATA[")) {
            const auto close = xml.find("]]>", pos + 9);
            if (close == std::string_view::npos) break;
            pos = close + 3;
            continue;
        }
        if (rest.size() < 2 || rest[1] == '/' || rest[1] == '?' || rest[1] == '!') {
            ++pos;
            continue;
        }

        std::size_t name_end = pos + 1;
        while (name_end < xml.size() && !is_name_end(xml[name_end])) ++name_end;
        std::string_view name = xml.substr(pos + 1, name_end - pos - 1);
        if (const auto colon = name.find(':'); colon != std::string_view::npos) {
            name.remove_prefix(colon + 1);
        }

        // find the closing '>' outside of quoted attribute values
        std::size_t close = name_end;
        char quote = 0;
        for (; close < xml.size(); ++close) {
            const char c = xml[close];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '>') {
                break;
            }
        }
        if (close >= xml.size()) break;

        if (name == local_name) {
            std::string_view attrs = xml.substr(name_end, close - name_end);
            if (attrs.ends_with('/')) attrs.remove_suffix(1);
            tags.push_back({name, attrs, pos, close + 1});
        }
        pos = close + 1;
    }
    return tags;
}

std::optional<std::string> attribute_value(const std::string_view attributes, const std::string_view name) {
    std::size_t pos = 0;
    while ((pos = attributes.find(name, pos)) != std::string_view::npos) {
        const bool boundary_before = pos == 0 || is_space(attributes[pos - 1]);
        std::size_t i = pos + name.size();
        while (i < attributes.size() && is_space(attributes[i])) ++i;
        if (!boundary_before || i >= attributes.size() || attributes[i] != '=') {
            pos += name.size();
            continue;
        }
        ++i;
        while (i < attributes.size() && is_space(attributes[i])) ++i;
        if (i >= attributes.size() || (attributes[i] != '"' && attributes[i] != '\'')) {
            return std::nullopt;
        }
        const char quote = attributes[i];
        const auto value_end = attributes.find(quote, i + 1);
        if (value_end == std::string_view::npos) return std::nullopt;
        return decode_entities(attributes.substr(i + 1, value_end - i - 1));
    }
    return std::nullopt;
}

std::string decode_entities(const std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out += text[i];
            continue;
        }
        const std::string_view rest = text.substr(i);
        if (rest.starts_with("&amp;"))       { out += '&';  i += 4; }
        else if (rest.starts_with("&lt;"))   { out += '<';  i += 3; }
        else if (rest.starts_with("&gt;"))   { out += '>';  i += 3; }
        else if (rest.starts_with("&quot;")) { out += '"';  i += 5; }
        else if (rest.starts_with("&apos;")) { out += '\''; i += 5; }
        else out += '&';
    }
    return out;
}

} // namespace coverthumb::xml
