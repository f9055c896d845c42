//
// Created by Giuseppe Francione on 04/12/25.
//

/**
 * @file xml_scan.hpp
 * @brief Minimal tag scanner for OPF and FictionBook documents.
 *
 * Not a validating parser: it walks start tags in document order, skips
 * comments, processing instructions and CDATA sections, and exposes the
 * raw attribute text of each tag.
 */

#ifndef COVERTHUMB_XML_SCAN_HPP
#define COVERTHUMB_XML_SCAN_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace coverthumb::xml {

/**
 * @brief One start (or empty-element) tag found in a document.
 */
struct Tag {
    std::string_view local_name; ///< name with any namespace prefix removed
    std::string_view attributes; ///< raw text between the name and '>'
    std::size_t begin = 0;       ///< offset of '<'
    std::size_t end = 0;         ///< offset one past '>'
};

/**
 * @brief Collects every start tag whose local name equals @p local_name.
 * @param xml Document text.
 * @param local_name Tag name without prefix (e.g. "item", "meta").
 * @return Tags in document order.
 */
std::vector<Tag> find_tags(std::string_view xml, std::string_view local_name);

/**
 * @brief Value of an attribute inside a tag's attribute text.
 *
 * Matches the attribute by exact name (prefix included, e.g. "l:href"),
 * accepts single or double quotes, and decodes the predefined entities.
 */
std::optional<std::string> attribute_value(std::string_view attributes, std::string_view name);

/**
 * @brief Replaces &amp; &lt; &gt; &quot; &apos; with their characters.
 */
std::string decode_entities(std::string_view text);

} // namespace coverthumb::xml

#endif // COVERTHUMB_XML_SCAN_HPP
