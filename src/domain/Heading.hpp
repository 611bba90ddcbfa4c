/**
 * @file Heading.hpp
 * @brief Value objects describing the heading structure of a markdown document.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sectionvault::domain {

/**
 * @struct Heading
 * @brief One ATX heading and the byte span of its section.
 *
 * Offsets index into the document text the heading was parsed from:
 * the section span is [contentOffset, endOffset), the heading line is
 * [startOffset, contentOffset).
 */
struct Heading {
    std::string slug;                  ///< Unique flat slug within the document.
    std::string path;                  ///< Hierarchical slug, e.g. "tasks/implement-caching".
    std::string title;
    int depth = 1;                     ///< 1..6
    std::size_t index = 0;             ///< Position in document order.
    std::optional<std::size_t> parentIndex;
    std::size_t startOffset = 0;
    std::size_t contentOffset = 0;
    std::size_t endOffset = 0;
};

/**
 * @struct OutlineNode
 * @brief Nested table-of-contents entry.
 */
struct OutlineNode {
    std::string title;
    std::string slug;
    int depth = 1;
    std::vector<OutlineNode> children;
};

} // namespace sectionvault::domain
