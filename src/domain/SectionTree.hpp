/**
 * @file SectionTree.hpp
 * @brief Heading parser and structural editor for markdown documents.
 *
 * All edit operations are pure text transforms: they take the full document
 * text and return the full rewritten text. Nothing here touches the disk.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Heading.hpp"

namespace sectionvault::domain {

/**
 * @enum InsertMode
 * @brief Where a new section is placed relative to the reference section.
 */
enum class InsertMode {
    InsertBefore,   ///< Sibling placed before the reference heading line.
    InsertAfter,    ///< Sibling placed after the reference span (and its descendants).
    AppendChild     ///< Last descendant of the reference, one level deeper.
};

inline std::string InsertModeToString(InsertMode mode) {
    switch (mode) {
        case InsertMode::InsertBefore: return "insert_before";
        case InsertMode::InsertAfter: return "insert_after";
        case InsertMode::AppendChild: return "append_child";
        default: return "unknown";
    }
}

/**
 * @class SectionTree
 * @brief Parses ATX headings into a tree and performs section-level edits.
 */
class SectionTree {
public:
    /**
     * @brief Parses every ATX heading outside fenced code blocks.
     * @throws AddressingError (INVALID_SECTION_CONTENT) past the heading limit.
     */
    static std::vector<Heading> Parse(const std::string& text);

    /**
     * @brief Finds a heading by flat slug, or by hierarchical path when the
     * reference contains '/'. A path may be given as a trailing suffix.
     * @return nullptr when nothing matches.
     */
    static const Heading* Find(const std::vector<Heading>& headings, const std::string& reference);

    /// Same as Find but throws SectionNotFoundError.
    static const Heading& Require(const std::vector<Heading>& headings, const std::string& reference,
                                  const std::string& documentPath = "");

    /// Heading line, body and descendants of the referenced section.
    static std::string ReadSection(const std::string& text, const std::string& reference);

    /// Everything after the heading line, with surrounding blank lines trimmed.
    static std::string ReadBody(const std::string& text, const std::string& reference);

    /// Text between the heading line and the first child heading, trimmed.
    static std::string ReadOwnBody(const std::string& text, const std::string& reference);

    /**
     * @brief Replaces the whole span of a section.
     *
     * When @p content does not start with a heading line the original
     * heading line is kept and only the rest of the span is replaced.
     */
    static std::string Replace(const std::string& text, const std::string& reference,
                               const std::string& content);

    /// Keeps the heading line and replaces the rest of the span with @p body.
    static std::string ReplaceBody(const std::string& text, const std::string& reference,
                                   const std::string& body);

    /// Keeps the heading line and any child sections; replaces the own body only.
    static std::string ReplaceOwnBody(const std::string& text, const std::string& reference,
                                      const std::string& body);

    static std::string AppendToBody(const std::string& text, const std::string& reference,
                                    const std::string& content);
    static std::string PrependToBody(const std::string& text, const std::string& reference,
                                     const std::string& content);

    /**
     * @brief Splices a new heading and body relative to the reference section.
     * @param depth Explicit depth (1..6); defaults to the reference depth for
     *        siblings and reference depth + 1 (capped at 6) for children.
     * @throws AddressingError on invalid title, depth or duplicate sibling slug.
     */
    static std::string Insert(const std::string& text, const std::string& reference, InsertMode mode,
                              const std::string& title, const std::string& body,
                              std::optional<int> depth = std::nullopt);

    /// Rewrites only the title text of the heading line.
    static std::string Rename(const std::string& text, const std::string& reference,
                              const std::string& newTitle);

    /// Deletes the section span including its descendants.
    static std::string Remove(const std::string& text, const std::string& reference);

    static std::string HeadingLine(int depth, const std::string& title);

    static std::vector<OutlineNode> BuildOutline(const std::vector<Heading>& headings);

    /// Validates a heading title, throwing AddressingError (INVALID_TITLE).
    static void ValidateTitle(const std::string& title);

    /// Position where the section's own body ends (first child heading or span end).
    static std::size_t OwnBodyEnd(const std::vector<Heading>& headings, const Heading& heading);
};

} // namespace sectionvault::domain
