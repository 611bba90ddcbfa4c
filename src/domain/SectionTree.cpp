/**
 * @file SectionTree.cpp
 * @brief Implementation of SectionTree.
 */

#include "domain/SectionTree.hpp"

#include <algorithm>

#include "domain/Errors.hpp"
#include "domain/Limits.hpp"
#include "domain/Slug.hpp"

namespace sectionvault::domain {

namespace {

struct AtxHeading {
    int depth;
    std::string title;
};

bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    });
}

std::string TrimSpaces(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Drops leading blank lines and all trailing whitespace. Indentation of the
// first non-blank line is kept.
std::string TrimBlankLines(const std::string& s) {
    size_t start = 0;
    while (start < s.size()) {
        size_t eol = s.find('\n', start);
        std::string line = s.substr(start, eol == std::string::npos ? std::string::npos : eol - start);
        if (!IsBlank(line)) break;
        if (eol == std::string::npos) return "";
        start = eol + 1;
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    if (end == std::string::npos || end < start) return "";
    return s.substr(start, end - start + 1);
}

std::optional<AtxHeading> ParseAtxLine(const std::string& rawLine) {
    std::string line = rawLine;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t indent = 0;
    while (indent < line.size() && line[indent] == ' ') ++indent;
    if (indent > 3) return std::nullopt;

    size_t hashes = 0;
    while (indent + hashes < line.size() && line[indent + hashes] == '#') ++hashes;
    if (hashes == 0 || hashes > static_cast<size_t>(kMaxHeadingDepth)) return std::nullopt;

    size_t rest = indent + hashes;
    if (rest < line.size() && line[rest] != ' ' && line[rest] != '\t') return std::nullopt;

    std::string title = TrimSpaces(line.substr(rest));

    // Optional closing sequence: a run of '#' preceded by whitespace.
    size_t closing = title.find_last_not_of('#');
    if (closing == std::string::npos) {
        title.clear();
    } else if (closing + 1 < title.size() && (title[closing] == ' ' || title[closing] == '\t')) {
        title = TrimSpaces(title.substr(0, closing));
    }

    if (title.empty()) return std::nullopt;
    return AtxHeading{static_cast<int>(hashes), title};
}

// Returns the fence marker length when the line opens or closes a code fence.
size_t FenceLength(const std::string& line, char& fenceChar) {
    size_t indent = 0;
    while (indent < line.size() && line[indent] == ' ') ++indent;
    if (indent > 3 || indent >= line.size()) return 0;
    char c = line[indent];
    if (c != '`' && c != '~') return 0;
    size_t n = 0;
    while (indent + n < line.size() && line[indent + n] == c) ++n;
    if (n < 3) return 0;
    fenceChar = c;
    return n;
}

// Puts a formatted block at `offset`, keeping a blank line on both sides.
std::string Splice(const std::string& text, size_t offset, const std::string& block) {
    std::string before = text.substr(0, offset);
    std::string after = text.substr(offset);
    if (!before.empty()) {
        if (before.back() != '\n') {
            before += "\n\n";
        } else if (before.size() < 2 || before[before.size() - 2] != '\n') {
            before += "\n";
        }
    }
    std::string result = before + block;
    if (!after.empty()) {
        result += "\n" + after;
    }
    return result;
}

// Replaces [from, to) of a section span with a body, keeping the heading line intact.
std::string ReplaceRange(const std::string& text, size_t from, size_t to, const std::string& body) {
    std::string trimmed = TrimBlankLines(body);
    std::string replacement;
    if (from > 0 && text[from - 1] != '\n') {
        replacement += "\n";
    }
    if (!trimmed.empty()) {
        replacement += "\n" + trimmed + "\n";
    }
    if (to < text.size()) {
        replacement += "\n";
    }
    return text.substr(0, from) + replacement + text.substr(to);
}

void ValidateBody(const std::string& body) {
    if (body.size() > kMaxSectionBytes) {
        throw AddressingError("INVALID_SECTION_CONTENT",
                              "Section content exceeds " + std::to_string(kMaxSectionBytes) + " bytes",
                              nlohmann::json{{"size", body.size()}});
    }
}

void CheckUniqueAmongSiblings(const std::vector<Heading>& headings,
                              std::optional<size_t> parentIndex,
                              int depth,
                              const std::string& title,
                              std::optional<size_t> ignoreIndex = std::nullopt) {
    const std::string slug = SlugFromTitle(title);
    for (const auto& h : headings) {
        if (ignoreIndex && h.index == *ignoreIndex) continue;
        if (h.parentIndex == parentIndex && h.depth == depth && SlugFromTitle(h.title) == slug) {
            throw AddressingError("DUPLICATE_HEADING",
                                  "A sibling section with the same title already exists: " + title,
                                  nlohmann::json{{"title", title}, {"slug", slug}});
        }
    }
}

std::vector<OutlineNode> BuildChildren(const std::vector<Heading>& headings,
                                       std::optional<size_t> parent) {
    std::vector<OutlineNode> nodes;
    for (const auto& h : headings) {
        if (h.parentIndex != parent) continue;
        OutlineNode node;
        node.title = h.title;
        node.slug = h.slug;
        node.depth = h.depth;
        node.children = BuildChildren(headings, h.index);
        nodes.push_back(std::move(node));
    }
    return nodes;
}

} // namespace

std::vector<Heading> SectionTree::Parse(const std::string& text) {
    std::vector<Heading> headings;
    std::vector<size_t> stack;
    Slugger slugger;

    bool inFence = false;
    char openFenceChar = 0;
    size_t openFenceLength = 0;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        size_t lineEnd = (eol == std::string::npos) ? text.size() : eol;
        size_t next = (eol == std::string::npos) ? text.size() : eol + 1;
        std::string line = text.substr(pos, lineEnd - pos);

        char fenceChar = 0;
        size_t fence = FenceLength(line, fenceChar);
        if (inFence) {
            if (fence >= openFenceLength && fenceChar == openFenceChar &&
                IsBlank(line.substr(line.find_first_not_of(' ') + fence))) {
                inFence = false;
            }
            pos = next;
            continue;
        }
        if (fence > 0) {
            inFence = true;
            openFenceChar = fenceChar;
            openFenceLength = fence;
            pos = next;
            continue;
        }

        if (auto atx = ParseAtxLine(line)) {
            if (headings.size() >= kMaxHeadings) {
                throw AddressingError("INVALID_SECTION_CONTENT",
                                      "Document has more than " + std::to_string(kMaxHeadings) + " headings");
            }

            while (!stack.empty() && headings[stack.back()].depth >= atx->depth) {
                stack.pop_back();
            }

            Heading h;
            h.title = atx->title;
            h.depth = atx->depth;
            h.index = headings.size();
            h.slug = slugger.slug(atx->title);
            h.startOffset = pos;
            h.contentOffset = next;
            if (!stack.empty()) {
                h.parentIndex = stack.back();
                h.path = headings[stack.back()].path + "/" + h.slug;
            } else {
                h.path = h.slug;
            }

            stack.push_back(h.index);
            headings.push_back(std::move(h));
        }
        pos = next;
    }

    for (size_t i = 0; i < headings.size(); ++i) {
        headings[i].endOffset = text.size();
        for (size_t j = i + 1; j < headings.size(); ++j) {
            if (headings[j].depth <= headings[i].depth) {
                headings[i].endOffset = headings[j].startOffset;
                break;
            }
        }
    }

    return headings;
}

const Heading* SectionTree::Find(const std::vector<Heading>& headings, const std::string& reference) {
    std::string ref = NormalizeSlugReference(reference);
    if (ref.empty()) return nullptr;

    if (ref.find('/') == std::string::npos) {
        for (const auto& h : headings) {
            if (h.slug == ref) return &h;
        }
        return nullptr;
    }

    while (!ref.empty() && ref.front() == '/') ref.erase(0, 1);
    while (!ref.empty() && ref.back() == '/') ref.pop_back();
    if (ref.empty()) return nullptr;

    for (const auto& h : headings) {
        if (h.path == ref) return &h;
    }
    const std::string suffix = "/" + ref;
    for (const auto& h : headings) {
        if (h.path.size() > suffix.size() &&
            h.path.compare(h.path.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return &h;
        }
    }
    return nullptr;
}

const Heading& SectionTree::Require(const std::vector<Heading>& headings, const std::string& reference,
                                    const std::string& documentPath) {
    const Heading* h = Find(headings, reference);
    if (!h) {
        throw SectionNotFoundError(NormalizeSlugReference(reference), documentPath);
    }
    return *h;
}

std::string SectionTree::ReadSection(const std::string& text, const std::string& reference) {
    auto headings = Parse(text);
    const Heading& h = Require(headings, reference);
    return text.substr(h.startOffset, h.endOffset - h.startOffset);
}

std::string SectionTree::ReadBody(const std::string& text, const std::string& reference) {
    auto headings = Parse(text);
    const Heading& h = Require(headings, reference);
    return TrimBlankLines(text.substr(h.contentOffset, h.endOffset - h.contentOffset));
}

std::string SectionTree::ReadOwnBody(const std::string& text, const std::string& reference) {
    auto headings = Parse(text);
    const Heading& h = Require(headings, reference);
    size_t end = OwnBodyEnd(headings, h);
    return TrimBlankLines(text.substr(h.contentOffset, end - h.contentOffset));
}

std::size_t SectionTree::OwnBodyEnd(const std::vector<Heading>& headings, const Heading& heading) {
    size_t next = heading.index + 1;
    if (next < headings.size() && headings[next].startOffset < heading.endOffset) {
        return headings[next].startOffset;
    }
    return heading.endOffset;
}

std::string SectionTree::Replace(const std::string& text, const std::string& reference,
                                 const std::string& content) {
    ValidateBody(content);
    auto headings = Parse(text);
    const Heading& h = Require(headings, reference);

    std::string trimmed = TrimBlankLines(content);
    std::string firstLine = trimmed.substr(0, trimmed.find('\n'));
    if (!ParseAtxLine(firstLine)) {
        return ReplaceRange(text, h.contentOffset, h.endOffset, content);
    }

    std::string replacement = trimmed + "\n";
    if (h.endOffset < text.size()) {
        replacement += "\n";
    }
    return text.substr(0, h.startOffset) + replacement + text.substr(h.endOffset);
}

std::string SectionTree::ReplaceBody(const std::string& text, const std::string& reference,
                                     const std::string& body) {
    ValidateBody(body);
    auto headings = Parse(text);
    const Heading& h = Require(headings, reference);
    return ReplaceRange(text, h.contentOffset, h.endOffset, body);
}

std::string SectionTree::ReplaceOwnBody(const std::string& text, const std::string& reference,
                                        const std::string& body) {
    ValidateBody(body);
    auto headings = Parse(text);
    const Heading& h = Require(headings, reference);
    return ReplaceRange(text, h.contentOffset, OwnBodyEnd(headings, h), body);
}

std::string SectionTree::AppendToBody(const std::string& text, const std::string& reference,
                                      const std::string& content) {
    auto headings = Parse(text);
    const Heading& h = Require(headings, reference);
    size_t end = OwnBodyEnd(headings, h);
    std::string own = TrimBlankLines(text.substr(h.contentOffset, end - h.contentOffset));
    std::string merged = own.empty() ? content : own + "\n\n" + TrimBlankLines(content);
    ValidateBody(merged);
    return ReplaceRange(text, h.contentOffset, end, merged);
}

std::string SectionTree::PrependToBody(const std::string& text, const std::string& reference,
                                       const std::string& content) {
    auto headings = Parse(text);
    const Heading& h = Require(headings, reference);
    size_t end = OwnBodyEnd(headings, h);
    std::string own = TrimBlankLines(text.substr(h.contentOffset, end - h.contentOffset));
    std::string merged = own.empty() ? content : TrimBlankLines(content) + "\n\n" + own;
    ValidateBody(merged);
    return ReplaceRange(text, h.contentOffset, end, merged);
}

std::string SectionTree::Insert(const std::string& text, const std::string& reference, InsertMode mode,
                                const std::string& title, const std::string& body,
                                std::optional<int> depth) {
    ValidateTitle(title);
    ValidateBody(body);
    if (depth && (*depth < 1 || *depth > kMaxHeadingDepth)) {
        throw AddressingError("INVALID_HEADING_DEPTH",
                              "Heading depth must be between 1 and 6",
                              nlohmann::json{{"depth", *depth}});
    }

    auto headings = Parse(text);
    const Heading& ref = Require(headings, reference);

    int newDepth = 0;
    size_t offset = 0;
    switch (mode) {
        case InsertMode::InsertBefore:
            newDepth = depth.value_or(ref.depth);
            offset = ref.startOffset;
            break;
        case InsertMode::InsertAfter:
            newDepth = depth.value_or(ref.depth);
            offset = ref.endOffset;
            break;
        case InsertMode::AppendChild:
            newDepth = depth.value_or(std::min(ref.depth + 1, kMaxHeadingDepth));
            offset = ref.endOffset;
            break;
    }

    // The parent of the new heading is the nearest shallower heading before it.
    std::optional<size_t> parent;
    for (const auto& h : headings) {
        if (h.startOffset >= offset) break;
        if (h.depth < newDepth) parent = h.index;
    }
    if (parent) {
        // A shallower heading only counts if the new heading falls inside its span.
        while (parent && headings[*parent].endOffset < offset) {
            parent = headings[*parent].parentIndex;
        }
    }
    CheckUniqueAmongSiblings(headings, parent, newDepth, title);

    std::string block = HeadingLine(newDepth, TrimSpaces(title)) + "\n";
    std::string trimmedBody = TrimBlankLines(body);
    if (!trimmedBody.empty()) {
        block += "\n" + trimmedBody + "\n";
    }
    return Splice(text, offset, block);
}

std::string SectionTree::Rename(const std::string& text, const std::string& reference,
                                const std::string& newTitle) {
    ValidateTitle(newTitle);
    auto headings = Parse(text);
    const Heading& h = Require(headings, reference);
    CheckUniqueAmongSiblings(headings, h.parentIndex, h.depth, newTitle, h.index);

    std::string lineEnding;
    std::string line = text.substr(h.startOffset, h.contentOffset - h.startOffset);
    if (!line.empty() && line.back() == '\n') {
        lineEnding = (line.size() >= 2 && line[line.size() - 2] == '\r') ? "\r\n" : "\n";
    }
    return text.substr(0, h.startOffset) + HeadingLine(h.depth, TrimSpaces(newTitle)) + lineEnding +
           text.substr(h.contentOffset);
}

std::string SectionTree::Remove(const std::string& text, const std::string& reference) {
    auto headings = Parse(text);
    const Heading& h = Require(headings, reference);
    return text.substr(0, h.startOffset) + text.substr(h.endOffset);
}

std::string SectionTree::HeadingLine(int depth, const std::string& title) {
    return std::string(static_cast<size_t>(depth), '#') + " " + title;
}

std::vector<OutlineNode> SectionTree::BuildOutline(const std::vector<Heading>& headings) {
    return BuildChildren(headings, std::nullopt);
}

void SectionTree::ValidateTitle(const std::string& title) {
    std::string trimmed = TrimSpaces(title);
    if (trimmed.empty()) {
        throw AddressingError("INVALID_TITLE", "Heading title must not be empty");
    }
    if (title.find('\n') != std::string::npos || title.find('\r') != std::string::npos) {
        throw AddressingError("INVALID_TITLE", "Heading title must be a single line",
                              nlohmann::json{{"title", title}});
    }
    if (trimmed.size() > kMaxTitleLength) {
        throw AddressingError("INVALID_TITLE",
                              "Heading title exceeds " + std::to_string(kMaxTitleLength) + " characters",
                              nlohmann::json{{"length", trimmed.size()}});
    }
}

} // namespace sectionvault::domain
