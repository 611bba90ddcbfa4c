/**
 * @file Slug.hpp
 * @brief Title to slug transliteration and per-document de-duplication.
 */

#pragma once

#include <map>
#include <string>

namespace sectionvault::domain {

/**
 * @brief GitHub-style slug of a heading title.
 *
 * ASCII letters are lower-cased, ASCII punctuation other than '-' and '_'
 * is dropped, each space becomes '-'. Bytes outside ASCII are kept so
 * non-latin titles still produce distinct slugs.
 */
std::string SlugFromTitle(const std::string& title);

/**
 * @brief Normalizes a slug reference supplied by a caller: strips a
 * leading '#', surrounding whitespace and lower-cases ASCII letters.
 */
std::string NormalizeSlugReference(const std::string& reference);

/**
 * @class Slugger
 * @brief Hands out unique slugs for one document, in document order.
 *
 * The second "Overview" becomes "overview-1", the third "overview-2".
 */
class Slugger {
public:
    std::string slug(const std::string& title);
    void reset() { m_occurrences.clear(); }

private:
    std::map<std::string, int> m_occurrences;
};

} // namespace sectionvault::domain
