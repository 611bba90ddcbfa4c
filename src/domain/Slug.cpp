#include "domain/Slug.hpp"

#include <cctype>

namespace sectionvault::domain {

namespace {

bool IsAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string TrimAscii(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && IsAsciiSpace(s[start])) ++start;
    size_t end = s.size();
    while (end > start && IsAsciiSpace(s[end - 1])) --end;
    return s.substr(start, end - start);
}

} // namespace

std::string SlugFromTitle(const std::string& title) {
    std::string slug;
    slug.reserve(title.size());
    for (char ch : TrimAscii(title)) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c >= 0x80) {
            slug.push_back(ch);
        } else if (std::isalnum(c)) {
            slug.push_back(static_cast<char>(std::tolower(c)));
        } else if (ch == '-' || ch == '_') {
            slug.push_back(ch);
        } else if (ch == ' ' || ch == '\t') {
            slug.push_back('-');
        }
    }
    if (slug.empty()) {
        return "section";
    }
    return slug;
}

std::string NormalizeSlugReference(const std::string& reference) {
    std::string ref = TrimAscii(reference);
    if (!ref.empty() && ref.front() == '#') {
        ref.erase(0, 1);
    }
    for (auto& ch : ref) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80) ch = static_cast<char>(std::tolower(c));
    }
    return ref;
}

std::string Slugger::slug(const std::string& title) {
    const std::string base = SlugFromTitle(title);
    std::string candidate = base;

    auto it = m_occurrences.find(base);
    if (it != m_occurrences.end()) {
        int count = it->second;
        do {
            ++count;
            candidate = base + "-" + std::to_string(count);
        } while (m_occurrences.count(candidate) > 0);
        it->second = count;
    } else {
        m_occurrences[base] = 0;
    }

    m_occurrences.emplace(candidate, 0);
    return candidate;
}

} // namespace sectionvault::domain
