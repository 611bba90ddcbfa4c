/**
 * @file DocumentCache.cpp
 * @brief Implementation of DocumentCache.
 */

#include "infrastructure/DocumentCache.hpp"

#include <cctype>

#include "domain/Errors.hpp"
#include "domain/SectionTree.hpp"

namespace sectionvault::infrastructure {

namespace {

std::size_t CountWords(const std::string& text) {
    std::size_t words = 0;
    bool inWord = false;
    for (char ch : text) {
        bool space = std::isspace(static_cast<unsigned char>(ch)) != 0;
        if (!space && !inWord) ++words;
        inWord = !space;
    }
    return words;
}

std::string FolderOf(const std::string& canonicalPath) {
    size_t lastSlash = canonicalPath.rfind('/');
    if (lastSlash == std::string::npos || lastSlash == 0) return "root";
    return canonicalPath.substr(1, lastSlash - 1);
}

std::string StemOf(const std::string& canonicalPath) {
    std::string file = canonicalPath.substr(canonicalPath.rfind('/') + 1);
    if (file.size() > 3 && file.compare(file.size() - 3, 3, ".md") == 0) {
        file.resize(file.size() - 3);
    }
    return file;
}

} // namespace

DocumentCache::DocumentCache(std::shared_ptr<ConcurrencyGuard> guard) : m_guard(std::move(guard)) {}

std::shared_ptr<const domain::DocumentRecord> DocumentCache::get(const std::string& canonicalPath) {
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(canonicalPath);
        if (it != m_entries.end()) {
            return it->second;
        }
        generation = m_generations[canonicalPath];
    }

    // Load outside the lock; other documents stay readable meanwhile.
    FileSnapshot snapshot;
    try {
        snapshot = m_guard->snapshot(canonicalPath);
    } catch (const domain::DocumentNotFoundError&) {
        return nullptr;
    }
    std::shared_ptr<const domain::DocumentRecord> record = BuildRecord(canonicalPath, snapshot);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_generations[canonicalPath] != generation) {
        return record;
    }
    auto inserted = m_entries.emplace(canonicalPath, record);
    return inserted.first->second;
}

void DocumentCache::invalidate(const std::string& canonicalPath) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(canonicalPath);
    ++m_generations[canonicalPath];
}

void DocumentCache::invalidatePrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& [path, generation] : m_generations) {
        if (path.compare(0, prefix.size(), prefix) == 0) {
            ++generation;
        }
    }
}

void DocumentCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    for (auto& entry : m_generations) {
        ++entry.second;
    }
}

std::size_t DocumentCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::vector<std::string> DocumentCache::cachedPaths() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> paths;
    paths.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        paths.push_back(entry.first);
    }
    return paths;
}

bool DocumentCache::isStale(const std::string& canonicalPath) {
    std::shared_ptr<const domain::DocumentRecord> record;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(canonicalPath);
        if (it == m_entries.end()) return false;
        record = it->second;
    }
    auto current = m_guard->currentVersion(canonicalPath);
    return !current || *current != record->version;
}

std::optional<std::string> DocumentCache::getSectionContent(const std::string& canonicalPath,
                                                            const std::string& slug) {
    auto record = get(canonicalPath);
    if (!record) return std::nullopt;
    const domain::Heading* heading = domain::SectionTree::Find(record->headings, slug);
    if (!heading) return std::nullopt;
    return record->content.substr(heading->startOffset, heading->endOffset - heading->startOffset);
}

std::shared_ptr<domain::DocumentRecord> DocumentCache::BuildRecord(const std::string& canonicalPath,
                                                                   const FileSnapshot& snapshot) {
    auto record = std::make_shared<domain::DocumentRecord>();
    record->path = canonicalPath;
    record->content = snapshot.content;
    record->version = snapshot.version;
    record->headings = domain::SectionTree::Parse(snapshot.content);
    record->namespaceName = FolderOf(canonicalPath);
    record->wordCount = CountWords(snapshot.content);

    record->title = StemOf(canonicalPath);
    for (const auto& h : record->headings) {
        if (h.depth == 1) {
            record->title = h.title;
            break;
        }
    }
    return record;
}

} // namespace sectionvault::infrastructure
