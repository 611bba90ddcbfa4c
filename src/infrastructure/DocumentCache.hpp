/**
 * @file DocumentCache.hpp
 * @brief In-memory cache of parsed documents.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/DocumentRecord.hpp"
#include "infrastructure/ConcurrencyGuard.hpp"

namespace sectionvault::infrastructure {

/**
 * @class DocumentCache
 * @brief Memoizes DocumentRecord per canonical path.
 *
 * Entries live until explicitly invalidated; there is no TTL and no size
 * bound. Every component that writes a document invalidates it before
 * reporting success. A load that races with an invalidation of the same key
 * is handed to its caller but not stored.
 */
class DocumentCache {
public:
    explicit DocumentCache(std::shared_ptr<ConcurrencyGuard> guard);

    /**
     * @brief Cached record, loading and parsing it on a miss.
     * @return nullptr when the document does not exist.
     */
    std::shared_ptr<const domain::DocumentRecord> get(const std::string& canonicalPath);

    void invalidate(const std::string& canonicalPath);

    /// Invalidates every cached path starting with @p prefix (folder moves).
    void invalidatePrefix(const std::string& prefix);

    void clear();

    std::size_t size() const;
    std::vector<std::string> cachedPaths() const;

    /// True when the file on disk no longer matches the cached record.
    bool isStale(const std::string& canonicalPath);

    /// Heading line and body of a section, or nullopt if the document or section is missing.
    std::optional<std::string> getSectionContent(const std::string& canonicalPath, const std::string& slug);

    /** @brief Parses a snapshot into a record. */
    static std::shared_ptr<domain::DocumentRecord> BuildRecord(const std::string& canonicalPath,
                                                               const FileSnapshot& snapshot);

private:
    std::shared_ptr<ConcurrencyGuard> m_guard;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<const domain::DocumentRecord>> m_entries;
    std::map<std::string, std::uint64_t> m_generations;  ///< Bumped on every invalidation of a key.
};

} // namespace sectionvault::infrastructure
