/**
 * @file DocumentRecord.hpp
 * @brief Parsed view of one markdown document.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "domain/Heading.hpp"

namespace sectionvault::domain {

/**
 * @struct FileVersion
 * @brief Version token of a file on disk.
 *
 * Size and content hash accompany the modification time so that two writes
 * landing in the same filesystem timestamp tick still compare unequal.
 */
struct FileVersion {
    std::int64_t mtimeNs = 0;
    std::uintmax_t size = 0;
    std::size_t contentHash = 0;

    bool operator==(const FileVersion& other) const {
        return mtimeNs == other.mtimeNs && size == other.size && contentHash == other.contentHash;
    }
    bool operator!=(const FileVersion& other) const { return !(*this == other); }
};

/**
 * @struct DocumentRecord
 * @brief Headings and text of a document as loaded from one snapshot.
 *
 * Records are shared read-only; a new record replaces the old one after
 * invalidation instead of being updated in place.
 */
struct DocumentRecord {
    std::string path;            ///< Canonical path, e.g. "/docs/api/auth.md".
    std::string title;           ///< First H1, or the file stem.
    std::string namespaceName;
    std::vector<Heading> headings;
    std::string content;
    FileVersion version;
    std::size_t wordCount = 0;
};

} // namespace sectionvault::domain
