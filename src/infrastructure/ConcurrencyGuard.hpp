/**
 * @file ConcurrencyGuard.hpp
 * @brief Optimistic concurrency for plain markdown files.
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "domain/DocumentRecord.hpp"

namespace sectionvault::infrastructure {

/**
 * @struct FileSnapshot
 * @brief File content together with the version it was read at.
 */
struct FileSnapshot {
    std::string content;
    domain::FileVersion version;
};

/**
 * @class ConcurrencyGuard
 * @brief Reads files as versioned snapshots and writes them back only if
 * nobody changed them in between.
 *
 * Other processes may edit the workspace at any time, so a write is checked
 * against the file on disk, not against anything cached. Inside this process
 * the check and the write are serialized per path. Writes go to a temp file
 * that is renamed over the target.
 *
 * All paths are canonical document paths ("/docs/a.md") relative to the
 * workspace root.
 */
class ConcurrencyGuard {
public:
    explicit ConcurrencyGuard(std::filesystem::path workspaceRoot);

    /**
     * @brief Reads a file and its version.
     * @throws domain::DocumentNotFoundError if the file does not exist.
     * @throws domain::StorageError (FILE_TOO_LARGE, IO_ERROR).
     */
    FileSnapshot snapshot(const std::string& canonicalPath);

    /**
     * @brief Replaces the file content if its version still equals @p expected.
     * @throws domain::ConflictError when the file changed; the file is left untouched.
     */
    void writeIfUnchanged(const std::string& canonicalPath, const domain::FileVersion& expected,
                          const std::string& content);

    /// Creates a new file, failing with DOCUMENT_EXISTS if one is already there.
    void createExclusive(const std::string& canonicalPath, const std::string& content);

    void remove(const std::string& canonicalPath);

    bool exists(const std::string& canonicalPath) const;

    /// Version of the file on disk, or nullopt when it is missing.
    std::optional<domain::FileVersion> currentVersion(const std::string& canonicalPath);

    std::filesystem::path absolutePath(const std::string& canonicalPath) const;

    const std::filesystem::path& root() const { return m_root; }

    /// Writes through a temp file and rename; creates parent directories.
    static void AtomicWrite(const std::filesystem::path& target, const std::string& content);

private:
    std::mutex& lockFor(const std::string& canonicalPath);
    FileSnapshot readUnlocked(const std::string& canonicalPath) const;

    std::filesystem::path m_root;
    std::mutex m_tableMutex;
    std::map<std::string, std::unique_ptr<std::mutex>> m_pathLocks;
};

} // namespace sectionvault::infrastructure
