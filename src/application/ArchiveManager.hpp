/**
 * @file ArchiveManager.hpp
 * @brief Moves documents and folders into the /archived/ retention tree.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "domain/ArchiveRecord.hpp"
#include "infrastructure/ConcurrencyGuard.hpp"
#include "infrastructure/DocumentCache.hpp"

namespace sectionvault::application {

/**
 * @enum RelocationMode
 * @brief How files reach the archive.
 */
enum class RelocationMode {
    RenameFirst,     ///< rename(); copy-verify-delete only across volumes.
    CopyVerifyDelete ///< Always copy, compare, then delete the source.
};

/**
 * @class ArchiveManager
 * @brief Relocates documents into the retention area with collision-free names.
 *
 * Naming:
 * - coordinator documents: /archived/coordinator/<timestamp>.md
 * - everything else:       /archived/<folders>/<stem>-<timestamp>.md
 * - folders:               /archived/<folders>/<name>-<timestamp>/
 * Taken names get "-1", "-2", ... appended.
 *
 * A copy-based move writes a "<archive>.pending" journal marker first, marks
 * it "verified" once the copy matches the source, and removes it after the
 * source is deleted. recoverInterrupted() settles moves that were cut short:
 * a verified copy is kept and the source removed, an unverified one that
 * differs from the source is dropped.
 *
 * Name selection and the move itself are serialized per manager.
 */
class ArchiveManager {
public:
    ArchiveManager(std::shared_ptr<infrastructure::ConcurrencyGuard> guard,
                   std::shared_ptr<infrastructure::DocumentCache> cache,
                   std::string archivedBy = "sectionvault",
                   RelocationMode mode = RelocationMode::RenameFirst);

    /**
     * @brief Archives one document.
     * @param audit Write "<archivePath>.audit" with who/when/why.
     * @throws domain::DocumentNotFoundError, domain::ArchiveIOError.
     */
    domain::ArchiveRecord archive(const std::string& documentPath, bool audit, const std::string& note = "");

    /// Archives a whole folder ("/docs/api/").
    domain::ArchiveRecord archiveFolder(const std::string& folderPath, bool audit, const std::string& note = "");

    /// Settles moves left half-done by a crash.
    std::vector<domain::RecoveryAction> recoverInterrupted();

    /// Free archive path for @p canonicalPath at @p timestamp.
    std::string archivePathFor(const std::string& canonicalPath, bool isFolder, const std::string& timestamp) const;

private:
    domain::ArchiveRecord relocate(const std::string& originalPath, bool isFolder, bool audit,
                                   const std::string& note);
    void copyVerifyDelete(const std::filesystem::path& source, const std::filesystem::path& target,
                          const std::string& originalPath, const std::string& archivePath);
    void writeAudit(domain::ArchiveRecord& record, const std::string& note);
    void invalidate(const std::string& originalPath, bool isFolder);

    std::shared_ptr<infrastructure::ConcurrencyGuard> m_guard;
    std::shared_ptr<infrastructure::DocumentCache> m_cache;
    std::string m_archivedBy;
    RelocationMode m_mode;
    std::mutex m_relocationMutex;
};

} // namespace sectionvault::application
