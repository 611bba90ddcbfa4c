#pragma once

#include <optional>
#include <string>

namespace sectionvault::domain {

/**
 * @struct ArchiveRecord
 * @brief Result of moving a document or folder into the retention area.
 */
struct ArchiveRecord {
    std::string originalPath;   ///< Canonical path before the move.
    std::string archivePath;    ///< Canonical path inside /archived/.
    std::string archivedAt;     ///< ISO-8601 UTC.
    bool wasFolder = false;
    std::optional<std::string> auditPath;
};

/**
 * @struct RecoveryAction
 * @brief What recovery did with one interrupted archive move.
 */
struct RecoveryAction {
    std::string originalPath;
    std::string archivePath;
    std::string outcome;        ///< "completed", "rolled_back" or "cleared".
};

} // namespace sectionvault::domain
