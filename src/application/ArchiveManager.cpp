/**
 * @file ArchiveManager.cpp
 * @brief Implementation of ArchiveManager.
 */

#include "application/ArchiveManager.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "application/AddressResolver.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Clock.hpp"

namespace sectionvault::application {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const std::string kArchiveRoot = "/archived";
const std::string kJournalSuffix = ".pending";

bool ReadAll(const fs::path& file, std::string& out) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) return false;
    std::stringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return true;
}

bool SameFile(const fs::path& a, const fs::path& b) {
    std::string left, right;
    return ReadAll(a, left) && ReadAll(b, right) && left == right;
}

// Byte-for-byte comparison of two files or two directory trees.
bool SameContent(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    if (fs::is_regular_file(source, ec)) {
        return fs::is_regular_file(target, ec) && SameFile(source, target);
    }

    size_t sourceFiles = 0;
    for (const auto& entry : fs::recursive_directory_iterator(source)) {
        if (!entry.is_regular_file()) continue;
        ++sourceFiles;
        fs::path counterpart = target / fs::relative(entry.path(), source);
        if (!SameFile(entry.path(), counterpart)) return false;
    }
    size_t targetFiles = 0;
    for (const auto& entry : fs::recursive_directory_iterator(target)) {
        if (entry.is_regular_file()) ++targetFiles;
    }
    return sourceFiles == targetFiles;
}

fs::path JournalFor(const fs::path& target) {
    fs::path journal = target;
    journal += kJournalSuffix;
    return journal;
}

bool IsArchived(const std::string& canonicalPath) {
    return canonicalPath == kArchiveRoot + "/" ||
           canonicalPath.compare(0, kArchiveRoot.size() + 1, kArchiveRoot + "/") == 0;
}

} // namespace

ArchiveManager::ArchiveManager(std::shared_ptr<infrastructure::ConcurrencyGuard> guard,
                               std::shared_ptr<infrastructure::DocumentCache> cache,
                               std::string archivedBy,
                               RelocationMode mode)
    : m_guard(std::move(guard))
    , m_cache(std::move(cache))
    , m_archivedBy(std::move(archivedBy))
    , m_mode(mode) {}

domain::ArchiveRecord ArchiveManager::archive(const std::string& documentPath, bool audit, const std::string& note) {
    const std::string canonical = AddressResolver::NormalizeDocumentPath(documentPath);
    if (!m_guard->exists(canonical)) {
        throw domain::DocumentNotFoundError(canonical);
    }
    return relocate(canonical, false, audit, note);
}

domain::ArchiveRecord ArchiveManager::archiveFolder(const std::string& folderPath, bool audit, const std::string& note) {
    const std::string canonical = AddressResolver::NormalizeFolderPath(folderPath);
    std::error_code ec;
    if (!fs::is_directory(m_guard->absolutePath(canonical), ec)) {
        throw domain::DocumentNotFoundError(canonical);
    }
    return relocate(canonical, true, audit, note);
}

std::string ArchiveManager::archivePathFor(const std::string& canonicalPath, bool isFolder,
                                           const std::string& timestamp) const {
    std::string trimmed = canonicalPath;
    if (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();

    const size_t lastSlash = trimmed.rfind('/');
    const std::string parent = trimmed.substr(0, lastSlash);   // "/docs/api" or ""
    std::string name = trimmed.substr(lastSlash + 1);
    if (!isFolder) {
        name = AddressResolver::DocumentStem(trimmed);
    }

    std::string base;
    if (!isFolder && AddressResolver::PolicyFor(canonicalPath).name == "coordinator") {
        base = timestamp;
    } else {
        base = name + "-" + timestamp;
    }

    const std::string directory = kArchiveRoot + parent + "/";
    const std::string extension = isFolder ? "/" : ".md";

    std::string candidate = directory + base + extension;
    std::error_code ec;
    for (int counter = 1; fs::exists(m_guard->absolutePath(candidate), ec) ||
                          fs::exists(JournalFor(m_guard->absolutePath(candidate)), ec); ++counter) {
        candidate = directory + base + "-" + std::to_string(counter) + extension;
    }
    return candidate;
}

domain::ArchiveRecord ArchiveManager::relocate(const std::string& originalPath, bool isFolder, bool audit,
                                               const std::string& note) {
    if (IsArchived(originalPath)) {
        throw domain::AddressingError("NAMESPACE_VIOLATION", "Path is already archived: " + originalPath,
                                      json{{"path", originalPath}});
    }

    // Held from picking the name until the move is done; rename() would
    // silently replace an archive another caller just placed there.
    std::lock_guard<std::mutex> lock(m_relocationMutex);

    domain::ArchiveRecord record;
    record.originalPath = originalPath;
    record.wasFolder = isFolder;
    record.archivedAt = infrastructure::UtcTimestamp();
    record.archivePath = archivePathFor(originalPath, isFolder, infrastructure::FileSafeTimestamp());

    const fs::path source = m_guard->absolutePath(originalPath);
    const fs::path target = m_guard->absolutePath(record.archivePath);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw domain::ArchiveIOError("Failed to create archive directory: " + ec.message(),
                                     json{{"archivePath", record.archivePath}});
    }

    bool moved = false;
    if (m_mode == RelocationMode::RenameFirst) {
        fs::rename(source, target, ec);
        if (!ec) {
            moved = true;
        } else if (ec != std::errc::cross_device_link) {
            throw domain::ArchiveIOError("Failed to move " + originalPath + ": " + ec.message(),
                                         json{{"originalPath", originalPath}, {"archivePath", record.archivePath}});
        }
    }
    if (!moved) {
        copyVerifyDelete(source, target, originalPath, record.archivePath);
    }

    invalidate(originalPath, isFolder);

    if (audit) {
        writeAudit(record, note);
    }

    std::cout << "[ArchiveManager] Archived " << originalPath << " -> " << record.archivePath << std::endl;
    return record;
}

void ArchiveManager::copyVerifyDelete(const fs::path& source, const fs::path& target,
                                      const std::string& originalPath, const std::string& archivePath) {
    const fs::path journal = JournalFor(target);
    json marker = {
        {"originalPath", originalPath},
        {"archivePath", archivePath},
        {"startedAt", infrastructure::UtcTimestamp()}
    };

    try {
        infrastructure::ConcurrencyGuard::AtomicWrite(journal, marker.dump(2));
    } catch (const domain::StorageError& e) {
        throw domain::ArchiveIOError(std::string("Failed to write archive journal: ") + e.what(),
                                     json{{"originalPath", originalPath}});
    }

    std::error_code ec;
    fs::copy(source, target, fs::copy_options::recursive, ec);
    if (ec || !SameContent(source, target)) {
        std::string reason = ec ? ec.message() : "copied content does not match the source";
        std::error_code cleanup;
        fs::remove_all(target, cleanup);
        fs::remove(journal, cleanup);
        throw domain::ArchiveIOError("Failed to copy " + originalPath + " into the archive: " + reason,
                                     json{{"originalPath", originalPath}, {"archivePath", archivePath}});
    }

    // From here on the archive copy is the reference; recovery finishes the delete.
    marker["verified"] = true;
    try {
        infrastructure::ConcurrencyGuard::AtomicWrite(journal, marker.dump(2));
    } catch (const domain::StorageError& e) {
        std::error_code cleanup;
        fs::remove_all(target, cleanup);
        fs::remove(journal, cleanup);
        throw domain::ArchiveIOError(std::string("Failed to update archive journal: ") + e.what(),
                                     json{{"originalPath", originalPath}, {"archivePath", archivePath}});
    }

    fs::remove_all(source, ec);
    if (ec) {
        // The journal stays behind so recoverInterrupted() can finish the move.
        throw domain::ArchiveIOError("Archived copy written but the source could not be removed: " + ec.message(),
                                     json{{"originalPath", originalPath}, {"archivePath", archivePath}});
    }

    fs::remove(journal, ec);
    if (ec) {
        std::cerr << "[ArchiveManager] Could not remove journal " << journal << ": " << ec.message() << std::endl;
    }
}

void ArchiveManager::writeAudit(domain::ArchiveRecord& record, const std::string& note) {
    json audit = {
        {"originalPath", record.originalPath},
        {"archivePath", record.archivePath},
        {"archivedAt", record.archivedAt},
        {"archivedBy", m_archivedBy},
        {"type", record.wasFolder ? "folder" : "file"},
        {"note", note}
    };

    std::string auditPath = record.archivePath;
    if (!auditPath.empty() && auditPath.back() == '/') auditPath.pop_back();
    auditPath += ".audit";
    try {
        infrastructure::ConcurrencyGuard::AtomicWrite(m_guard->absolutePath(auditPath), audit.dump(2));
    } catch (const domain::StorageError& e) {
        throw domain::ArchiveIOError(std::string("Failed to write audit record: ") + e.what(),
                                     json{{"archivePath", record.archivePath}});
    }
    record.auditPath = auditPath;
}

void ArchiveManager::invalidate(const std::string& originalPath, bool isFolder) {
    if (isFolder) {
        m_cache->invalidatePrefix(originalPath);
    } else {
        m_cache->invalidate(originalPath);
    }
}

std::vector<domain::RecoveryAction> ArchiveManager::recoverInterrupted() {
    std::lock_guard<std::mutex> lock(m_relocationMutex);
    std::vector<domain::RecoveryAction> actions;
    const fs::path archiveRoot = m_guard->absolutePath(kArchiveRoot);

    std::error_code ec;
    if (!fs::is_directory(archiveRoot, ec)) {
        return actions;
    }

    std::vector<fs::path> journals;
    for (const auto& entry : fs::recursive_directory_iterator(archiveRoot)) {
        if (entry.is_regular_file() && entry.path().extension() == kJournalSuffix) {
            journals.push_back(entry.path());
        }
    }

    for (const auto& journal : journals) {
        json marker;
        try {
            std::ifstream in(journal);
            in >> marker;
        } catch (const json::exception& e) {
            std::cerr << "[ArchiveManager] Unreadable journal " << journal << ": " << e.what() << std::endl;
            continue;
        }

        domain::RecoveryAction action;
        action.originalPath = marker.value("originalPath", "");
        action.archivePath = marker.value("archivePath", "");
        if (action.originalPath.empty() || action.archivePath.empty()) {
            std::cerr << "[ArchiveManager] Journal without paths: " << journal << std::endl;
            continue;
        }

        const fs::path source = m_guard->absolutePath(action.originalPath);
        const fs::path target = m_guard->absolutePath(action.archivePath);
        const bool isFolder = !action.originalPath.empty() && action.originalPath.back() == '/';
        const bool verified = marker.value("verified", false);
        const bool sourceExists = fs::exists(source, ec);
        const bool targetExists = fs::exists(target, ec);

        if (sourceExists && targetExists && (verified || SameContent(source, target))) {
            // Copy finished, delete did not (or only partly): the source is the duplicate.
            fs::remove_all(source, ec);
            if (ec) {
                throw domain::ArchiveIOError("Failed to remove duplicate " + action.originalPath + ": " + ec.message(),
                                             json{{"originalPath", action.originalPath}});
            }
            action.outcome = "completed";
        } else if (sourceExists && targetExists) {
            // Copy never verified: keep the source, drop the copy.
            fs::remove_all(target, ec);
            if (ec) {
                throw domain::ArchiveIOError("Failed to remove partial copy " + action.archivePath + ": " + ec.message(),
                                             json{{"archivePath", action.archivePath}});
            }
            action.outcome = "rolled_back";
        } else {
            action.outcome = "cleared";
        }

        fs::remove(journal, ec);
        invalidate(action.originalPath, isFolder);
        std::cout << "[ArchiveManager] Recovery " << action.outcome << ": " << action.originalPath << std::endl;
        actions.push_back(std::move(action));
    }

    return actions;
}

} // namespace sectionvault::application
