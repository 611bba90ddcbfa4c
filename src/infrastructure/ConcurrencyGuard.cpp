/**
 * @file ConcurrencyGuard.cpp
 * @brief Implementation of ConcurrencyGuard.
 */

#include "infrastructure/ConcurrencyGuard.hpp"

#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <thread>

#include "domain/Errors.hpp"
#include "domain/Limits.hpp"

namespace sectionvault::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

ConcurrencyGuard::ConcurrencyGuard(fs::path workspaceRoot) : m_root(std::move(workspaceRoot)) {}

FileSnapshot ConcurrencyGuard::snapshot(const std::string& canonicalPath) {
    std::lock_guard<std::mutex> lock(lockFor(canonicalPath));
    return readUnlocked(canonicalPath);
}

void ConcurrencyGuard::writeIfUnchanged(const std::string& canonicalPath, const domain::FileVersion& expected,
                                        const std::string& content) {
    std::lock_guard<std::mutex> lock(lockFor(canonicalPath));

    FileSnapshot current = readUnlocked(canonicalPath);
    if (current.version != expected) {
        std::cerr << "[ConcurrencyGuard] Rejected stale write to " << canonicalPath << std::endl;
        throw domain::ConflictError(canonicalPath);
    }

    AtomicWrite(absolutePath(canonicalPath), content);
}

void ConcurrencyGuard::createExclusive(const std::string& canonicalPath, const std::string& content) {
    std::lock_guard<std::mutex> lock(lockFor(canonicalPath));

    fs::path target = absolutePath(canonicalPath);
    std::error_code ec;
    if (fs::exists(target, ec)) {
        throw domain::AddressingError("DOCUMENT_EXISTS", "Document already exists: " + canonicalPath,
                                      json{{"document", canonicalPath}});
    }
    AtomicWrite(target, content);
}

void ConcurrencyGuard::remove(const std::string& canonicalPath) {
    std::lock_guard<std::mutex> lock(lockFor(canonicalPath));

    fs::path target = absolutePath(canonicalPath);
    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw domain::DocumentNotFoundError(canonicalPath);
    }
    fs::remove(target, ec);
    if (ec) {
        throw domain::StorageError("IO_ERROR", "Failed to delete " + canonicalPath + ": " + ec.message(),
                                   json{{"document", canonicalPath}});
    }
}

bool ConcurrencyGuard::exists(const std::string& canonicalPath) const {
    std::error_code ec;
    return fs::is_regular_file(absolutePath(canonicalPath), ec);
}

std::optional<domain::FileVersion> ConcurrencyGuard::currentVersion(const std::string& canonicalPath) {
    try {
        return snapshot(canonicalPath).version;
    } catch (const domain::DocumentNotFoundError&) {
        return std::nullopt;
    }
}

fs::path ConcurrencyGuard::absolutePath(const std::string& canonicalPath) const {
    std::string relative = canonicalPath;
    while (!relative.empty() && relative.front() == '/') relative.erase(0, 1);
    while (!relative.empty() && relative.back() == '/') relative.pop_back();
    return relative.empty() ? m_root : m_root / fs::path(relative);
}

void ConcurrencyGuard::AtomicWrite(const fs::path& target, const std::string& content) {
    // Unique temp path: <file>.tmp.<timestamp>.<thread>
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto thread = std::hash<std::thread::id>{}(std::this_thread::get_id());
    fs::path tempPath = target;
    tempPath += ".tmp." + std::to_string(timestamp) + "." + std::to_string(thread);

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw domain::StorageError("IO_ERROR", "Failed to create directory " +
                                       target.parent_path().string() + ": " + ec.message());
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::StorageError("IO_ERROR", "Failed to open temp file " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::StorageError("IO_ERROR", "Write failed for " + tempPath.string());
        }
    }

    fs::rename(tempPath, target, ec);
    if (ec) {
        std::string message = ec.message();
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        std::cerr << "[ConcurrencyGuard] Rename failed: " << message << std::endl;
        throw domain::StorageError("IO_ERROR", "Failed to replace " + target.string() + ": " + message);
    }
}

std::mutex& ConcurrencyGuard::lockFor(const std::string& canonicalPath) {
    std::lock_guard<std::mutex> lock(m_tableMutex);
    auto& slot = m_pathLocks[canonicalPath];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

FileSnapshot ConcurrencyGuard::readUnlocked(const std::string& canonicalPath) const {
    fs::path file = absolutePath(canonicalPath);

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        throw domain::DocumentNotFoundError(canonicalPath);
    }

    auto size = fs::file_size(file, ec);
    if (ec) {
        throw domain::StorageError("IO_ERROR", "Failed to stat " + canonicalPath + ": " + ec.message(),
                                   json{{"document", canonicalPath}});
    }
    if (size > domain::kMaxFileBytes) {
        throw domain::StorageError("FILE_TOO_LARGE", "File exceeds the size limit: " + canonicalPath,
                                   json{{"document", canonicalPath}, {"size", size}});
    }

    auto mtime = fs::last_write_time(file, ec);
    if (ec) {
        throw domain::StorageError("IO_ERROR", "Failed to stat " + canonicalPath + ": " + ec.message(),
                                   json{{"document", canonicalPath}});
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw domain::StorageError("IO_ERROR", "Failed to open " + canonicalPath,
                                   json{{"document", canonicalPath}});
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    FileSnapshot snap;
    snap.content = buffer.str();
    snap.version.mtimeNs = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
    snap.version.size = snap.content.size();
    snap.version.contentHash = std::hash<std::string>{}(snap.content);
    return snap;
}

} // namespace sectionvault::infrastructure
