#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/ArchiveManager.hpp"
#include "domain/Errors.hpp"

using namespace sectionvault;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template <typename Fn>
std::string ErrorCodeOf(Fn fn) {
    try {
        fn();
    } catch (const domain::StoreError& e) {
        return e.code();
    }
    return "";
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArchiveManager tests..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / "sectionvault_archive_test";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    auto guard = std::make_shared<infrastructure::ConcurrencyGuard>(testRoot);
    auto cache = std::make_shared<infrastructure::DocumentCache>(guard);
    application::ArchiveManager archiver(guard, cache, "tester");

    std::cout << "[Test] Archive naming..." << std::endl;
    const std::string ts = "2026-01-01T00-00-00";
    assert(archiver.archivePathFor("/docs/api/auth.md", false, ts) == "/archived/docs/api/auth-" + ts + ".md");
    assert(archiver.archivePathFor("/readme.md", false, ts) == "/archived/readme-" + ts + ".md");
    assert(archiver.archivePathFor("/coordinator/active.md", false, ts) == "/archived/coordinator/" + ts + ".md");
    assert(archiver.archivePathFor("/docs/api/", true, ts) == "/archived/docs/api-" + ts + "/");

    WriteFile(testRoot / "archived" / "docs" / "api" / ("auth-" + ts + ".md"), "taken");
    assert(archiver.archivePathFor("/docs/api/auth.md", false, ts) == "/archived/docs/api/auth-" + ts + "-1.md");
    WriteFile(testRoot / "archived" / "docs" / "api" / ("auth-" + ts + "-1.md.pending"), "{}");
    assert(archiver.archivePathFor("/docs/api/auth.md", false, ts) == "/archived/docs/api/auth-" + ts + "-2.md");
    fs::remove_all(testRoot / "archived");
    std::cout << "[PASS] Timestamped names with collision suffixes." << std::endl;

    std::cout << "[Test] Archiving a document..." << std::endl;
    WriteFile(testRoot / "docs" / "api" / "auth.md", "# Auth\n\nOld design.\n");
    assert(cache->get("/docs/api/auth.md") != nullptr);

    auto record = archiver.archive("/docs/api/auth.md", true, "obsolete");
    assert(record.originalPath == "/docs/api/auth.md");
    assert(record.archivePath.compare(0, 24, "/archived/docs/api/auth-") == 0);
    assert(EndsWith(record.archivePath, ".md"));
    assert(!record.wasFolder);
    assert(!fs::exists(testRoot / "docs" / "api" / "auth.md"));
    assert(ReadFile(guard->absolutePath(record.archivePath)) == "# Auth\n\nOld design.\n");
    assert(cache->get("/docs/api/auth.md") == nullptr);

    assert(record.auditPath && *record.auditPath == record.archivePath + ".audit");
    json audit = json::parse(ReadFile(guard->absolutePath(*record.auditPath)));
    assert(audit["originalPath"] == "/docs/api/auth.md");
    assert(audit["archivePath"] == record.archivePath);
    assert(audit["archivedBy"] == "tester");
    assert(audit["type"] == "file");
    assert(audit["note"] == "obsolete");
    std::cout << "[PASS] Document moved, audit sidecar written, cache dropped." << std::endl;

    std::cout << "[Test] Archiving the same path twice..." << std::endl;
    WriteFile(testRoot / "docs" / "api" / "auth.md", "# Auth\n\nNewer design.\n");
    auto second = archiver.archive("/docs/api/auth.md", false);
    assert(second.archivePath != record.archivePath);
    assert(!second.auditPath);
    assert(fs::exists(guard->absolutePath(record.archivePath)));
    assert(ReadFile(guard->absolutePath(second.archivePath)) == "# Auth\n\nNewer design.\n");
    std::cout << "[PASS] Earlier archives are never overwritten." << std::endl;

    std::cout << "[Test] Rejected archives..." << std::endl;
    assert(ErrorCodeOf([&] { archiver.archive("/docs/none.md", false); }) == "DOCUMENT_NOT_FOUND");
    assert(ErrorCodeOf([&] { archiver.archive(second.archivePath, false); }) == "NAMESPACE_VIOLATION");
    assert(ErrorCodeOf([&] { archiver.archiveFolder("/docs/nothing", false); }) == "DOCUMENT_NOT_FOUND");
    std::cout << "[PASS] Missing and already archived paths." << std::endl;

    std::cout << "[Test] Copy, verify, delete..." << std::endl;
    application::ArchiveManager copier(guard, cache, "tester", application::RelocationMode::CopyVerifyDelete);
    WriteFile(testRoot / "docs" / "copy.md", "# Copy\n\nBody.\n");
    auto copied = copier.archive("/docs/copy.md", false);
    assert(!fs::exists(testRoot / "docs" / "copy.md"));
    assert(ReadFile(guard->absolutePath(copied.archivePath)) == "# Copy\n\nBody.\n");
    fs::path journal = guard->absolutePath(copied.archivePath);
    journal += ".pending";
    assert(!fs::exists(journal));
    std::cout << "[PASS] Copy mode leaves no journal behind." << std::endl;

    std::cout << "[Test] Archiving a folder..." << std::endl;
    WriteFile(testRoot / "docs" / "guide" / "a.md", "# A\n");
    WriteFile(testRoot / "docs" / "guide" / "nested" / "b.md", "# B\n");
    assert(cache->get("/docs/guide/a.md") != nullptr);
    auto folder = copier.archiveFolder("/docs/guide", true, "retired");
    assert(folder.wasFolder);
    assert(folder.originalPath == "/docs/guide/");
    assert(EndsWith(folder.archivePath, "/"));
    assert(!fs::exists(testRoot / "docs" / "guide"));
    assert(ReadFile(guard->absolutePath(folder.archivePath) / "nested" / "b.md") == "# B\n");
    assert(cache->get("/docs/guide/a.md") == nullptr);
    assert(folder.auditPath && !EndsWith(*folder.auditPath, "/.audit"));
    assert(json::parse(ReadFile(guard->absolutePath(*folder.auditPath)))["type"] == "folder");
    std::cout << "[PASS] Folder moved as a whole." << std::endl;

    std::cout << "[Test] Recovering interrupted moves..." << std::endl;
    auto writeJournal = [&](const std::string& original, const std::string& archived) {
        fs::path marker = guard->absolutePath(archived);
        marker += ".pending";
        WriteFile(marker, json{{"originalPath", original}, {"archivePath", archived}}.dump());
    };
    // Copy done, delete missing.
    WriteFile(testRoot / "docs" / "r1.md", "same");
    WriteFile(testRoot / "archived" / "docs" / "r1-x.md", "same");
    writeJournal("/docs/r1.md", "/archived/docs/r1-x.md");
    // Partial copy.
    WriteFile(testRoot / "docs" / "r2.md", "full content");
    WriteFile(testRoot / "archived" / "docs" / "r2-x.md", "full");
    writeJournal("/docs/r2.md", "/archived/docs/r2-x.md");
    // Move finished, journal not removed.
    WriteFile(testRoot / "archived" / "docs" / "r3-x.md", "moved");
    writeJournal("/docs/r3.md", "/archived/docs/r3-x.md");

    std::map<std::string, std::string> outcomes;
    for (const auto& action : archiver.recoverInterrupted()) {
        outcomes[action.originalPath] = action.outcome;
    }
    assert(outcomes.size() == 3);
    assert(outcomes["/docs/r1.md"] == "completed");
    assert(!fs::exists(testRoot / "docs" / "r1.md"));
    assert(fs::exists(testRoot / "archived" / "docs" / "r1-x.md"));

    assert(outcomes["/docs/r2.md"] == "rolled_back");
    assert(ReadFile(testRoot / "docs" / "r2.md") == "full content");
    assert(!fs::exists(testRoot / "archived" / "docs" / "r2-x.md"));

    assert(outcomes["/docs/r3.md"] == "cleared");
    assert(fs::exists(testRoot / "archived" / "docs" / "r3-x.md"));

    for (const auto& entry : fs::recursive_directory_iterator(testRoot / "archived")) {
        assert(entry.path().extension() != ".pending");
    }
    assert(archiver.recoverInterrupted().empty());
    std::cout << "[PASS] completed, rolled_back and cleared." << std::endl;

    std::cout << "[Test] Recovering a half-deleted folder..." << std::endl;
    WriteFile(testRoot / "docs" / "api" / "b.md", "# B\n");
    WriteFile(testRoot / "archived" / "docs" / "api-T" / "a.md", "# A\n");
    WriteFile(testRoot / "archived" / "docs" / "api-T" / "b.md", "# B\n");
    {
        fs::path marker = guard->absolutePath("/archived/docs/api-T/");
        marker += ".pending";
        WriteFile(marker, json{{"originalPath", "/docs/api/"}, {"archivePath", "/archived/docs/api-T/"},
                               {"verified", true}}.dump());
    }
    auto folderRecovery = archiver.recoverInterrupted();
    assert(folderRecovery.size() == 1);
    assert(folderRecovery[0].outcome == "completed");
    assert(!fs::exists(testRoot / "docs" / "api"));
    assert(ReadFile(testRoot / "archived" / "docs" / "api-T" / "a.md") == "# A\n");
    assert(ReadFile(testRoot / "archived" / "docs" / "api-T" / "b.md") == "# B\n");
    assert(!fs::exists(testRoot / "archived" / "docs" / "api-T.pending"));
    std::cout << "[PASS] A verified copy survives a partial source." << std::endl;

    std::cout << "[Test] Concurrent archives in the same second..." << std::endl;
    const int writers = 8;
    for (int i = 0; i < writers; ++i) {
        WriteFile(testRoot / "coordinator" / ("c" + std::to_string(i) + ".md"), "# C" + std::to_string(i) + "\n");
    }
    std::vector<std::string> paths(writers);
    std::vector<std::thread> threads;
    for (int i = 0; i < writers; ++i) {
        threads.emplace_back([&, i] {
            paths[i] = archiver.archive("/coordinator/c" + std::to_string(i) + ".md", false).archivePath;
        });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> distinct(paths.begin(), paths.end());
    assert(static_cast<int>(distinct.size()) == writers);
    for (int i = 0; i < writers; ++i) {
        assert(ReadFile(guard->absolutePath(paths[i])) == "# C" + std::to_string(i) + "\n");
    }
    std::cout << "[PASS] Every archive keeps its own file." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
