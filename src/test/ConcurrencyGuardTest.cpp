#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

#include "domain/Errors.hpp"
#include "infrastructure/ConcurrencyGuard.hpp"

using namespace sectionvault;
namespace fs = std::filesystem;

namespace {

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConcurrencyGuard tests..." << std::endl;

    // Use a test-specific root to avoid touching a real workspace
    fs::path testRoot = fs::temp_directory_path() / "sectionvault_guard_test";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    infrastructure::ConcurrencyGuard guard(testRoot);
    const std::string doc = "/notes/plan.md";

    std::cout << "[Test] Create and snapshot..." << std::endl;
    guard.createExclusive(doc, "# Plan\n\nv1\n");
    assert(guard.exists(doc));
    auto snap = guard.snapshot(doc);
    assert(snap.content == "# Plan\n\nv1\n");
    assert(snap.version.size == snap.content.size());

    bool duplicateRejected = false;
    try {
        guard.createExclusive(doc, "# Other\n");
    } catch (const domain::AddressingError& e) {
        duplicateRejected = e.code() == "DOCUMENT_EXISTS";
    }
    assert(duplicateRejected);
    std::cout << "[PASS] Exclusive create." << std::endl;

    std::cout << "[Test] Fresh write..." << std::endl;
    guard.writeIfUnchanged(doc, snap.version, "# Plan\n\nv2\n");
    assert(ReadFile(testRoot / "notes" / "plan.md") == "# Plan\n\nv2\n");
    std::cout << "[PASS] Write with a current version lands exactly." << std::endl;

    std::cout << "[Test] Two writers from the same snapshot..." << std::endl;
    auto writerA = guard.snapshot(doc);
    auto writerB = guard.snapshot(doc);
    guard.writeIfUnchanged(doc, writerA.version, "# Plan\n\nfrom A\n");

    bool conflict = false;
    try {
        guard.writeIfUnchanged(doc, writerB.version, "# Plan\n\nfrom B\n");
    } catch (const domain::ConflictError& e) {
        conflict = e.code() == "CONFLICT";
    }
    assert(conflict);
    assert(ReadFile(testRoot / "notes" / "plan.md") == "# Plan\n\nfrom A\n");
    std::cout << "[PASS] Stale writer gets CONFLICT, file keeps the first write." << std::endl;

    std::cout << "[Test] External edit with identical size..." << std::endl;
    auto before = guard.snapshot(doc);
    {
        std::ofstream out(testRoot / "notes" / "plan.md", std::ios::binary | std::ios::trunc);
        out << "# Plan\n\nfrom C\n";
    }
    bool externalConflict = false;
    try {
        guard.writeIfUnchanged(doc, before.version, "# Plan\n\nlate\n");
    } catch (const domain::ConflictError&) {
        externalConflict = true;
    }
    assert(externalConflict);
    assert(ReadFile(testRoot / "notes" / "plan.md") == "# Plan\n\nfrom C\n");
    std::cout << "[PASS] Content hash catches same-size edits." << std::endl;

    std::cout << "[Test] Racing writers..." << std::endl;
    const int NUM_WRITERS = 16;
    auto shared = guard.snapshot(doc);
    std::atomic<int> winners{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_WRITERS; ++i) {
        threads.emplace_back([&, i]() {
            try {
                guard.writeIfUnchanged(doc, shared.version, "# Plan\n\nwriter " + std::to_string(i) + "\n");
                winners++;
            } catch (const domain::ConflictError&) {
                conflicts++;
            }
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    assert(winners.load() == 1);
    assert(conflicts.load() == NUM_WRITERS - 1);
    assert(ReadFile(testRoot / "notes" / "plan.md").find("writer ") != std::string::npos);

    for (const auto& entry : fs::directory_iterator(testRoot / "notes")) {
        assert(entry.path().filename().string().find(".tmp.") == std::string::npos);
    }
    std::cout << "[PASS] Exactly one of " << NUM_WRITERS << " writers wins, no temp files left." << std::endl;

    std::cout << "[Test] Missing documents..." << std::endl;
    assert(!guard.currentVersion("/notes/missing.md"));
    bool notFound = false;
    try {
        guard.snapshot("/notes/missing.md");
    } catch (const domain::DocumentNotFoundError& e) {
        notFound = e.code() == "DOCUMENT_NOT_FOUND";
    }
    assert(notFound);

    guard.remove(doc);
    assert(!guard.exists(doc));
    std::cout << "[PASS] Missing files report DOCUMENT_NOT_FOUND." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
