#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include "application/ArchiveManager.hpp"
#include "application/TaskEngine.hpp"
#include "domain/Errors.hpp"
#include "domain/TaskMarkup.hpp"
#include "infrastructure/Clock.hpp"

using namespace sectionvault;
namespace fs = std::filesystem;
using domain::TaskStatus;

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

template <typename Fn>
std::string ErrorCodeOf(Fn fn) {
    try {
        fn();
    } catch (const domain::StoreError& e) {
        return e.code();
    }
    return "";
}

struct Fixture {
    fs::path root;
    std::shared_ptr<infrastructure::ConcurrencyGuard> guard;
    std::shared_ptr<infrastructure::DocumentCache> cache;
    std::shared_ptr<application::ArchiveManager> archiver;
    std::unique_ptr<application::TaskEngine> engine;

    explicit Fixture(const fs::path& testRoot) : root(testRoot) {
        fs::remove_all(root);
        fs::create_directories(root);
        guard = std::make_shared<infrastructure::ConcurrencyGuard>(root);
        cache = std::make_shared<infrastructure::DocumentCache>(guard);
        archiver = std::make_shared<application::ArchiveManager>(guard, cache, "task-test");
        engine = std::make_unique<application::TaskEngine>(guard, cache, archiver, true);
    }
};

void TestMarkup() {
    std::cout << "[Test] Status markers..." << std::endl;
    using domain::TaskMarkup;
    assert(TaskMarkup::StatusOf("- Status: in_progress") == TaskStatus::InProgress);
    assert(TaskMarkup::StatusOf("* Status: completed") == TaskStatus::Completed);
    assert(TaskMarkup::StatusOf("**Status:** blocked") == TaskStatus::Blocked);
    assert(TaskMarkup::StatusOf("- **Status:** In Progress") == TaskStatus::InProgress);
    assert(TaskMarkup::StatusOf("Just a description") == TaskStatus::Pending);
    assert(TaskMarkup::StatusOf("- Status: someday") == TaskStatus::Pending);

    // "* Key:" wins over "- Key:".
    assert(TaskMarkup::StatusOf("- Status: pending\n* Status: completed") == TaskStatus::Completed);

    assert(TaskMarkup::SetStatus("* Status: pending\nBody", TaskStatus::InProgress) ==
           "* Status: in_progress\nBody");
    assert(TaskMarkup::SetStatus("Body only", TaskStatus::Pending) == "- Status: pending\nBody only");

    std::string done = TaskMarkup::MarkCompleted("- Status: pending\nWork", "2026-01-02", "all\ngood");
    assert(done == "- Status: completed\nWork\n- Completed: 2026-01-02\n- Note: all good");

    auto link = TaskMarkup::ExtractLink("- Status: pending\n\xE2\x86\x92 @/specs/auth.md#tokens");
    assert(link && *link == "@/specs/auth.md#tokens");

    // Bare "Key:" lines are read and rewritten in place.
    assert(TaskMarkup::StatusOf("Status: completed\nBody") == TaskStatus::Completed);
    assert(TaskMarkup::StatusOf("  status: in progress") == TaskStatus::InProgress);
    assert(TaskMarkup::SetStatus("Status: pending\nBody", TaskStatus::InProgress) == "Status: in_progress\nBody");
    std::string bare = TaskMarkup::MarkCompleted("Status: in_progress\nWork", "2026-01-02", "ok");
    assert(bare == "Status: completed\nWork\n- Completed: 2026-01-02\n- Note: ok");
    assert(bare.find("- Status:") == std::string::npos);
    std::cout << "[PASS] Status lines in all four forms." << std::endl;
}

void TestSequenceAndCompletion(Fixture& f) {
    std::cout << "[Test] Completing tasks in order..." << std::endl;
    const std::string doc = "/projects/demo.md";
    WriteFile(f.root / "projects" / "demo.md",
              "# Demo\n\nIntro.\n\n## Tasks\n\n"
              "### Task A\n- Status: pending\n- Phase: one\n\n"
              "### Task B\n- Status: pending\n- Phase: two\n"
              "\xE2\x86\x92 @/specs/b.md\n\n"
              "### Task C\n**Status:** blocked\n- Phase: two\n");

    auto tasks = f.engine->listTasks(doc);
    assert(tasks.size() == 3);
    assert(tasks[0].slug == "task-a" && tasks[0].path == "demo/tasks/task-a");
    assert(tasks[1].linkedDocument && *tasks[1].linkedDocument == "/specs/b.md");
    assert(tasks[2].status == TaskStatus::Blocked);
    assert(f.engine->listTasks(doc, TaskStatus::Blocked).size() == 1);

    auto next1 = f.engine->findNextAvailableTask(doc);
    auto next2 = f.engine->findNextAvailableTask(doc);
    assert(next1 && next2 && next1->slug == "task-a" && next2->slug == "task-a");
    assert(!f.engine->allTasksComplete(doc));

    auto result = f.engine->completeTask(doc, "task-a", "done");
    assert(!result.archived);
    assert(result.completedTask.status == TaskStatus::Completed);
    assert(result.completedDate == infrastructure::UtcDate());
    assert(result.nextTask && result.nextTask->slug == "task-b");

    std::string text = ReadFile(f.root / "projects" / "demo.md");
    assert(text.find("### Task A\n\n- Status: completed\n- Phase: one\n- Completed: " +
                     result.completedDate + "\n- Note: done\n") != std::string::npos);
    assert(text.find("### Task B\n- Status: pending") != std::string::npos);

    // Cache reflects the write.
    auto reloaded = f.engine->listTasks(doc);
    assert(reloaded[0].status == TaskStatus::Completed);
    assert(reloaded[0].note && *reloaded[0].note == "done");

    assert(ErrorCodeOf([&] { f.engine->completeTask(doc, "task-a", "again"); }) == "INVALID_TRANSITION");
    assert(ErrorCodeOf([&] { f.engine->startTask(doc, "task-a"); }) == "INVALID_TRANSITION");
    assert(ErrorCodeOf([&] { f.engine->completeTask(doc, "ghost", "x"); }) == "TASK_NOT_FOUND");
    assert(ErrorCodeOf([&] { f.engine->listTasks("/projects/none.md"); }) == "DOCUMENT_NOT_FOUND");
    std::cout << "[PASS] Completion writes status, date and note; next task is B." << std::endl;

    std::cout << "[Test] Starting tasks..." << std::endl;
    auto started = f.engine->startTask(doc, "tasks/task-b");
    assert(started.status == TaskStatus::InProgress);
    assert(ReadFile(f.root / "projects" / "demo.md").find("- Status: in_progress") != std::string::npos);
    auto again = f.engine->startTask(doc, "task-b");
    assert(again.status == TaskStatus::InProgress);
    assert(f.engine->findNextAvailableTask(doc)->slug == "task-b");
    std::cout << "[PASS] pending -> in_progress, repeat start is a no-op." << std::endl;

    std::cout << "[Test] Summary..." << std::endl;
    auto summary = f.engine->summarize(doc);
    assert(summary.overall.total == 3);
    assert(summary.overall.byStatus["completed"] == 1);
    assert(summary.overall.byStatus["in_progress"] == 1);
    assert(summary.overall.byStatus["blocked"] == 1);
    assert(summary.byPhase["two"].total == 2);
    assert(summary.byPhase["one"].byStatus["completed"] == 1);
    std::cout << "[PASS] Counts by status and phase." << std::endl;

    std::cout << "[Test] Next task after a given one..." << std::endl;
    auto afterA = f.engine->findNextAvailableTask(doc, std::string("task-a"));
    assert(afterA && afterA->slug == "task-b");
    assert(!f.engine->findNextAvailableTask(doc, std::string("task-b")));
    assert(!f.engine->findNextAvailableTask(doc, std::string("task-c")));
    std::cout << "[PASS] Only later tasks are considered." << std::endl;

    std::cout << "[Test] Viewing tasks..." << std::endl;
    auto viewed = f.engine->viewTasks(doc, {"task-b", "tasks/task-a"});
    assert(viewed.size() == 2);
    assert(viewed[0].slug == "task-b" && viewed[0].status == TaskStatus::InProgress);
    assert(viewed[0].linkedDocument && *viewed[0].linkedDocument == "/specs/b.md");
    assert(viewed[1].slug == "task-a" && viewed[1].note && *viewed[1].note == "done");
    assert(ErrorCodeOf([&] { f.engine->viewTasks(doc, {"ghost"}); }) == "TASK_NOT_FOUND");
    assert(ErrorCodeOf([&] { f.engine->viewTasks(doc, {}); }) == "MISSING_PARAMETER");
    std::vector<std::string> eleven(11, "task-a");
    assert(ErrorCodeOf([&] { f.engine->viewTasks(doc, eleven); }) == "TOO_MANY_TASKS");
    WriteFile(f.root / "projects" / "plain.md", "# Plain\n\nNo tasks.\n");
    assert(ErrorCodeOf([&] { f.engine->viewTasks("/projects/plain.md", {"x"}); }) == "NO_TASKS_SECTION");
    std::cout << "[PASS] Tasks by slug with status, note and link." << std::endl;
}

void TestLastPendingTask(Fixture& f) {
    std::cout << "[Test] Completing the last task in order..." << std::endl;
    const std::string doc = "/projects/pair.md";
    WriteFile(f.root / "projects" / "pair.md",
              "# Pair\n\n## Tasks\n\n### A\n- Status: pending\n\n### B\n- Status: pending\n");
    assert(!f.engine->findNextAvailableTask(doc, std::string("b")));

    auto result = f.engine->completeTask(doc, "b", "done");
    assert(!result.archived);
    assert(!result.nextTask);
    assert(f.engine->findNextAvailableTask(doc)->slug == "a");
    std::cout << "[PASS] No earlier task is reported as next." << std::endl;
}

void TestBareStatusLine(Fixture& f) {
    std::cout << "[Test] Bare status lines..." << std::endl;
    const std::string doc = "/projects/bare.md";
    WriteFile(f.root / "projects" / "bare.md",
              "# Bare\n\n## Tasks\n\n### Old\nStatus: completed\n\n### New\nStatus: pending\n");
    auto tasks = f.engine->listTasks(doc);
    assert(tasks[0].status == TaskStatus::Completed);
    assert(f.engine->findNextAvailableTask(doc)->slug == "new");

    f.engine->startTask(doc, "new");
    std::string text = ReadFile(f.root / "projects" / "bare.md");
    assert(text.find("### New\n\nStatus: in_progress\n") != std::string::npos);
    assert(text.find("- Status:") == std::string::npos);
    std::cout << "[PASS] One status marker per task after a transition." << std::endl;
}

void TestCreateTask(Fixture& f) {
    std::cout << "[Test] Creating tasks..." << std::endl;
    const std::string doc = "/projects/fresh.md";
    WriteFile(f.root / "projects" / "fresh.md", "# Fresh\n\nIntro.\n");
    assert(f.engine->allTasksComplete(doc));

    auto first = f.engine->createTask(doc, "First Step", "Do the first thing.");
    assert(first.slug == "first-step");
    assert(first.status == TaskStatus::Pending);
    assert(first.depth == 3);

    std::string text = ReadFile(f.root / "projects" / "fresh.md");
    assert(text.find("## Tasks\n\nTask list for this document.\n") != std::string::npos);
    assert(text.find("### First Step\n\n- Status: pending\nDo the first thing.\n") != std::string::npos);

    f.engine->createTask(doc, "Last Step", "- Status: pending");
    f.engine->createTask(doc, "Middle Step", "", std::string("first-step"));
    auto tasks = f.engine->listTasks(doc);
    assert(tasks.size() == 3);
    assert(tasks[0].slug == "first-step");
    assert(tasks[1].slug == "middle-step");
    assert(tasks[2].slug == "last-step");

    assert(ErrorCodeOf([&] { f.engine->createTask(doc, "First Step", ""); }) == "DUPLICATE_HEADING");

    WriteFile(f.root / "projects" / "untitled.md", "No title here.\n");
    assert(ErrorCodeOf([&] { f.engine->createTask("/projects/untitled.md", "X", ""); }) == "NO_TITLE_HEADING");
    std::cout << "[PASS] Tasks section created under the title; order honoured." << std::endl;
}

void TestCoordinatorAutoArchive(Fixture& f) {
    std::cout << "[Test] Coordinator auto-archive..." << std::endl;
    const std::string doc = "/coordinator/active.md";
    WriteFile(f.root / "coordinator" / "active.md",
              "# Coordinator\n\n## Tasks\n\n### Only Task\n- Status: pending\n");

    assert(ErrorCodeOf([&] { f.engine->completeTask(doc, "only-task", "x"); }) == "NAMESPACE_VIOLATION");
    assert(ErrorCodeOf([&] { f.engine->startTask(doc, "only-task"); }) == "NAMESPACE_VIOLATION");

    auto started = f.engine->startNextTask(doc);
    assert(started.slug == "only-task" && started.status == TaskStatus::InProgress);

    auto result = f.engine->completeNextTask(doc, "finished");
    assert(result.archived);
    assert(!result.nextTask);
    assert(result.archive);
    assert(result.archive->archivePath.compare(0, 22, "/archived/coordinator/") == 0);
    assert(result.archive->auditPath);

    assert(f.cache->get(doc) == nullptr);
    assert(!fs::exists(f.root / "coordinator" / "active.md"));

    int archivedDocs = 0;
    for (const auto& entry : fs::directory_iterator(f.root / "archived" / "coordinator")) {
        if (entry.path().extension() == ".md") ++archivedDocs;
    }
    assert(archivedDocs == 1);

    std::string archived = ReadFile(f.guard->absolutePath(result.archive->archivePath));
    assert(archived.find("- Note: finished") != std::string::npos);
    std::cout << "[PASS] Last completion archives the coordinator list." << std::endl;

    std::cout << "[Test] Coordinator with nothing left..." << std::endl;
    WriteFile(f.root / "coordinator" / "active.md", "# Coordinator\n\n## Tasks\n\n### Done\n- Status: completed\n");
    assert(ErrorCodeOf([&] { f.engine->completeNextTask(doc, "x"); }) == "NO_AVAILABLE_TASKS");
    std::cout << "[PASS] NO_AVAILABLE_TASKS when every task is done." << std::endl;
}

void TestAutoArchiveFailure() {
    std::cout << "[Test] Auto-archive failure..." << std::endl;
    Fixture f(fs::temp_directory_path() / "sectionvault_task_archive_fail_test");
    const std::string doc = "/coordinator/active.md";
    WriteFile(f.root / "coordinator" / "active.md",
              "# Coordinator\n\n## Tasks\n\n### Only Task\n- Status: in_progress\n");
    // A plain file where the archive directory belongs makes the move fail.
    WriteFile(f.root / "archived", "blocker");

    auto result = f.engine->completeNextTask(doc, "finished");
    assert(!result.archived);
    assert(!result.archive);
    assert(result.archiveError);
    assert((*result.archiveError)["code"] == "ARCHIVE_IO");
    assert(result.completedTask.status == TaskStatus::Completed);
    assert(ReadFile(f.root / "coordinator" / "active.md").find("- Note: finished") != std::string::npos);
    assert(f.engine->allTasksComplete(doc));

    fs::remove(f.root / "archived");
    auto archived = f.archiver->archive(doc, false, "manual");
    assert(archived.archivePath.compare(0, 22, "/archived/coordinator/") == 0);
    fs::remove_all(f.root);
    std::cout << "[PASS] Completion stands and the failure is reported." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TaskEngine tests..." << std::endl;
    TestMarkup();

    Fixture fixture(fs::temp_directory_path() / "sectionvault_task_test");
    TestSequenceAndCompletion(fixture);
    TestLastPendingTask(fixture);
    TestBareStatusLine(fixture);
    TestCreateTask(fixture);
    TestCoordinatorAutoArchive(fixture);
    TestAutoArchiveFailure();

    fs::remove_all(fixture.root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
