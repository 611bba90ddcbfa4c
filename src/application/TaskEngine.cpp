/**
 * @file TaskEngine.cpp
 * @brief Implementation of TaskEngine.
 */

#include "application/TaskEngine.hpp"

#include <algorithm>
#include <iostream>

#include "application/AddressResolver.hpp"
#include "domain/Errors.hpp"
#include "domain/Limits.hpp"
#include "domain/SectionTree.hpp"
#include "domain/Slug.hpp"
#include "domain/TaskMarkup.hpp"
#include "infrastructure/Clock.hpp"

namespace sectionvault::application {

using domain::SectionTree;
using domain::TaskMarkup;
using domain::TaskRecord;
using domain::TaskStatus;
using json = nlohmann::json;

namespace {

domain::Address ResolveDocument(const std::string& document) {
    domain::Address address = AddressResolver::Resolve(document);
    if (address.sectionSlug) {
        throw domain::AddressingError("INVALID_PATH", "Expected a document path without a section",
                                      json{{"path", document}});
    }
    return address;
}

void RequireRandomAccess(const domain::Address& address) {
    if (address.policy.sequentialOnly) {
        throw domain::AddressingError("NAMESPACE_VIOLATION",
                                      "Tasks in '" + address.policy.name + "' are worked in order; "
                                      "address the next task instead of a slug",
                                      json{{"document", address.documentPath}});
    }
}

std::optional<TaskRecord> FindNext(const std::vector<TaskRecord>& tasks, const std::optional<std::string>& afterSlug) {
    size_t start = 0;
    if (afterSlug) {
        const std::string ref = domain::NormalizeSlugReference(*afterSlug);
        for (size_t i = 0; i < tasks.size(); ++i) {
            if (tasks[i].slug == ref || tasks[i].path == ref) {
                start = i + 1;
                break;
            }
        }
    }
    for (size_t i = start; i < tasks.size(); ++i) {
        if (domain::IsActionable(tasks[i].status)) return tasks[i];
    }
    return std::nullopt;
}

bool AllCompleted(const std::vector<TaskRecord>& tasks) {
    return std::all_of(tasks.begin(), tasks.end(),
                       [](const TaskRecord& t) { return t.status == TaskStatus::Completed; });
}

std::vector<TaskRecord> TasksOf(const std::string& text) {
    return TaskMarkup::ExtractTasks(text, SectionTree::Parse(text));
}

// Task matching a slug reference (flat or hierarchical), or tasks.end().
std::vector<TaskRecord>::const_iterator FindTask(const std::vector<TaskRecord>& tasks,
                                                 const std::vector<domain::Heading>& headings,
                                                 const std::string& slug) {
    const domain::Heading* heading = SectionTree::Find(headings, slug);
    if (!heading) return tasks.end();
    return std::find_if(tasks.begin(), tasks.end(),
                        [&](const TaskRecord& t) { return t.slug == heading->slug; });
}

TaskRecord RequireTask(const std::vector<TaskRecord>& tasks, const std::string& slug, const std::string& document) {
    auto it = std::find_if(tasks.begin(), tasks.end(), [&](const TaskRecord& t) { return t.slug == slug; });
    if (it == tasks.end()) {
        throw domain::TaskStateError("TASK_NOT_FOUND", "Task not found: " + slug,
                                     json{{"document", document}, {"slug", slug}});
    }
    return *it;
}

} // namespace

TaskEngine::TaskEngine(std::shared_ptr<infrastructure::ConcurrencyGuard> guard,
                       std::shared_ptr<infrastructure::DocumentCache> cache,
                       std::shared_ptr<ArchiveManager> archiver,
                       bool auditArchives)
    : m_guard(std::move(guard))
    , m_cache(std::move(cache))
    , m_archiver(std::move(archiver))
    , m_auditArchives(auditArchives) {}

std::vector<TaskRecord> TaskEngine::loadTasks(const std::string& canonicalPath) {
    auto record = m_cache->get(canonicalPath);
    if (!record) {
        throw domain::DocumentNotFoundError(canonicalPath);
    }
    return TaskMarkup::ExtractTasks(record->content, record->headings);
}

std::vector<TaskRecord> TaskEngine::listTasks(const std::string& document, std::optional<TaskStatus> filter) {
    auto tasks = loadTasks(ResolveDocument(document).documentPath);
    if (filter) {
        tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                                   [&](const TaskRecord& t) { return t.status != *filter; }),
                    tasks.end());
    }
    return tasks;
}

std::optional<TaskRecord> TaskEngine::findNextAvailableTask(const std::string& document,
                                                            const std::optional<std::string>& afterSlug) {
    return FindNext(loadTasks(ResolveDocument(document).documentPath), afterSlug);
}

bool TaskEngine::allTasksComplete(const std::string& document) {
    return AllCompleted(loadTasks(ResolveDocument(document).documentPath));
}

std::vector<TaskRecord> TaskEngine::viewTasks(const std::string& document, const std::vector<std::string>& slugs) {
    domain::Address address = ResolveDocument(document);
    RequireRandomAccess(address);
    const std::string& path = address.documentPath;

    if (slugs.empty()) {
        throw domain::AddressingError("MISSING_PARAMETER", "At least one task is required");
    }
    if (slugs.size() > domain::kMaxViewedTasks) {
        throw domain::AddressingError("TOO_MANY_TASKS",
                                      "At most " + std::to_string(domain::kMaxViewedTasks) + " tasks per request",
                                      json{{"requested", slugs.size()}});
    }

    auto record = m_cache->get(path);
    if (!record) {
        throw domain::DocumentNotFoundError(path);
    }
    if (!TaskMarkup::FindTasksSection(record->headings)) {
        throw domain::TaskStateError("NO_TASKS_SECTION", "Document has no Tasks section", json{{"document", path}});
    }

    const auto tasks = TaskMarkup::ExtractTasks(record->content, record->headings);
    std::vector<TaskRecord> found;
    for (const auto& slug : slugs) {
        auto it = FindTask(tasks, record->headings, AddressResolver::NormalizeSlugPath(slug));
        if (it == tasks.end()) {
            json available = json::array();
            for (const auto& t : tasks) available.push_back(t.slug);
            throw domain::TaskStateError("TASK_NOT_FOUND", "Task not found: " + slug,
                                         json{{"document", path}, {"slug", slug}, {"available", available}});
        }
        found.push_back(*it);
    }
    return found;
}

domain::TaskSummary TaskEngine::summarize(const std::string& document) {
    domain::TaskSummary summary;
    for (const auto& task : loadTasks(ResolveDocument(document).documentPath)) {
        summary.overall.add(task.status);
        if (task.phase) summary.byPhase[*task.phase].add(task.status);
        if (task.category) summary.byCategory[*task.category].add(task.status);
    }
    return summary;
}

TaskRecord TaskEngine::startTask(const std::string& document, const std::string& slug) {
    domain::Address address = ResolveDocument(document);
    RequireRandomAccess(address);
    return transition(address, slug, TaskStatus::InProgress);
}

TaskRecord TaskEngine::startNextTask(const std::string& document) {
    domain::Address address = ResolveDocument(document);
    auto next = FindNext(loadTasks(address.documentPath), std::nullopt);
    if (!next) {
        throw domain::TaskStateError("NO_AVAILABLE_TASKS", "No pending or in-progress tasks remain",
                                     json{{"document", address.documentPath}});
    }
    return transition(address, next->slug, TaskStatus::InProgress);
}

CompletionResult TaskEngine::completeTask(const std::string& document, const std::string& slug,
                                          const std::string& note) {
    domain::Address address = ResolveDocument(document);
    RequireRandomAccess(address);
    return completeAt(address, slug, note);
}

CompletionResult TaskEngine::completeNextTask(const std::string& document, const std::string& note) {
    domain::Address address = ResolveDocument(document);
    auto next = FindNext(loadTasks(address.documentPath), std::nullopt);
    if (!next) {
        throw domain::TaskStateError("NO_AVAILABLE_TASKS", "No pending or in-progress tasks remain",
                                     json{{"document", address.documentPath}});
    }
    return completeAt(address, next->slug, note);
}

TaskRecord TaskEngine::transition(const domain::Address& address, const std::string& slug, TaskStatus target) {
    const std::string& path = address.documentPath;
    infrastructure::FileSnapshot snapshot = m_guard->snapshot(path);
    const auto headings = SectionTree::Parse(snapshot.content);
    const auto tasks = TaskMarkup::ExtractTasks(snapshot.content, headings);

    auto it = FindTask(tasks, headings, slug);
    if (it == tasks.end()) {
        throw domain::TaskStateError("TASK_NOT_FOUND", "Task not found: " + slug,
                                     json{{"document", path}, {"slug", slug}});
    }
    if (it->status == target) {
        return *it;
    }
    if (!domain::IsAllowedTransition(it->status, target)) {
        throw domain::TaskStateError("INVALID_TRANSITION",
                                     "Cannot move task from " + domain::TaskStatusToString(it->status) +
                                     " to " + domain::TaskStatusToString(target),
                                     json{{"document", path}, {"slug", it->slug}});
    }

    const std::string updated = SectionTree::ReplaceOwnBody(snapshot.content, it->slug,
                                                            TaskMarkup::SetStatus(it->body, target));
    m_guard->writeIfUnchanged(path, snapshot.version, updated);
    m_cache->invalidate(path);

    return RequireTask(TasksOf(updated), it->slug, path);
}

CompletionResult TaskEngine::completeAt(const domain::Address& address, const std::string& slug,
                                        const std::string& note) {
    const std::string& path = address.documentPath;
    infrastructure::FileSnapshot snapshot = m_guard->snapshot(path);
    const auto headings = SectionTree::Parse(snapshot.content);
    const auto tasks = TaskMarkup::ExtractTasks(snapshot.content, headings);

    auto it = FindTask(tasks, headings, slug);
    if (it == tasks.end()) {
        throw domain::TaskStateError("TASK_NOT_FOUND", "Task not found: " + slug,
                                     json{{"document", path}, {"slug", slug}});
    }
    if (it->body.empty()) {
        throw domain::TaskStateError("TASK_NOT_FOUND", "Task has no content: " + it->slug,
                                     json{{"document", path}, {"slug", it->slug}});
    }
    if (!domain::IsAllowedTransition(it->status, TaskStatus::Completed)) {
        throw domain::TaskStateError("INVALID_TRANSITION", "Task is already completed: " + it->slug,
                                     json{{"document", path}, {"slug", it->slug}});
    }

    CompletionResult result;
    result.document = path;
    result.note = note;
    result.completedDate = infrastructure::UtcDate();

    const std::string updated = SectionTree::ReplaceOwnBody(
        snapshot.content, it->slug, TaskMarkup::MarkCompleted(it->body, result.completedDate, note));
    m_guard->writeIfUnchanged(path, snapshot.version, updated);
    m_cache->invalidate(path);
    std::cout << "[TaskEngine] Completed " << it->slug << " in " << path << std::endl;

    const auto after = TasksOf(updated);
    result.completedTask = RequireTask(after, it->slug, path);

    if (address.policy.autoArchive && AllCompleted(after)) {
        // The completion is already on disk; a failed archive is reported, not rethrown.
        try {
            result.archive = m_archiver->archive(path, m_auditArchives, "All tasks completed");
            result.archived = true;
        } catch (const domain::StoreError& e) {
            std::cerr << "[TaskEngine] Auto-archive of " << path << " failed: " << e.what() << std::endl;
            result.archiveError = e.toJson();
        }
    } else {
        result.nextTask = FindNext(after, it->slug);
    }
    return result;
}

TaskRecord TaskEngine::createTask(const std::string& document, const std::string& title, const std::string& body,
                                  const std::optional<std::string>& afterSlug) {
    domain::Address address = ResolveDocument(document);
    const std::string& path = address.documentPath;

    infrastructure::FileSnapshot snapshot = m_guard->snapshot(path);
    std::string text = snapshot.content;
    auto headings = SectionTree::Parse(text);

    const domain::Heading* tasksSection = TaskMarkup::FindTasksSection(headings);
    if (!tasksSection) {
        auto h1 = std::find_if(headings.begin(), headings.end(),
                               [](const domain::Heading& h) { return h.depth == 1; });
        if (h1 == headings.end()) {
            throw domain::AddressingError("NO_TITLE_HEADING",
                                          "Document needs a title heading before tasks can be added",
                                          json{{"document", path}});
        }
        text = SectionTree::Insert(text, h1->slug, domain::InsertMode::AppendChild, "Tasks",
                                   "Task list for this document.");
        headings = SectionTree::Parse(text);
        tasksSection = TaskMarkup::FindTasksSection(headings);
    }
    if (!tasksSection) {
        throw domain::StorageError("INTERNAL", "Tasks section missing after creation", json{{"document", path}});
    }

    const int taskDepth = std::min(tasksSection->depth + 1, 6);
    std::string taskBody = body;
    if (!TaskMarkup::ExtractField(taskBody, "Status")) {
        taskBody = TaskMarkup::SetStatus(taskBody, TaskStatus::Pending);
    }

    if (afterSlug) {
        const auto existing = TaskMarkup::ExtractTasks(text, headings);
        auto anchor = FindTask(existing, headings, *afterSlug);
        if (anchor == existing.end()) {
            throw domain::TaskStateError("TASK_NOT_FOUND", "Task not found: " + *afterSlug,
                                         json{{"document", path}, {"slug", *afterSlug}});
        }
        text = SectionTree::Insert(text, anchor->slug, domain::InsertMode::InsertAfter, title, taskBody, taskDepth);
    } else {
        text = SectionTree::Insert(text, tasksSection->path, domain::InsertMode::AppendChild, title, taskBody,
                                   taskDepth);
    }

    m_guard->writeIfUnchanged(path, snapshot.version, text);
    m_cache->invalidate(path);

    const auto tasks = TasksOf(text);
    const std::string wanted = domain::SlugFromTitle(title);
    for (const auto& task : tasks) {
        if (domain::SlugFromTitle(task.title) == wanted) {
            return task;
        }
    }
    throw domain::StorageError("INTERNAL", "Created task could not be found", json{{"document", path}});
}

} // namespace sectionvault::application
