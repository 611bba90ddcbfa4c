/**
 * @file TaskEngine.hpp
 * @brief Task state machine on top of the sections under "## Tasks".
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/ArchiveManager.hpp"
#include "domain/Address.hpp"
#include "domain/ArchiveRecord.hpp"
#include "domain/DocumentRecord.hpp"
#include "domain/TaskRecord.hpp"
#include "infrastructure/ConcurrencyGuard.hpp"
#include "infrastructure/DocumentCache.hpp"

namespace sectionvault::application {

/**
 * @struct CompletionResult
 * @brief Outcome of completing a task.
 *
 * Exactly one of nextTask / archive is meaningful: once the last task of an
 * auto-archiving document is completed the document is archived instead. If
 * that archive fails the completion still stands and archiveError says why.
 */
struct CompletionResult {
    std::string document;
    domain::TaskRecord completedTask;
    std::string completedDate;
    std::string note;
    std::optional<domain::TaskRecord> nextTask;
    bool archived = false;
    std::optional<domain::ArchiveRecord> archive;
    std::optional<nlohmann::json> archiveError;   ///< Set when the automatic archive failed.
};

/**
 * @class TaskEngine
 * @brief Lists, starts, completes and creates tasks.
 *
 * Every mutation is one snapshot, one text rewrite, one conditional write and
 * one cache invalidation. Sequential-only namespaces (the coordinator) only
 * accept the "next task" operations.
 */
class TaskEngine {
public:
    TaskEngine(std::shared_ptr<infrastructure::ConcurrencyGuard> guard,
               std::shared_ptr<infrastructure::DocumentCache> cache,
               std::shared_ptr<ArchiveManager> archiver,
               bool auditArchives = true);

    std::vector<domain::TaskRecord> listTasks(const std::string& document,
                                              std::optional<domain::TaskStatus> filter = std::nullopt);

    /**
     * @brief First pending or in-progress task in document order.
     * @param afterSlug Only tasks after this one are considered.
     */
    std::optional<domain::TaskRecord> findNextAvailableTask(const std::string& document,
                                                            const std::optional<std::string>& afterSlug = std::nullopt);

    /// True when there is no Tasks section, no task, or every task is completed.
    bool allTasksComplete(const std::string& document);

    /**
     * @brief Tasks named by @p slugs (flat or hierarchical), in request order.
     * @throws domain::TaskStateError NO_TASKS_SECTION, TASK_NOT_FOUND.
     * @throws domain::AddressingError TOO_MANY_TASKS above ten slugs.
     */
    std::vector<domain::TaskRecord> viewTasks(const std::string& document, const std::vector<std::string>& slugs);

    domain::TaskSummary summarize(const std::string& document);

    /// pending -> in_progress. Starting an in-progress task is a no-op.
    domain::TaskRecord startTask(const std::string& document, const std::string& slug);

    /// Starts the next available task of a sequential document.
    domain::TaskRecord startNextTask(const std::string& document);

    /**
     * @brief Marks a task completed with today's date and a note.
     * @throws domain::TaskStateError TASK_NOT_FOUND, INVALID_TRANSITION.
     * @throws domain::ConflictError when the document changed meanwhile.
     */
    CompletionResult completeTask(const std::string& document, const std::string& slug, const std::string& note);

    /**
     * @brief Completes the next available task (sequential workflow).
     * @throws domain::TaskStateError NO_AVAILABLE_TASKS.
     */
    CompletionResult completeNextTask(const std::string& document, const std::string& note);

    /**
     * @brief Adds a task under "Tasks", creating that section under the H1 if needed.
     * @param afterSlug Place after this task instead of at the end.
     */
    domain::TaskRecord createTask(const std::string& document, const std::string& title, const std::string& body,
                                  const std::optional<std::string>& afterSlug = std::nullopt);

private:
    std::vector<domain::TaskRecord> loadTasks(const std::string& canonicalPath);
    CompletionResult completeAt(const domain::Address& address, const std::string& slug, const std::string& note);
    domain::TaskRecord transition(const domain::Address& address, const std::string& slug, domain::TaskStatus target);

    std::shared_ptr<infrastructure::ConcurrencyGuard> m_guard;
    std::shared_ptr<infrastructure::DocumentCache> m_cache;
    std::shared_ptr<ArchiveManager> m_archiver;
    bool m_auditArchives;
};

} // namespace sectionvault::application
