/**
 * @file TaskRecord.hpp
 * @brief Task value objects derived from the sections under a "Tasks" heading.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace sectionvault::domain {

/**
 * @enum TaskStatus
 * @brief Lifecycle of a task: Pending -> InProgress -> Completed.
 *
 * Blocked tasks are recognised but never selected as the next task.
 */
enum class TaskStatus {
    Pending,
    InProgress,
    Completed,
    Blocked
};

inline std::string TaskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Blocked: return "blocked";
        default: return "pending";
    }
}

/// Tasks the sequential workflow may pick up.
inline bool IsActionable(TaskStatus status) {
    return status == TaskStatus::Pending || status == TaskStatus::InProgress;
}

/**
 * @brief Checks a transition against the task state machine.
 *
 * Completed is terminal; nothing moves back to Pending.
 */
inline bool IsAllowedTransition(TaskStatus from, TaskStatus to) {
    if (from == TaskStatus::Completed) return false;
    if (to == TaskStatus::Pending) return false;
    if (from == to) return false;
    return true;
}

/**
 * @struct TaskRecord
 * @brief A task section with its status marker parsed.
 */
struct TaskRecord {
    std::string slug;
    std::string path;           ///< Hierarchical slug, e.g. "tasks/implement-caching".
    std::string title;
    int depth = 0;
    TaskStatus status = TaskStatus::Pending;
    std::string body;           ///< Own body, without the heading line.
    std::optional<std::string> link;            ///< Text after a leading "→".
    std::optional<std::string> linkedDocument;  ///< "→ @/path.md" target.
    std::optional<std::string> note;
    std::optional<std::string> completedDate;
    std::optional<std::string> phase;
    std::optional<std::string> category;
};

/**
 * @struct StatusCounts
 * @brief Counts of tasks per status.
 */
struct StatusCounts {
    int total = 0;
    std::map<std::string, int> byStatus;  ///< Keyed by TaskStatusToString.

    void add(TaskStatus status) {
        ++total;
        ++byStatus[TaskStatusToString(status)];
    }
};

/**
 * @struct TaskSummary
 * @brief Status counts for a document plus grouping by embedded tags.
 */
struct TaskSummary {
    StatusCounts overall;
    std::map<std::string, StatusCounts> byPhase;
    std::map<std::string, StatusCounts> byCategory;
};

} // namespace sectionvault::domain
