/**
 * @file TaskMarkup.hpp
 * @brief Reads and rewrites the line protocol of task sections.
 *
 * A task section carries its metadata as field lines:
 * @code
 * ### Implement caching
 * - Status: in_progress
 * - Phase: core
 * → @/docs/cache.md
 * @endcode
 * Fields may also be written as "* Key: v", "**Key:** v" or a bare "Key: v".
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Heading.hpp"
#include "domain/TaskRecord.hpp"

namespace sectionvault::domain {

class TaskMarkup {
public:
    /// Value of a field line, searching "* Key:", "- Key:", "**Key:**" and finally a bare "Key:".
    static std::optional<std::string> ExtractField(const std::string& body, const std::string& key);

    /// Parses a status value ("pending", "in progress", "in_progress", ...).
    static std::optional<TaskStatus> ParseStatus(const std::string& value);

    /// Status of a task body. A missing or unreadable marker means Pending.
    static TaskStatus StatusOf(const std::string& body);

    /**
     * @brief Rewrites the status line in place, keeping its list marker or
     * bold form. Without a status line, "- Status: x" is put first.
     */
    static std::string SetStatus(const std::string& body, TaskStatus status);

    /// Sets Completed and appends "- Completed: <date>" and "- Note: <note>".
    static std::string MarkCompleted(const std::string& body, const std::string& date, const std::string& note);

    /// Text after "→" on the first link line, if any.
    static std::optional<std::string> ExtractLink(const std::string& body);

    /// Heading titled "Tasks" (slug "tasks"), or nullptr.
    static const Heading* FindTasksSection(const std::vector<Heading>& headings);

    /// Direct children of the Tasks section, in document order.
    static std::vector<TaskRecord> ExtractTasks(const std::string& text, const std::vector<Heading>& headings);
};

} // namespace sectionvault::domain
