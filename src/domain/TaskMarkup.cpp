#include "domain/TaskMarkup.hpp"

#include <cctype>

#include "domain/SectionTree.hpp"

namespace sectionvault::domain {

namespace {

const std::string kArrow = "\xE2\x86\x92"; // →

enum class FieldForm { Star, Dash, Bold, Plain };

struct FieldLine {
    size_t lineStart = 0;
    size_t lineEnd = 0;      ///< Offset of the terminating '\n' (or body end).
    size_t valueStart = 0;   ///< Relative to lineStart.
    std::string value;
};

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
    for (auto& ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80) ch = static_cast<char>(std::tolower(c));
    }
    return s;
}

bool StartsWithNoCase(const std::string& s, size_t pos, const std::string& prefix) {
    if (s.size() < pos + prefix.size()) return false;
    return ToLower(s.substr(pos, prefix.size())) == ToLower(prefix);
}

// Length of the field marker at `pos`, or 0 when the line is not a field line of this form.
size_t MatchMarker(const std::string& line, size_t pos, const std::string& key, FieldForm form) {
    switch (form) {
        case FieldForm::Star:
            return StartsWithNoCase(line, pos, "* " + key + ":") ? key.size() + 3 : 0;
        case FieldForm::Dash:
            return StartsWithNoCase(line, pos, "- " + key + ":") ? key.size() + 3 : 0;
        case FieldForm::Bold: {
            size_t listMarker = 0;
            if (line.compare(pos, 2, "- ") == 0 || line.compare(pos, 2, "* ") == 0) listMarker = 2;
            return StartsWithNoCase(line, pos + listMarker, "**" + key + ":**") ? listMarker + key.size() + 5 : 0;
        }
        case FieldForm::Plain:
            return StartsWithNoCase(line, pos, key + ":") ? key.size() + 1 : 0;
    }
    return 0;
}

std::optional<FieldLine> FindFieldLine(const std::string& body, const std::string& key, FieldForm form) {
    size_t pos = 0;
    while (pos <= body.size()) {
        size_t eol = body.find('\n', pos);
        size_t lineEnd = (eol == std::string::npos) ? body.size() : eol;
        std::string line = body.substr(pos, lineEnd - pos);

        size_t indent = line.find_first_not_of(" \t");
        if (indent != std::string::npos) {
            size_t marker = MatchMarker(line, indent, key, form);
            if (marker > 0) {
                FieldLine match;
                match.lineStart = pos;
                match.lineEnd = lineEnd;
                match.valueStart = indent + marker;
                match.value = Trim(line.substr(match.valueStart));
                return match;
            }
        }

        if (eol == std::string::npos) break;
        pos = eol + 1;
    }
    return std::nullopt;
}

std::optional<FieldLine> FindField(const std::string& body, const std::string& key) {
    for (FieldForm form : {FieldForm::Star, FieldForm::Dash, FieldForm::Bold, FieldForm::Plain}) {
        if (auto match = FindFieldLine(body, key, form)) {
            return match;
        }
    }
    return std::nullopt;
}

std::string SingleLine(const std::string& s) {
    std::string out = Trim(s);
    for (auto& c : out) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return out;
}

} // namespace

std::optional<std::string> TaskMarkup::ExtractField(const std::string& body, const std::string& key) {
    auto match = FindField(body, key);
    if (!match || match->value.empty()) return std::nullopt;
    return match->value;
}

std::optional<TaskStatus> TaskMarkup::ParseStatus(const std::string& value) {
    std::string v = ToLower(Trim(value));
    for (auto& c : v) {
        if (c == ' ' || c == '-') c = '_';
    }
    if (v == "pending") return TaskStatus::Pending;
    if (v == "in_progress") return TaskStatus::InProgress;
    if (v == "completed") return TaskStatus::Completed;
    if (v == "blocked") return TaskStatus::Blocked;
    return std::nullopt;
}

TaskStatus TaskMarkup::StatusOf(const std::string& body) {
    auto value = ExtractField(body, "Status");
    if (!value) return TaskStatus::Pending;
    return ParseStatus(*value).value_or(TaskStatus::Pending);
}

std::string TaskMarkup::SetStatus(const std::string& body, TaskStatus status) {
    const std::string value = TaskStatusToString(status);
    if (auto match = FindField(body, "Status")) {
        return body.substr(0, match->lineStart + match->valueStart) + " " + value +
               body.substr(match->lineEnd);
    }
    std::string trimmed = Trim(body);
    if (trimmed.empty()) return "- Status: " + value;
    return "- Status: " + value + "\n" + trimmed;
}

std::string TaskMarkup::MarkCompleted(const std::string& body, const std::string& date, const std::string& note) {
    std::string updated = Trim(SetStatus(body, TaskStatus::Completed));
    updated += "\n- Completed: " + date;
    updated += "\n- Note: " + SingleLine(note);
    return updated;
}

std::optional<std::string> TaskMarkup::ExtractLink(const std::string& body) {
    size_t pos = 0;
    while (pos < body.size()) {
        size_t eol = body.find('\n', pos);
        std::string line = Trim(body.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos));
        if (line.compare(0, kArrow.size(), kArrow) == 0) {
            std::string link = Trim(line.substr(kArrow.size()));
            if (!link.empty()) return link;
        }
        if (eol == std::string::npos) break;
        pos = eol + 1;
    }
    return std::nullopt;
}

const Heading* TaskMarkup::FindTasksSection(const std::vector<Heading>& headings) {
    for (const auto& h : headings) {
        if (h.slug == "tasks" || ToLower(Trim(h.title)) == "tasks") {
            return &h;
        }
    }
    return nullptr;
}

std::vector<TaskRecord> TaskMarkup::ExtractTasks(const std::string& text, const std::vector<Heading>& headings) {
    std::vector<TaskRecord> tasks;
    const Heading* section = FindTasksSection(headings);
    if (!section) return tasks;

    for (size_t i = section->index + 1; i < headings.size(); ++i) {
        const Heading& h = headings[i];
        if (h.depth <= section->depth) break;
        if (h.depth != section->depth + 1) continue;

        TaskRecord task;
        task.slug = h.slug;
        task.path = h.path;
        task.title = h.title;
        task.depth = h.depth;
        size_t end = SectionTree::OwnBodyEnd(headings, h);
        task.body = Trim(text.substr(h.contentOffset, end - h.contentOffset));
        task.status = StatusOf(task.body);
        task.link = ExtractLink(task.body);
        if (task.link && !task.link->empty() && task.link->front() == '@') {
            std::string target = task.link->substr(1);
            task.linkedDocument = target.substr(0, target.find_first_of(" \t"));
        }
        task.note = ExtractField(task.body, "Note");
        task.completedDate = ExtractField(task.body, "Completed");
        task.phase = ExtractField(task.body, "Phase");
        task.category = ExtractField(task.body, "Category");
        tasks.push_back(std::move(task));
    }
    return tasks;
}

} // namespace sectionvault::domain
