/**
 * @file ToolDispatcher.cpp
 * @brief Implementation of ToolDispatcher.
 */

#include "application/ToolDispatcher.hpp"

#include <iostream>

#include "application/AddressResolver.hpp"
#include "application/ToolRequests.hpp"
#include "domain/Errors.hpp"
#include "domain/SectionTree.hpp"

namespace sectionvault::application {

using json = nlohmann::json;

const char* const kCoordinatorDocument = "/coordinator/active.md";

namespace {

json ToJson(const domain::TaskRecord& task) {
    json j = {
        {"slug", task.slug},
        {"path", task.path},
        {"title", task.title},
        {"status", domain::TaskStatusToString(task.status)},
        {"content", task.body}
    };
    if (task.link) j["link"] = *task.link;
    if (task.linkedDocument) j["linked_document"] = *task.linkedDocument;
    if (task.note) j["note"] = *task.note;
    if (task.completedDate) j["completed_date"] = *task.completedDate;
    if (task.phase) j["phase"] = *task.phase;
    if (task.category) j["category"] = *task.category;
    return j;
}

json ToJson(const domain::ArchiveRecord& record) {
    json j = {
        {"original_path", record.originalPath},
        {"archive_path", record.archivePath},
        {"archived_at", record.archivedAt},
        {"was_folder", record.wasFolder}
    };
    if (record.auditPath) j["audit_path"] = *record.auditPath;
    return j;
}

json ToJson(const domain::StatusCounts& counts) {
    return json{{"total", counts.total}, {"by_status", counts.byStatus}};
}

json ToJson(const CompletionResult& result) {
    json j = {
        {"document", result.document},
        {"completed_task", {
            {"slug", result.completedTask.slug},
            {"title", result.completedTask.title},
            {"note", result.note},
            {"completed_date", result.completedDate}
        }},
        {"archived", result.archived}
    };
    if (result.archive) {
        j["archived_to"] = result.archive->archivePath;
        j["archive"] = ToJson(*result.archive);
    }
    if (result.archiveError) j["archive_error"] = *result.archiveError;
    j["next_task"] = result.nextTask ? ToJson(*result.nextTask) : json(nullptr);
    return j;
}

json ToJson(const std::vector<domain::OutlineNode>& nodes) {
    json out = json::array();
    for (const auto& node : nodes) {
        out.push_back({
            {"title", node.title},
            {"slug", node.slug},
            {"depth", node.depth},
            {"children", ToJson(node.children)}
        });
    }
    return out;
}

json ToJson(const SectionEditResult& result) {
    json j = {
        {"document", result.document},
        {"action", result.action},
        {"section", result.section}
    };
    if (result.depth) j["depth"] = *result.depth;
    if (result.removedContent) j["removed_content"] = *result.removedContent;
    return j;
}

int StatusFor(const domain::StoreError& e) {
    const std::string& kind = e.kind();
    if (kind == "AddressingError") return 400;
    if (kind == "SectionNotFoundError" || kind == "DocumentNotFoundError") return 404;
    if (kind == "ConflictError" || kind == "TaskStateError") return 409;
    if (e.code() == "FILE_TOO_LARGE") return 413;
    return 500;
}

} // namespace

std::string ToolResponse::serialize() const {
    return body.dump(2, ' ', false, json::error_handler_t::replace);
}

ToolDispatcher::ToolDispatcher(AppServices& services) : m_services(services) {
    m_handlers = {
        {"view_document", [this](const json& b) { return viewDocument(b); }},
        {"view_section", [this](const json& b) { return viewSection(b); }},
        {"section", [this](const json& b) { return section(b); }},
        {"create_document", [this](const json& b) { return createDocument(b); }},
        {"delete_document", [this](const json& b) { return deleteDocument(b); }},
        {"move_document", [this](const json& b) { return moveDocument(b); }},
        {"list_documents", [this](const json& b) { return listDocuments(b); }},
        {"archive_document", [this](const json& b) { return archiveDocument(b); }},
        {"recover_archives", [this](const json& b) { return recoverArchives(b); }},
        {"task", [this](const json& b) { return task(b); }},
        {"view_task", [this](const json& b) { return viewTask(b); }},
        {"task_summary", [this](const json& b) { return taskSummary(b); }},
        {"complete_task", [this](const json& b) { return completeTask(b); }},
        {"view_coordinator_task", [this](const json& b) { return viewCoordinatorTask(b); }},
        {"start_coordinator_task", [this](const json& b) { return startCoordinatorTask(b); }},
        {"complete_coordinator_task", [this](const json& b) { return completeCoordinatorTask(b); }},
    };
}

std::vector<std::string> ToolDispatcher::toolNames() const {
    std::vector<std::string> names;
    for (const auto& entry : m_handlers) {
        names.push_back(entry.first);
    }
    return names;
}

json ToolDispatcher::dispatch(const std::string& tool, const json& body) {
    auto it = m_handlers.find(tool);
    if (it == m_handlers.end()) {
        throw domain::AddressingError("UNKNOWN_TOOL", "Unknown tool: " + tool, json{{"tool", tool}});
    }
    return it->second(body);
}

ToolResponse ToolDispatcher::handle(const std::string& tool, const std::string& rawBody) {
    ToolResponse response;
    try {
        json body = rawBody.find_first_not_of(" \t\r\n") == std::string::npos ? json(nullptr) : json::parse(rawBody);
        response.body = dispatch(tool, body);
    } catch (const json::parse_error& e) {
        domain::AddressingError error("INVALID_PARAMETER", "Request body is not valid JSON",
                                      json{{"detail", e.what()}});
        response.status = 400;
        response.body = json{{"error", error.toJson()}};
    } catch (const domain::StoreError& e) {
        response.status = StatusFor(e);
        response.body = json{{"error", e.toJson()}};
    } catch (const std::exception& e) {
        std::cerr << "[ToolDispatcher] " << tool << " failed: " << e.what() << std::endl;
        domain::StorageError error("INTERNAL", "Internal error while running " + tool,
                                   json{{"detail", e.what()}});
        response.status = 500;
        response.body = json{{"error", error.toJson()}};
    }
    return response;
}

json ToolDispatcher::viewDocument(const json& body) {
    auto request = DocumentRequest::FromJson(body);
    auto record = m_services.documentService->viewDocument(request.document);

    json headings = json::array();
    for (const auto& h : record->headings) {
        headings.push_back({{"slug", h.slug}, {"path", h.path}, {"title", h.title}, {"depth", h.depth}});
    }
    return json{
        {"document", record->path},
        {"title", record->title},
        {"namespace", record->namespaceName},
        {"word_count", record->wordCount},
        {"headings", headings},
        {"outline", ToJson(domain::SectionTree::BuildOutline(record->headings))}
    };
}

json ToolDispatcher::viewSection(const json& body) {
    auto request = ViewSectionRequest::FromJson(body);
    return json{
        {"section", request.address},
        {"content", m_services.documentService->viewSection(request.address)}
    };
}

json ToolDispatcher::section(const json& body) {
    auto request = SectionRequest::FromJson(body);
    if (!request.batch) {
        return ToJson(m_services.documentService->editSection(request.edits.front()));
    }

    json results = json::array();
    int failed = 0;
    for (const auto& outcome : m_services.documentService->editSections(request.edits)) {
        json entry = {
            {"operation", SectionOperationToString(outcome.request.operation)},
            {"section", outcome.request.section}
        };
        if (outcome.result) {
            entry["success"] = true;
            entry["result"] = ToJson(*outcome.result);
        } else {
            entry["success"] = false;
            entry["error"] = outcome.error.value_or(json(nullptr));
            ++failed;
        }
        results.push_back(entry);
    }
    return json{
        {"batch_results", results},
        {"operations_completed", static_cast<int>(request.edits.size()) - failed},
        {"operations_failed", failed}
    };
}

json ToolDispatcher::createDocument(const json& body) {
    auto request = CreateDocumentRequest::FromJson(body);
    auto record = m_services.documentService->createDocument(request.document, request.title, request.overview);
    return json{{"created", true}, {"document", record->path}, {"title", record->title}};
}

json ToolDispatcher::deleteDocument(const json& body) {
    auto request = DocumentRequest::FromJson(body);
    m_services.documentService->deleteDocument(request.document);
    return json{{"deleted", true}, {"document", request.document}};
}

json ToolDispatcher::moveDocument(const json& body) {
    auto request = MoveDocumentRequest::FromJson(body);
    auto record = m_services.documentService->moveDocument(request.from, request.to);
    return json{
        {"action", "moved"},
        {"from", AddressResolver::NormalizeDocumentPath(request.from)},
        {"to", record->path},
        {"title", record->title}
    };
}

json ToolDispatcher::listDocuments(const json& body) {
    auto request = ListDocumentsRequest::FromJson(body);
    json documents = json::array();
    for (const auto& doc : m_services.documentService->listDocuments(request.folder)) {
        documents.push_back({
            {"path", doc.path},
            {"title", doc.title},
            {"namespace", doc.namespaceName},
            {"word_count", doc.wordCount},
            {"heading_count", doc.headingCount}
        });
    }
    return json{{"documents", documents}};
}

json ToolDispatcher::archiveDocument(const json& body) {
    auto request = ArchiveRequest::FromJson(body);
    const bool audit = request.audit.value_or(m_services.config.auditArchives);
    domain::ArchiveRecord record = request.folder
        ? m_services.archiveManager->archiveFolder(*request.folder, audit, request.note)
        : m_services.archiveManager->archive(*request.document, audit, request.note);
    return ToJson(record);
}

json ToolDispatcher::recoverArchives(const json& body) {
    if (!body.is_null()) {
        RequestFields fields(body, {});
    }
    json actions = json::array();
    for (const auto& action : m_services.archiveManager->recoverInterrupted()) {
        actions.push_back({
            {"original_path", action.originalPath},
            {"archive_path", action.archivePath},
            {"outcome", action.outcome}
        });
    }
    return json{{"recovered", actions}};
}

json ToolDispatcher::task(const json& body) {
    auto request = TaskRequest::FromJson(body);
    TaskEngine& engine = *m_services.taskEngine;

    switch (request.operation) {
        case TaskOperation::Create: {
            auto created = engine.createTask(request.document, request.title, request.content, request.slug);
            return json{{"created", true}, {"task", ToJson(created)}};
        }
        case TaskOperation::Start: {
            auto started = engine.startTask(request.document, *request.slug);
            return json{{"task", ToJson(started)}};
        }
        case TaskOperation::List:
        default: {
            json tasks = json::array();
            for (const auto& t : engine.listTasks(request.document, request.status)) {
                tasks.push_back(ToJson(t));
            }
            auto next = engine.findNextAvailableTask(request.document);
            return json{
                {"document", request.document},
                {"tasks", tasks},
                {"next_task", next ? ToJson(*next) : json(nullptr)}
            };
        }
    }
}

json ToolDispatcher::viewTask(const json& body) {
    auto request = ViewTaskRequest::FromJson(body);
    json tasks = json::array();
    for (const auto& t : m_services.taskEngine->viewTasks(request.document, request.tasks)) {
        json entry = ToJson(t);
        entry["depth"] = t.depth;
        tasks.push_back(entry);
    }
    return json{{"document", request.document}, {"tasks", tasks}};
}

json ToolDispatcher::taskSummary(const json& body) {
    auto request = DocumentRequest::FromJson(body);
    auto summary = m_services.taskEngine->summarize(request.document);

    json byPhase = json::object();
    for (const auto& [phase, counts] : summary.byPhase) byPhase[phase] = ToJson(counts);
    json byCategory = json::object();
    for (const auto& [category, counts] : summary.byCategory) byCategory[category] = ToJson(counts);

    return json{
        {"document", request.document},
        {"total", summary.overall.total},
        {"by_status", summary.overall.byStatus},
        {"by_phase", byPhase},
        {"by_category", byCategory},
        {"all_complete", m_services.taskEngine->allTasksComplete(request.document)}
    };
}

json ToolDispatcher::completeTask(const json& body) {
    auto request = CompleteTaskRequest::FromJson(body);
    return ToJson(m_services.taskEngine->completeTask(request.document, request.slug, request.note));
}

json ToolDispatcher::viewCoordinatorTask(const json& body) {
    CoordinatorRequest::FromJson(body, false);
    auto next = m_services.taskEngine->findNextAvailableTask(kCoordinatorDocument);
    if (!next) {
        throw domain::TaskStateError("NO_AVAILABLE_TASKS", "No pending or in-progress tasks remain",
                                     json{{"document", kCoordinatorDocument}});
    }
    return json{{"document", kCoordinatorDocument}, {"task", ToJson(*next)}};
}

json ToolDispatcher::startCoordinatorTask(const json& body) {
    CoordinatorRequest::FromJson(body, false);
    auto started = m_services.taskEngine->startNextTask(kCoordinatorDocument);
    return json{{"document", kCoordinatorDocument}, {"task", ToJson(started)}};
}

json ToolDispatcher::completeCoordinatorTask(const json& body) {
    auto request = CoordinatorRequest::FromJson(body, true);
    return ToJson(m_services.taskEngine->completeNextTask(kCoordinatorDocument, request.note));
}

} // namespace sectionvault::application
