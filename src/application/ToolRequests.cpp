#include "application/ToolRequests.hpp"

#include "domain/Errors.hpp"
#include "domain/TaskMarkup.hpp"

namespace sectionvault::application {

using domain::AddressingError;
using json = nlohmann::json;

namespace {

SectionEdit DecodeEdit(const json& body, const std::optional<std::string>& defaultDocument) {
    RequestFields fields(body, {"document", "section", "operation", "content", "title", "depth"});

    SectionEdit edit;
    auto document = fields.optionalString("document");
    if (!document) document = defaultDocument;
    if (!document || document->empty()) {
        throw AddressingError("MISSING_PARAMETER", "Missing required parameter: document");
    }
    edit.document = *document;
    edit.section = fields.requireString("section");

    const std::string operation = fields.optionalString("operation").value_or("replace");
    auto parsed = ParseSectionOperation(operation);
    if (!parsed) {
        throw AddressingError("INVALID_PARAMETER", "Unknown section operation: " + operation,
                              json{{"operation", operation}});
    }
    edit.operation = *parsed;
    edit.title = fields.optionalString("title");
    edit.depth = fields.optionalInt("depth");

    switch (edit.operation) {
        case SectionOperation::Replace:
        case SectionOperation::Append:
        case SectionOperation::Prepend:
            edit.content = fields.requireString("content");
            break;
        case SectionOperation::InsertBefore:
        case SectionOperation::InsertAfter:
        case SectionOperation::AppendChild:
            edit.content = fields.optionalString("content").value_or("");
            if (!edit.title || edit.title->empty()) {
                throw AddressingError("MISSING_PARAMETER", "Missing required parameter: title",
                                      json{{"operation", operation}});
            }
            break;
        case SectionOperation::Rename:
            if (!edit.title || edit.title->empty()) {
                throw AddressingError("MISSING_PARAMETER", "Missing required parameter: title",
                                      json{{"operation", operation}});
            }
            break;
        case SectionOperation::Remove:
            break;
    }
    return edit;
}

} // namespace

RequestFields::RequestFields(const json& body, std::initializer_list<const char*> allowed) : m_body(body) {
    if (!m_body.is_object()) {
        throw AddressingError("INVALID_PARAMETER", "Request body must be a JSON object");
    }
    for (auto it = m_body.begin(); it != m_body.end(); ++it) {
        bool known = false;
        for (const char* key : allowed) {
            if (it.key() == key) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw AddressingError("INVALID_PARAMETER", "Unknown parameter: " + it.key(),
                                  json{{"parameter", it.key()}});
        }
    }
}

bool RequestFields::has(const char* key) const {
    return m_body.contains(key) && !m_body.at(key).is_null();
}

const json& RequestFields::raw(const char* key) const {
    return m_body.at(key);
}

std::string RequestFields::requireString(const char* key) const {
    auto value = optionalString(key);
    if (!value || value->empty()) {
        throw AddressingError("MISSING_PARAMETER", std::string("Missing required parameter: ") + key,
                              json{{"parameter", key}});
    }
    return *value;
}

std::optional<std::string> RequestFields::optionalString(const char* key) const {
    if (!has(key)) return std::nullopt;
    const json& value = m_body.at(key);
    if (!value.is_string()) {
        throw AddressingError("INVALID_PARAMETER", std::string("Parameter must be a string: ") + key,
                              json{{"parameter", key}});
    }
    return value.get<std::string>();
}

std::optional<int> RequestFields::optionalInt(const char* key) const {
    if (!has(key)) return std::nullopt;
    const json& value = m_body.at(key);
    if (!value.is_number_integer()) {
        throw AddressingError("INVALID_PARAMETER", std::string("Parameter must be an integer: ") + key,
                              json{{"parameter", key}});
    }
    return value.get<int>();
}

std::optional<bool> RequestFields::optionalBool(const char* key) const {
    if (!has(key)) return std::nullopt;
    const json& value = m_body.at(key);
    if (!value.is_boolean()) {
        throw AddressingError("INVALID_PARAMETER", std::string("Parameter must be a boolean: ") + key,
                              json{{"parameter", key}});
    }
    return value.get<bool>();
}

DocumentRequest DocumentRequest::FromJson(const json& body) {
    RequestFields fields(body, {"document"});
    return DocumentRequest{fields.requireString("document")};
}

ViewSectionRequest ViewSectionRequest::FromJson(const json& body) {
    RequestFields fields(body, {"document", "section"});
    std::string section = fields.requireString("section");
    if (section.front() == '/') {
        return ViewSectionRequest{section};
    }
    std::string document = fields.requireString("document");
    if (section.front() == '#') section.erase(0, 1);
    return ViewSectionRequest{document + "#" + section};
}

SectionRequest SectionRequest::FromJson(const json& body) {
    SectionRequest request;
    if (body.is_object() && body.contains("operations")) {
        RequestFields fields(body, {"document", "operations"});
        const json& operations = fields.raw("operations");
        if (!operations.is_array()) {
            throw AddressingError("INVALID_PARAMETER", "Parameter must be an array: operations");
        }
        if (operations.empty()) {
            throw AddressingError("MISSING_PARAMETER", "At least one operation is required");
        }
        auto document = fields.optionalString("document");
        request.batch = true;
        for (const auto& op : operations) {
            request.edits.push_back(DecodeEdit(op, document));
        }
        return request;
    }
    request.edits.push_back(DecodeEdit(body, std::nullopt));
    return request;
}

CreateDocumentRequest CreateDocumentRequest::FromJson(const json& body) {
    RequestFields fields(body, {"document", "title", "overview"});
    CreateDocumentRequest request;
    request.document = fields.requireString("document");
    request.title = fields.requireString("title");
    request.overview = fields.optionalString("overview").value_or("");
    return request;
}

MoveDocumentRequest MoveDocumentRequest::FromJson(const json& body) {
    RequestFields fields(body, {"from", "to"});
    MoveDocumentRequest request;
    request.from = fields.requireString("from");
    request.to = fields.requireString("to");
    return request;
}

ListDocumentsRequest ListDocumentsRequest::FromJson(const json& body) {
    ListDocumentsRequest request;
    if (body.is_null()) return request;
    RequestFields fields(body, {"folder"});
    request.folder = fields.optionalString("folder").value_or("/");
    return request;
}

ArchiveRequest ArchiveRequest::FromJson(const json& body) {
    RequestFields fields(body, {"document", "folder", "audit", "note"});
    ArchiveRequest request;
    request.document = fields.optionalString("document");
    request.folder = fields.optionalString("folder");
    request.audit = fields.optionalBool("audit");
    request.note = fields.optionalString("note").value_or("");
    if (request.document.has_value() == request.folder.has_value()) {
        throw AddressingError("MISSING_PARAMETER", "Exactly one of document or folder is required");
    }
    return request;
}

TaskRequest TaskRequest::FromJson(const json& body) {
    RequestFields fields(body, {"document", "operation", "status", "title", "content", "slug"});
    TaskRequest request;
    request.document = fields.requireString("document");

    const std::string operation = fields.optionalString("operation").value_or("list");
    if (operation == "list") {
        request.operation = TaskOperation::List;
        if (auto status = fields.optionalString("status")) {
            request.status = domain::TaskMarkup::ParseStatus(*status);
            if (!request.status) {
                throw AddressingError("INVALID_PARAMETER", "Unknown task status: " + *status,
                                      json{{"status", *status}});
            }
        }
    } else if (operation == "create") {
        request.operation = TaskOperation::Create;
        request.title = fields.requireString("title");
        request.content = fields.optionalString("content").value_or("");
        request.slug = fields.optionalString("slug");
    } else if (operation == "start") {
        request.operation = TaskOperation::Start;
        request.slug = fields.requireString("slug");
    } else {
        throw AddressingError("INVALID_PARAMETER", "Unknown task operation: " + operation,
                              json{{"operation", operation}});
    }
    return request;
}

ViewTaskRequest ViewTaskRequest::FromJson(const json& body) {
    RequestFields fields(body, {"document", "task"});
    ViewTaskRequest request;
    request.document = fields.requireString("document");
    if (!fields.has("task")) {
        throw AddressingError("MISSING_PARAMETER", "Missing required parameter: task", json{{"parameter", "task"}});
    }
    const json& task = fields.raw("task");
    if (task.is_array()) {
        for (const auto& slug : task) {
            if (!slug.is_string() || slug.get<std::string>().empty()) {
                throw AddressingError("INVALID_PARAMETER", "Every task must be a non-empty string",
                                      json{{"parameter", "task"}});
            }
            request.tasks.push_back(slug.get<std::string>());
        }
    } else {
        request.tasks.push_back(fields.requireString("task"));
    }
    return request;
}

CompleteTaskRequest CompleteTaskRequest::FromJson(const json& body) {
    RequestFields fields(body, {"document", "slug", "note"});
    CompleteTaskRequest request;
    request.document = fields.requireString("document");
    request.slug = fields.requireString("slug");
    request.note = fields.requireString("note");
    return request;
}

CoordinatorRequest CoordinatorRequest::FromJson(const json& body, bool requireNote) {
    CoordinatorRequest request;
    if (body.is_null() && !requireNote) return request;
    RequestFields fields(body, {"note"});
    request.note = requireNote ? fields.requireString("note") : fields.optionalString("note").value_or("");
    return request;
}

} // namespace sectionvault::application
