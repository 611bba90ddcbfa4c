/**
 * @file ToolRequests.hpp
 * @brief Typed tool requests decoded and validated from JSON bodies.
 *
 * Decoding rejects unknown fields, missing required fields and wrong types
 * with AddressingError (INVALID_PARAMETER / MISSING_PARAMETER) before any
 * service is called.
 */

#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/DocumentService.hpp"
#include "domain/TaskRecord.hpp"

namespace sectionvault::application {

/**
 * @class RequestFields
 * @brief Checked access to the fields of one JSON request object.
 */
class RequestFields {
public:
    RequestFields(const nlohmann::json& body, std::initializer_list<const char*> allowed);

    std::string requireString(const char* key) const;
    std::optional<std::string> optionalString(const char* key) const;
    std::optional<int> optionalInt(const char* key) const;
    std::optional<bool> optionalBool(const char* key) const;
    bool has(const char* key) const;
    const nlohmann::json& raw(const char* key) const;

private:
    const nlohmann::json& m_body;
};

struct DocumentRequest {
    std::string document;
    static DocumentRequest FromJson(const nlohmann::json& body);
};

struct ViewSectionRequest {
    std::string address;   ///< "/doc.md#slug"
    static ViewSectionRequest FromJson(const nlohmann::json& body);
};

struct SectionRequest {
    std::vector<SectionEdit> edits;
    bool batch = false;    ///< Body carried an "operations" array.
    static SectionRequest FromJson(const nlohmann::json& body);
};

struct CreateDocumentRequest {
    std::string document;
    std::string title;
    std::string overview;
    static CreateDocumentRequest FromJson(const nlohmann::json& body);
};

struct MoveDocumentRequest {
    std::string from;
    std::string to;
    static MoveDocumentRequest FromJson(const nlohmann::json& body);
};

struct ListDocumentsRequest {
    std::string folder = "/";
    static ListDocumentsRequest FromJson(const nlohmann::json& body);
};

struct ArchiveRequest {
    std::optional<std::string> document;
    std::optional<std::string> folder;
    std::optional<bool> audit;
    std::string note;
    static ArchiveRequest FromJson(const nlohmann::json& body);
};

enum class TaskOperation { List, Create, Start };

struct TaskRequest {
    std::string document;
    TaskOperation operation = TaskOperation::List;
    std::optional<domain::TaskStatus> status;   ///< List filter.
    std::string title;
    std::string content;
    std::optional<std::string> slug;            ///< Start target / create anchor.
    static TaskRequest FromJson(const nlohmann::json& body);
};

struct ViewTaskRequest {
    std::string document;
    std::vector<std::string> tasks;   ///< "task" given as one slug or an array of slugs.
    static ViewTaskRequest FromJson(const nlohmann::json& body);
};

struct CompleteTaskRequest {
    std::string document;
    std::string slug;
    std::string note;
    static CompleteTaskRequest FromJson(const nlohmann::json& body);
};

struct CoordinatorRequest {
    std::string note;      ///< Required when completing.
    static CoordinatorRequest FromJson(const nlohmann::json& body, bool requireNote);
};

} // namespace sectionvault::application
