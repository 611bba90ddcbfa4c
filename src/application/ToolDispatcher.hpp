/**
 * @file ToolDispatcher.hpp
 * @brief Maps tool names and JSON bodies onto the services.
 */

#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/AppServices.hpp"

namespace sectionvault::application {

/// Path of the coordinator's sequential task list.
extern const char* const kCoordinatorDocument;

struct ToolResponse {
    int status = 200;
    nlohmann::json body;

    /// Pretty-printed body. Bytes that are not valid UTF-8 become U+FFFD.
    std::string serialize() const;
};

/**
 * @class ToolDispatcher
 * @brief Decodes a tool request, runs it and shapes the JSON response.
 *
 * Store errors become {"error": {type, code, message, context}} with an HTTP
 * status matching the error kind. Nothing is retried here; a conflict is
 * returned to the caller as 409.
 */
class ToolDispatcher {
public:
    explicit ToolDispatcher(AppServices& services);

    /// Runs a tool on an already parsed body. Throws domain::StoreError.
    nlohmann::json dispatch(const std::string& tool, const nlohmann::json& body);

    /// Parses @p rawBody, dispatches and converts failures into error responses.
    ToolResponse handle(const std::string& tool, const std::string& rawBody);

    std::vector<std::string> toolNames() const;

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    nlohmann::json viewDocument(const nlohmann::json& body);
    nlohmann::json viewSection(const nlohmann::json& body);
    nlohmann::json section(const nlohmann::json& body);
    nlohmann::json createDocument(const nlohmann::json& body);
    nlohmann::json deleteDocument(const nlohmann::json& body);
    nlohmann::json moveDocument(const nlohmann::json& body);
    nlohmann::json listDocuments(const nlohmann::json& body);
    nlohmann::json archiveDocument(const nlohmann::json& body);
    nlohmann::json recoverArchives(const nlohmann::json& body);
    nlohmann::json task(const nlohmann::json& body);
    nlohmann::json viewTask(const nlohmann::json& body);
    nlohmann::json taskSummary(const nlohmann::json& body);
    nlohmann::json completeTask(const nlohmann::json& body);
    nlohmann::json viewCoordinatorTask(const nlohmann::json& body);
    nlohmann::json startCoordinatorTask(const nlohmann::json& body);
    nlohmann::json completeCoordinatorTask(const nlohmann::json& body);

    AppServices& m_services;
    std::map<std::string, Handler> m_handlers;
};

} // namespace sectionvault::application
