#include "app/ToolHttpServer.hpp"

#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>

namespace sectionvault::app {

using json = nlohmann::json;

ToolHttpServer::ToolHttpServer(application::ToolDispatcher& dispatcher)
    : m_dispatcher(dispatcher), m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

ToolHttpServer::~ToolHttpServer() {
    stop();
}

void ToolHttpServer::registerRoutes() {
    m_server->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        json body = {{"status", "ok"}, {"tools", m_dispatcher.toolNames()}};
        res.set_content(body.dump(), "application/json");
    });

    m_server->Post(R"(/tools/([a-z_]+))", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string tool = req.matches[1];
        application::ToolResponse response = m_dispatcher.handle(tool, req.body);
        if (response.status >= 500) {
            std::cerr << "[ToolHttpServer] " << tool << " -> " << response.status << std::endl;
        }
        res.status = response.status;
        res.set_content(response.serialize(), "application/json");
    });
}

bool ToolHttpServer::listen(const std::string& host, int port) {
    std::cout << "[ToolHttpServer] Listening on http://" << host << ":" << port << std::endl;
    return m_server->listen(host, port);
}

void ToolHttpServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

} // namespace sectionvault::app
