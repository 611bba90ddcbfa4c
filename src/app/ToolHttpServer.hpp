/**
 * @file ToolHttpServer.hpp
 * @brief HTTP front end for the tool dispatcher (cpp-httplib).
 *
 * Routes:
 *   GET  /health          -> {"status": "ok", "tools": [...]}
 *   POST /tools/<name>    -> tool result or {"error": {...}}
 */

#pragma once

#include <memory>
#include <string>

#include "application/ToolDispatcher.hpp"

namespace httplib {
class Server;
}

namespace sectionvault::app {

class ToolHttpServer {
public:
    explicit ToolHttpServer(application::ToolDispatcher& dispatcher);
    ~ToolHttpServer();

    /// Blocks until stop() is called. Returns false if the socket could not be bound.
    bool listen(const std::string& host, int port);

    void stop();

private:
    void registerRoutes();

    application::ToolDispatcher& m_dispatcher;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace sectionvault::app
