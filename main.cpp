#include <csignal>
#include <iostream>
#include <optional>
#include <string>

#include "application/AppServices.hpp"
#include "application/ToolDispatcher.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "app/ToolHttpServer.hpp"

using namespace sectionvault;

namespace {

app::ToolHttpServer* g_server = nullptr;

void HandleSignal(int) {
    if (g_server) {
        g_server->stop();
    }
}

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--workspace <dir>] [--port <n>] [--recover]\n"
              << "  --workspace  Root folder of the markdown workspace\n"
              << "  --port       HTTP port (default 8765)\n"
              << "  --recover    Settle interrupted archive moves before serving\n";
}

} // namespace

int main(int argc, char** argv) {
    std::optional<std::string> workspace;
    std::optional<int> port;
    bool recover = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--workspace" && i + 1 < argc) {
            workspace = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception& e) {
                std::cerr << "Invalid port: " << argv[i] << " (" << e.what() << ")" << std::endl;
                return 2;
            }
        } else if (arg == "--recover") {
            recover = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            PrintUsage(argv[0]);
            return 2;
        }
    }

    infrastructure::ServerConfig config = infrastructure::ConfigLoader::Load(workspace);
    if (port) {
        config.port = *port;
    }

    std::unique_ptr<application::AppServices> services;
    try {
        services = application::CreateAppServices(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to open workspace " << config.workspaceRoot << ": " << e.what() << std::endl;
        return 1;
    }
    std::cout << "SectionVault workspace: " << config.workspaceRoot << std::endl;

    if (recover) {
        try {
            auto actions = services->archiveManager->recoverInterrupted();
            std::cout << "Recovered " << actions.size() << " interrupted archive move(s)" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Archive recovery failed: " << e.what() << std::endl;
            return 1;
        }
    }

    application::ToolDispatcher dispatcher(*services);
    app::ToolHttpServer server(dispatcher);
    g_server = &server;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (!server.listen(config.host, config.port)) {
        std::cerr << "Could not listen on " << config.host << ":" << config.port << std::endl;
        return 1;
    }
    g_server = nullptr;
    return 0;
}
