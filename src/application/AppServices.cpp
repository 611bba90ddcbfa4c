#include "application/AppServices.hpp"

#include <filesystem>

namespace sectionvault::application {

std::unique_ptr<AppServices> CreateAppServices(const infrastructure::ServerConfig& config,
                                               RelocationMode relocation) {
    std::filesystem::create_directories(config.workspaceRoot);

    auto services = std::make_unique<AppServices>();
    services->config = config;
    services->guard = std::make_shared<infrastructure::ConcurrencyGuard>(config.workspaceRoot);
    services->cache = std::make_shared<infrastructure::DocumentCache>(services->guard);
    services->archiveManager = std::make_shared<ArchiveManager>(services->guard, services->cache,
                                                                config.archivedBy, relocation);
    services->documentService = std::make_unique<DocumentService>(services->guard, services->cache);
    services->taskEngine = std::make_unique<TaskEngine>(services->guard, services->cache,
                                                        services->archiveManager, config.auditArchives);
    return services;
}

} // namespace sectionvault::application
