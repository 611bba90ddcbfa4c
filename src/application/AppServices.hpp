/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ArchiveManager.hpp"
#include "application/DocumentService.hpp"
#include "application/TaskEngine.hpp"
#include "infrastructure/ConcurrencyGuard.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DocumentCache.hpp"

namespace sectionvault::application {

struct AppServices {
    infrastructure::ServerConfig config;
    std::shared_ptr<infrastructure::ConcurrencyGuard> guard;
    std::shared_ptr<infrastructure::DocumentCache> cache;
    std::shared_ptr<ArchiveManager> archiveManager;
    std::unique_ptr<DocumentService> documentService;
    std::unique_ptr<TaskEngine> taskEngine;
};

/** @brief Wires every service on top of one workspace root. */
std::unique_ptr<AppServices> CreateAppServices(const infrastructure::ServerConfig& config,
                                               RelocationMode relocation = RelocationMode::RenameFirst);

} // namespace sectionvault::application
