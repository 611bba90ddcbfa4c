/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the server configuration (settings.json).
 *
 * Resolution order, later entries win:
 * defaults, $XDG_CONFIG_HOME/SectionVault/settings.json,
 * SECTIONVAULT_WORKSPACE, <workspace>/settings.json,
 * SECTIONVAULT_HOST / SECTIONVAULT_PORT.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sectionvault::infrastructure {

struct ServerConfig {
    std::filesystem::path workspaceRoot;
    std::string host = "127.0.0.1";
    int port = 8765;
    bool auditArchives = true;              ///< Write a .audit sidecar next to archived documents.
    std::string archivedBy = "sectionvault";
};

class ConfigLoader {
public:
    /**
     * @brief Builds the effective configuration.
     * @param workspaceOverride Workspace given on the command line, if any.
     */
    static ServerConfig Load(const std::optional<std::string>& workspaceOverride = std::nullopt);

    /**
     * @brief Applies the keys present in a settings.json file on top of @p base.
     * Unreadable files are reported on stderr and leave @p base unchanged.
     */
    static ServerConfig ApplyFile(const std::filesystem::path& settingsPath, ServerConfig base);
};

} // namespace sectionvault::infrastructure
