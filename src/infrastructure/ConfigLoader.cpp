/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace sectionvault::infrastructure {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace

ServerConfig ConfigLoader::Load(const std::optional<std::string>& workspaceOverride) {
    ServerConfig config;
    config.workspaceRoot = PathUtils::GetDefaultWorkspace();

    config = ApplyFile(PathUtils::GetConfigHome() / "SectionVault" / "settings.json", config);

    if (auto workspace = GetEnv("SECTIONVAULT_WORKSPACE")) {
        config.workspaceRoot = *workspace;
    }
    if (workspaceOverride && !workspaceOverride->empty()) {
        config.workspaceRoot = *workspaceOverride;
    }

    config = ApplyFile(config.workspaceRoot / "settings.json", config);

    if (auto host = GetEnv("SECTIONVAULT_HOST")) {
        config.host = *host;
    }
    if (auto port = GetEnv("SECTIONVAULT_PORT")) {
        try {
            config.port = std::stoi(*port);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Ignoring invalid SECTIONVAULT_PORT '" << *port << "': " << e.what() << std::endl;
        }
    }

    return config;
}

ServerConfig ConfigLoader::ApplyFile(const fs::path& settingsPath, ServerConfig base) {
    if (!fs::exists(settingsPath)) {
        return base;
    }

    try {
        std::ifstream f(settingsPath);
        nlohmann::json j;
        f >> j;

        ServerConfig config = base;
        if (j.contains("workspace_root")) {
            config.workspaceRoot = j["workspace_root"].get<std::string>();
        }
        if (j.contains("host")) {
            config.host = j["host"].get<std::string>();
        }
        if (j.contains("port")) {
            config.port = j["port"].get<int>();
        }
        if (j.contains("audit_archives")) {
            config.auditArchives = j["audit_archives"].get<bool>();
        }
        if (j.contains("archived_by")) {
            config.archivedBy = j["archived_by"].get<std::string>();
        }
        return config;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
    }

    return base;
}

} // namespace sectionvault::infrastructure
