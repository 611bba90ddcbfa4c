// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace sectionvault::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetDefaultWorkspace();
};

} // namespace sectionvault::infrastructure
