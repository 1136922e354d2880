// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace psyche::infrastructure {

/** @brief XDG base-directory lookups. */
class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetRuntimeDir();

    /** @brief `<data home>/psyche/memory`, created on demand. */
    static std::filesystem::path GetMemoryDir();
    static std::filesystem::path GetSocketPath();
    static std::filesystem::path GetDefaultConfigPath();
};

} // namespace psyche::infrastructure
