#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace psyche::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path FromEnv(const char* variable, const char* homeSuffix) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeSuffix;
    }
    return fs::current_path(); // Fallback
}

fs::path EnsureDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[PathUtils] Could not create " << dir << ": " << ec.message() << std::endl;
    }
    return dir;
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return FromEnv("XDG_DATA_HOME", ".local/share");
}

fs::path PathUtils::GetConfigHome() {
    return FromEnv("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetRuntimeDir() {
    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    if (runtime && *runtime) {
        return fs::path(runtime);
    }
    return GetDataHome();
}

fs::path PathUtils::GetMemoryDir() {
    return EnsureDir(GetDataHome() / "psyche" / "memory");
}

fs::path PathUtils::GetSocketPath() {
    return EnsureDir(GetRuntimeDir() / "psyche") / "psyche.sock";
}

fs::path PathUtils::GetDefaultConfigPath() {
    return GetConfigHome() / "psyche" / "config.json";
}

} // namespace psyche::infrastructure
