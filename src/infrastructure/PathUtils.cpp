#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace odsmanager::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetDefaultsDir() {
    // Not created here: a missing directory just means no named defaults.
    return GetDataHome() / "OdsManager" / "defaults";
}

fs::path PathUtils::GetSettingsPath() {
    return GetConfigHome() / "OdsManager" / "settings.json";
}

} // namespace odsmanager::infrastructure
