// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace odsmanager::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_DATA_HOME/OdsManager/defaults, home of "$name" defaults files. */
    static std::filesystem::path GetDefaultsDir();

    /** @brief $XDG_CONFIG_HOME/OdsManager/settings.json */
    static std::filesystem::path GetSettingsPath();
};

} // namespace odsmanager::infrastructure
