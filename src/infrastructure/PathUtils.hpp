// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace logoscout::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_CONFIG_HOME/logoscout/settings.json (or ~/.config/...). */
    static std::filesystem::path GetDefaultSettingsPath();

    /** @brief LOGOSCOUT_ASSETS_DIR if set, otherwise <cwd>/assets. */
    static std::filesystem::path GetDefaultAssetsDir();
};

} // namespace logoscout::infrastructure
