/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving LogoScout configuration (settings.json).
 *
 * Every key is optional. Missing or malformed values fall back to defaults and
 * are reported on stderr; a broken settings file never prevents startup.
 */

#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace logoscout::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective configuration after defaults, file and environment are merged.
 */
struct AppConfig {
    std::string userAgent = "LogoScout/1.0";
    std::string searchUserAgent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/120.0.0.0 Safari/537.36";
    std::filesystem::path assetsDir;

    bool liveSearchEnabled = true;
    int liveSearchTimeoutMs = 5000;
    int sourceTimeoutMs = 10000;
    int faviconProbeTimeoutMs = 8000;

    struct Endpoints {
        std::string logoApi = "https://logo.clearbit.com";
        std::string faviconService = "https://www.google.com/s2/favicons";
        std::string instantAnswer = "https://api.duckduckgo.com/";
        std::string instantAnswerOrigin = "https://duckduckgo.com";
        std::string htmlSearch = "https://html.duckduckgo.com/html/";
    } endpoints;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json, applies LOGOSCOUT_ASSETS_DIR, fills remaining defaults.
     * @param settingsPath File to read; a missing file is not an error.
     */
    static AppConfig Load(const std::filesystem::path& settingsPath);

    /** @brief Overlays recognized keys of @p j onto the defaults. */
    static AppConfig FromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const AppConfig& config);

    /**
     * @brief Saves the configuration, preserving unrelated keys already in the file.
     * @return false if the file could not be written.
     */
    static bool Save(const std::filesystem::path& settingsPath, const AppConfig& config);
};

} // namespace logoscout::infrastructure
