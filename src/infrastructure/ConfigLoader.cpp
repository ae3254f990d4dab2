/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace logoscout::infrastructure {

namespace {

template <typename T>
void ReadField(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

void ReadTimeout(const nlohmann::json& j, const char* key, int& out) {
    int value = out;
    ReadField(j, key, value);
    if (value <= 0) {
        std::cerr << "[ConfigLoader] Ignoring non-positive timeout '" << key << "'" << std::endl;
        return;
    }
    out = value;
}

} // namespace

AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig config;
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings root is not an object, using defaults" << std::endl;
        return config;
    }

    ReadField(j, "user_agent", config.userAgent);
    ReadField(j, "search_user_agent", config.searchUserAgent);

    std::string assetsDir;
    ReadField(j, "assets_dir", assetsDir);
    if (!assetsDir.empty()) {
        config.assetsDir = assetsDir;
    }

    if (j.contains("live_search") && j["live_search"].is_object()) {
        const auto& live = j["live_search"];
        ReadField(live, "enabled", config.liveSearchEnabled);
        ReadTimeout(live, "timeout_ms", config.liveSearchTimeoutMs);
    }

    if (j.contains("timeouts") && j["timeouts"].is_object()) {
        const auto& timeouts = j["timeouts"];
        ReadTimeout(timeouts, "source_ms", config.sourceTimeoutMs);
        ReadTimeout(timeouts, "favicon_probe_ms", config.faviconProbeTimeoutMs);
    }

    if (j.contains("endpoints") && j["endpoints"].is_object()) {
        const auto& endpoints = j["endpoints"];
        ReadField(endpoints, "logo_api", config.endpoints.logoApi);
        ReadField(endpoints, "favicon_service", config.endpoints.faviconService);
        ReadField(endpoints, "instant_answer", config.endpoints.instantAnswer);
        ReadField(endpoints, "instant_answer_origin", config.endpoints.instantAnswerOrigin);
        ReadField(endpoints, "html_search", config.endpoints.htmlSearch);
    }

    return config;
}

nlohmann::json ConfigLoader::ToJson(const AppConfig& config) {
    return {
        {"user_agent", config.userAgent},
        {"search_user_agent", config.searchUserAgent},
        {"assets_dir", config.assetsDir.string()},
        {"live_search", {
            {"enabled", config.liveSearchEnabled},
            {"timeout_ms", config.liveSearchTimeoutMs}
        }},
        {"timeouts", {
            {"source_ms", config.sourceTimeoutMs},
            {"favicon_probe_ms", config.faviconProbeTimeoutMs}
        }},
        {"endpoints", {
            {"logo_api", config.endpoints.logoApi},
            {"favicon_service", config.endpoints.faviconService},
            {"instant_answer", config.endpoints.instantAnswer},
            {"instant_answer_origin", config.endpoints.instantAnswerOrigin},
            {"html_search", config.endpoints.htmlSearch}
        }}
    };
}

AppConfig ConfigLoader::Load(const std::filesystem::path& settingsPath) {
    AppConfig config;

    if (std::filesystem::exists(settingsPath)) {
        try {
            std::ifstream f(settingsPath);
            nlohmann::json j;
            f >> j;
            config = FromJson(j);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << settingsPath.string() << ": " << e.what() << std::endl;
        }
    }

    const char* envAssets = std::getenv("LOGOSCOUT_ASSETS_DIR");
    if ((envAssets && *envAssets) || config.assetsDir.empty()) {
        config.assetsDir = PathUtils::GetDefaultAssetsDir();
    }
    return config;
}

bool ConfigLoader::Save(const std::filesystem::path& settingsPath, const AppConfig& config) {
    nlohmann::json j = nlohmann::json::object();

    // Keep keys we do not know about.
    if (std::filesystem::exists(settingsPath)) {
        try {
            std::ifstream f(settingsPath);
            f >> j;
            if (!j.is_object()) {
                j = nlohmann::json::object();
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << settingsPath.string() << ": " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j.update(ToJson(config));

    try {
        if (settingsPath.has_parent_path()) {
            std::filesystem::create_directories(settingsPath.parent_path());
        }
        std::ofstream f(settingsPath);
        f << j.dump(4);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << settingsPath.string() << ": " << e.what() << std::endl;
    }
    return false;
}

} // namespace logoscout::infrastructure
