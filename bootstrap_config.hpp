#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

// Centralized config + error table bootstrap for slidefollow
namespace bootstrap_config {

    // Load slidefollow_config.json and errors.json
    void initAll(const std::filesystem::path& configPath);

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Adds missing keys and replaces mistyped ones from defs.
    // Returns true if cfg changed.
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // Canonical defaults
    nlohmann::json defaultConfig();
    nlohmann::json defaultErrors();
}
