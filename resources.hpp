#pragma once
#include <string>
#include <nlohmann/json_fwd.hpp>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* CONFIG_FILE = "slidefollow_config.json";
inline constexpr const char* LOG_FILE    = "slidefollow.log";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------
std::string getResourcePath();

// ------------------------------------------------------------
// Global app config (JSON container only)
// ------------------------------------------------------------
extern nlohmann::json appConfig;
