#pragma once
#include <string>
#include <memory>
#include <nlohmann/json_fwd.hpp>

#include "resources.hpp"
#include "follow/follow_settings.hpp"
#include "voice/recognition_backend.hpp"
#include "net/reconnect_policy.hpp"

struct AppOptions {
    std::string configPath = CONFIG_FILE;
    std::string slidesFile;        // overrides slides_file from config
    std::string logLevel;          // overrides logging.level
    bool quiet = false;            // no log echo on stderr
    bool showUsage = false;
};

// --config <file> --slides <file> --log-level <lvl> --quiet --help
bool parseArgs(int argc, char** argv, AppOptions& out, std::string* err = nullptr);
std::string usageText();

// Config + error table + log verbosity
void runBootstrapChecks(const AppOptions& options);

// ------------------------------------------------------------
// Typed views of appConfig
// ------------------------------------------------------------

// Out of range → ERR_CONFIG_RANGE reported and defaults returned
Follow::FollowSettings followSettingsFromConfig(const nlohmann::json& config);

Net::ReconnectPolicy recognitionRetryFromConfig(const nlohmann::json& config);

// "cloud" (default) or "whisper"
std::shared_ptr<Voice::RecognitionBackend> makeRecognitionBackend(const nlohmann::json& config);
