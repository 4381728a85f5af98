#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "audio/portaudio_source.hpp"
#include "voice/recognition_session.hpp"
#include "voice/whisper_session.hpp"
#include "voice/token_provider.hpp"
#include "voice/ix_transport.hpp"

#include <algorithm>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

// ============================================================
// Command line
// ============================================================
std::string usageText() {
    return
        "Usage: slidefollow [options]\n"
        "  --config <file>      config file (default slidefollow_config.json)\n"
        "  --slides <file>      slide snapshot to load at startup\n"
        "  --log-level <level>  trace | debug | error | off\n"
        "  --quiet              do not mirror the log on stderr\n"
        "  --help\n";
}

bool parseArgs(int argc, char** argv, AppOptions& out, std::string* err) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto needValue = [&](const std::string& flag, std::string& dst) {
            if (i + 1 >= argc) {
                if (err) *err = flag + " needs a value";
                return false;
            }
            dst = argv[++i];
            return true;
        };

        if (a == "--config") {
            if (!needValue(a, out.configPath)) return false;
        } else if (a == "--slides") {
            if (!needValue(a, out.slidesFile)) return false;
        } else if (a == "--log-level") {
            if (!needValue(a, out.logLevel)) return false;
        } else if (a == "--quiet") {
            out.quiet = true;
        } else if (a == "--help" || a == "-h") {
            out.showUsage = true;
        } else {
            if (err) *err = "Unknown option: " + a;
            return false;
        }
    }
    return true;
}

// ============================================================
// Bootstrap
// ============================================================
void runBootstrapChecks(const AppOptions& options) {
    LOG_PHASE("Bootstrap begin", true);

    // ============================================================
    // Centralized config bootstrap
    // ============================================================
    beginPhaseGroup();
    bootstrap_config::initAll(options.configPath);
    endPhaseGroup();
    LOG_PHASE("Configs initialized", true);

    // ============================================================
    // Logging verbosity (command line wins over config)
    // ============================================================
    const auto& logging = appConfig["logging"];
    std::string level = options.logLevel.empty() ? logging.value("level", std::string("debug"))
                                                 : options.logLevel;
    if (!setLogLevelByName(level)) {
        LOG_ERROR("Config", "Unknown log level '" + level + "', keeping default");
    }
    setLogEcho(!options.quiet && logging.value("echo", true));

    LOG_PHASE("Bootstrap complete", true);
}

// ============================================================
// Typed views
// ============================================================
Follow::FollowSettings followSettingsFromConfig(const nlohmann::json& config) {
    Follow::FollowSettings settings;
    if (!config.contains("follow")) return settings;

    std::string err;
    if (!Follow::followSettingsFromJson(config["follow"], settings, &err)) {
        ErrorManager::report("ERR_CONFIG_RANGE", err);
        return Follow::FollowSettings{};
    }
    return settings;
}

Net::ReconnectPolicy recognitionRetryFromConfig(const nlohmann::json& config) {
    Net::ReconnectPolicy defaults{ false, 5, 1000, 30000 };
    if (!config.contains("recognition") || !config["recognition"].contains("reconnect")) {
        return defaults;
    }
    return Net::reconnectPolicyFromJson(config["recognition"]["reconnect"], defaults);
}

std::shared_ptr<Voice::RecognitionBackend> makeRecognitionBackend(const nlohmann::json& config) {
    nlohmann::json recognition = config.value("recognition", nlohmann::json::object());
    Audio::CaptureFormat capture = Audio::captureFormatFromJson(
        config.value("audio", nlohmann::json::object()));

    std::string backend = recognition.value("backend", std::string("cloud"));

    if (backend == "whisper") {
        auto wcfg = Voice::whisperConfigFromJson(
            recognition.value("whisper", nlohmann::json::object()));
        fs::path modelPath = fs::path(getResourcePath()) / "models" / wcfg.model;

        LOG_DEBUG("Bootstrap", "Recognition backend: whisper (" + modelPath.string() + ")");
        return std::make_shared<Voice::WhisperSession>(
            wcfg, modelPath.string(), capture, std::make_unique<Audio::PortAudioSource>());
    }

    if (backend != "cloud") {
        LOG_ERROR("Bootstrap", "Unknown recognition backend '" + backend + "', using cloud");
    }

    auto streaming = Voice::streamingConfigFromJson(recognition);
    auto tokens = std::make_shared<Voice::HttpTokenProvider>(Voice::tokenConfigFromJson(recognition));
    int handshakeSecs = std::max(1, streaming.connectTimeoutMs / 1000);

    LOG_DEBUG("Bootstrap", "Recognition backend: cloud (" + streaming.streamingUrl + ")");
    return std::make_shared<Voice::RecognitionSession>(
        streaming, capture,
        std::make_unique<Audio::PortAudioSource>(),
        tokens,
        std::make_unique<Voice::IxTransport>(handshakeSecs));
}
