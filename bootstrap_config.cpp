#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <fstream>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
namespace bootstrap_config {

bool mergeDefaults(nlohmann::json& cfg,
                   const nlohmann::json& defs,
                   int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (defVal.is_number() && cfg[key].is_number()) {
            // 1 and 1.0 are both fine; range checks happen in the section readers
        } else if (cfg[key].type() != defVal.type()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultConfig() {
    return {
        {"logging", {
            {"level", "debug"},
            {"echo", true}
        }},

        {"follow", {
            {"enabled", true},
            {"match_threshold", 0.55},
            {"end_trigger_threshold", 0.8},
            {"end_trigger_tail_words", 4},
            {"enable_end_advance", true},
            {"min_words", 3},
            {"cooldown_ms", 2500},
            {"max_lookahead", 2},
            {"transcript_window_words", 60}
        }},

        {"recognition", {
            {"backend", "cloud"},
            {"api_key", ""},
            {"token_url", "https://api.assemblyai.com/v2/realtime/token"},
            {"streaming_url", "wss://api.assemblyai.com/v2/realtime/ws"},
            {"sample_rate", 16000},
            {"token_expires_in", 3600},
            {"connect_timeout_ms", 10000},
            {"await_session_begins", true},
            {"reconnect", {
                {"enabled", false},
                {"max_attempts", 5},
                {"base_delay_ms", 1000},
                {"max_delay_ms", 30000}
            }},
            {"whisper", {
                {"model", "ggml-base.en.bin"},
                {"language", "en"},
                {"max_tokens", 32},
                {"silence_threshold", 0.02},
                {"silence_timeout_ms", 1200},
                {"max_utterance_ms", 30000}
            }}
        }},

        {"audio", {
            {"input_device_index", -1},
            {"capture_sample_rate", 48000},
            {"capture_channels", 1},
            {"frames_per_buffer", 4096},
            {"max_pending_frames", 32}
        }},

        {"sync", {
            {"mode", "off"},
            {"host", "127.0.0.1"},
            {"port", 9877},
            {"client_id", ""},
            {"reconnect", {
                {"enabled", true},
                {"max_attempts", 10},
                {"base_delay_ms", 1000},
                {"max_delay_ms", 30000}
            }}
        }},

        {"slides_file", ""}
    };
}

nlohmann::json defaultErrors() {
    return {
        // --- Recognition session ---
        {"ERR_MIC_PERMISSION", {
            {"user", "[Mic] Microphone unavailable or access denied."},
            {"debug", "Audio source failed to open or start the input stream."}
        }},
        {"ERR_AUTH_TOKEN", {
            {"user", "[Auth] Could not obtain a recognition token. Check recognition.api_key."},
            {"debug", "Token endpoint failed, returned no token, or no API key configured."}
        }},
        {"ERR_AUTH_REJECTED", {
            {"user", "[Auth] Recognition service rejected the credentials."},
            {"debug", "HTTP 401/403 on token fetch, or auth close code / error from the stream."}
        }},
        {"ERR_CONN_TIMEOUT", {
            {"user", "[Net] Recognition service did not answer in time."},
            {"debug", "Token request or session handshake exceeded connect_timeout_ms."}
        }},
        {"ERR_CONN_CLOSED", {
            {"user", "[Net] Connection to the recognition service was lost."},
            {"debug", "Streaming socket closed or errored outside of stop()."}
        }},
        {"ERR_PROTOCOL_MALFORMED", {
            {"user", "[Net] Ignored an unreadable message from the recognition service."},
            {"debug", "Server event failed to parse or had an unknown message_type."}
        }},
        {"ERR_WHISPER_MODEL", {
            {"user", "[Whisper] Local speech model could not be loaded."},
            {"debug", "Model file missing under resources/models or whisper_init failed."}
        }},
        {"ERR_RECOGNITION_START", {
            {"user", "[Recognition] Could not start."},
            {"debug", "startRecognition refused (no backend or already running)."}
        }},

        // --- Configuration ---
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] slidefollow_config.json invalid → reset to defaults."},
            {"debug", "Config file failed JSON parsing."}
        }},
        {"ERR_CONFIG_RANGE", {
            {"user", "[Config] Follow settings out of range → using defaults."},
            {"debug", "validateFollowSettings rejected the follow section."}
        }},

        // --- Slides ---
        {"ERR_SLIDES_LOAD", {
            {"user", "[Slides] Could not load slides."},
            {"debug", "Slide snapshot missing, unreadable, or has bad/duplicate ids."}
        }},
        {"ERR_SLIDE_MISSING_ID", {
            {"user", "[Slides] Usage: goto <slide id>"},
            {"debug", "goto called without argument."}
        }},
        {"ERR_SLIDE_NOT_FOUND", {
            {"user", "[Slides] No slide with that id."},
            {"debug", "selectSlide id not present in current snapshot."}
        }},

        // --- Schedule ---
        {"ERR_SCHEDULE_MISSING_FILE", {
            {"user", "[Schedule] Usage: schedule <file.json>"},
            {"debug", "schedule called without argument."}
        }},
        {"ERR_SCHEDULE_LOAD", {
            {"user", "[Schedule] Could not load the schedule."},
            {"debug", "Schedule file missing, unreadable, or an entry has no title."}
        }},

        // --- Sync ---
        {"ERR_SYNC_CONNECT", {
            {"user", "[Sync] Sync is not available."},
            {"debug", "SyncClient::connect refused the configured address or role."}
        }},

        // --- Commands ---
        {"ERR_SAY_NO_TEXT", {
            {"user", "[Follow] Usage: say <text>"},
            {"debug", "say called without argument."}
        }},
        {"ERR_CORE_NOT_READY", {
            {"user", "[Core] Not ready yet."},
            {"debug", "Command ran before the orchestrator was attached."}
        }},
        {"ERR_CORE_UNKNOWN_COMMAND", {
            {"user", "[Core] Unknown command"},
            {"debug", "No handler in commandMap after fuzzy match."}
        }},
        {"ERR_CMD_EXCEPTION", {
            {"user", "[Error] Exception while running command."},
            {"debug", "Command handler threw."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            std::ofstream(path) << outConfig.dump(2);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + e.what() + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode, e.what());

        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);
        return false;
    }
}

// ----------------- entry -----------------
void initAll(const fs::path& configPath) {
    // errors.json first so config failures can be reported
    fs::path errPath = fs::path(getResourcePath()) / "errors.json";
    nlohmann::json errorsCfg;
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config", "");
    ErrorManager::loadFromJson(errorsCfg);

    // slidefollow_config.json
    loadConfig(configPath, defaultConfig(), appConfig, "App config", "ERR_CONFIG_INVALID");
}

} // namespace bootstrap_config
