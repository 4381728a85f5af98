#include "commands/commands_core.hpp"
#include "orchestrator/orchestrator.hpp"
#include "orchestrator/event_loop.hpp"
#include "follow/slide_store.hpp"
#include "net/sync_client.hpp"
#include "error_manager.hpp"
#include "bootstrap.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    AppOptions options;
    std::string argErr;
    if (!parseArgs(argc, argv, options, &argErr)) {
        std::cerr << argErr << "\n" << usageText();
        return 2;
    }
    if (options.showUsage) {
        std::cout << usageText();
        return 0;
    }

    // Initialize logger (writes to slidefollow.log + stderr)
    initLogger(LOG_FILE);
    LOG_PHASE("Startup begin", true);

    // Bootstrap configuration and error table
    runBootstrapChecks(options);
    LOG_PHASE("Bootstrap checks complete", true);

    // ============================================================
    // Core wiring
    // ============================================================
    App::EventLoop loop;
    App::Orchestrator orchestrator(loop,
                                   followSettingsFromConfig(appConfig),
                                   recognitionRetryFromConfig(appConfig));

    std::unique_ptr<Net::SyncClient> sync;
    Net::SyncConfig syncCfg = Net::syncConfigFromJson(appConfig.value("sync", nlohmann::json::object()));
    if (syncCfg.role != Net::SyncRole::Off) {
        sync = std::make_unique<Net::SyncClient>(syncCfg);
        sync->setOnLiveSlide([&loop, &orchestrator](const std::string& slideId) {
            loop.post([&orchestrator, slideId]() {
                if (!orchestrator.selectSlide(slideId, true)) {
                    LOG_DEBUG("Sync", "Remote slide not in local snapshot: " + slideId);
                }
            });
        });
    }

    App::OrchestratorHooks hooks;
    hooks.onLiveSlide = [](const std::string& slideId,
                           const std::optional<Follow::MatchResult>& match) {
        if (match) {
            std::cout << "\n[Live] " << slideId << "  (" << Follow::toString(match->reason)
                      << ", " << match->score << ")" << std::endl;
        } else {
            std::cout << "\n[Live] " << slideId << std::endl;
        }
    };
    hooks.onInterim = [](const std::string& combined) {
        std::cout << "\r[...] " << combined << std::flush;
    };
    hooks.onNotice = [](const CommandResult& notice) {
        (notice.success ? std::cout : std::cerr) << "\n" << notice.message << std::endl;
    };
    if (sync) {
        Net::SyncClient* client = sync.get();
        hooks.publish = [client](const std::string& slideId) {
            if (!client->publishLiveSlide(slideId)) {
                LOG_TRACE("Sync", "Live slide not published: " + slideId);
            }
        };
    }
    orchestrator.setHooks(std::move(hooks));
    orchestrator.attachBackend(makeRecognitionBackend(appConfig));

    // Slides from --slides or config
    std::string slidesFile = options.slidesFile.empty()
        ? appConfig.value("slides_file", std::string())
        : options.slidesFile;
    if (!slidesFile.empty()) {
        std::vector<Follow::Slide> slides;
        std::string err;
        if (Follow::loadSlidesFromFile(slidesFile, slides, &err)) {
            orchestrator.setSlides(std::move(slides));
            LOG_PHASE("Slides loaded", true);
        } else {
            std::cerr << ErrorManager::report("ERR_SLIDES_LOAD", err).message << std::endl;
            LOG_PHASE("Slides loaded", false);
        }
    }

    loop.start();

    if (sync) {
        std::string err;
        if (!sync->connect(&err)) {
            std::cerr << ErrorManager::report("ERR_SYNC_CONNECT", err).message << std::endl;
        }
    }

    g_commandContext.orchestrator = &orchestrator;
    g_commandContext.sync = sync.get();

    LOG_PHASE("Startup complete, entering main loop", true);

    // ============================================================
    // Console REPL loop
    // ============================================================
    std::cout << "slidefollow ready. Type 'help' for commands." << std::endl;
    std::string line;
    while (!g_commandContext.quitRequested) {
        std::cout << "> "; // REPL prompt
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        if (line.empty()) {
            continue;
        }

        if (line == "exit") {
            LOG_PHASE("Shutdown requested", true);
            break;
        }

        LOG_TRACE("Console", "Dispatching command: " + line);
        handleCommand(line);
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    g_commandContext = CommandContext{};
    orchestrator.stopRecognition();
    if (sync) sync->disconnect();
    loop.stop();
    LOG_PHASE("Shutdown complete", true);

    // 🔹 Close logger
    shutdownLogger();
    return 0;
}
