#include "commands_core.hpp"
#include "error_manager.hpp"
#include "orchestrator/orchestrator.hpp"
#include "follow/slide_store.hpp"
#include "follow/schedule_matcher.hpp"
#include "net/sync_client.hpp"
#include "logger.hpp"

#include <sstream>

// ------------------------------------------------------------
// Internal helpers
// ------------------------------------------------------------
namespace {
    App::Orchestrator* orchestrator() {
        return g_commandContext.orchestrator;
    }

    CommandResult notReady() {
        return ErrorManager::report("ERR_CORE_NOT_READY");
    }

    CommandResult ok(const std::string& message) {
        return { message, true, "ERR_NONE" };
    }

    std::string preview(const std::string& text, size_t width = 48) {
        std::string flat = text;
        for (char& c : flat) {
            if (c == '\n' || c == '\r' || c == '\t') c = ' ';
        }
        if (flat.size() > width) flat = flat.substr(0, width - 3) + "...";
        return flat;
    }

    std::string liveLine(const App::Orchestrator& o) {
        auto live = o.liveSlideId();
        return live ? *live : std::string("(none)");
    }
}

// ------------------------------------------------------------
// [Recognition] start / stop / status
// ------------------------------------------------------------
CommandResult cmdStart([[maybe_unused]] const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    std::string err;
    if (!o->startRecognition(&err)) {
        return ErrorManager::report("ERR_RECOGNITION_START", err);
    }
    return ok("[Recognition] Starting...");
}

CommandResult cmdStop([[maybe_unused]] const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    o->stopRecognition();
    return ok("[Recognition] Stopped.");
}

CommandResult cmdStatus([[maybe_unused]] const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    auto s = o->status();
    std::ostringstream out;
    out << "[Status]\n"
        << "  live slide:   " << (s.liveSlideId ? *s.liveSlideId : "(none)") << "\n"
        << "  slides:       " << s.slideCount << "\n"
        << "  follow:       " << (s.followEnabled ? "enabled" : "disabled")
                              << (s.allowMatch ? "" : " (paused)") << "\n"
        << "  window words: " << s.windowWords << "\n"
        << "  recognition:  " << Voice::toString(s.recognition);
    if (s.retryAttempt > 0) out << " (retry " << s.retryAttempt << ")";
    out << "\n";

    if (auto* sync = g_commandContext.sync) {
        out << "  sync:         " << Net::toString(sync->config().role) << ", "
            << (sync->isConnected() ? "connected" : "disconnected") << "\n";
    } else {
        out << "  sync:         off\n";
    }
    return ok(out.str());
}

// ------------------------------------------------------------
// [Slides] load / list / navigate
// ------------------------------------------------------------
CommandResult cmdSlides(const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    if (!arg.empty()) {
        std::vector<Follow::Slide> loaded;
        std::string err;
        if (!Follow::loadSlidesFromFile(arg, loaded, &err)) {
            return ErrorManager::report("ERR_SLIDES_LOAD", err);
        }
        o->setSlides(std::move(loaded));
    }

    auto slides = o->slides();
    if (slides.empty()) return ok("[Slides] No slides loaded. Usage: slides <file.json>");

    auto live = o->liveSlideId();
    std::ostringstream out;
    out << "[Slides] " << slides.size() << " slides\n";
    for (const auto& s : slides) {
        bool isLive = live && *live == s.id;
        out << (isLive ? " > " : "   ") << s.id << "  "
            << (Follow::isEligible(s) ? preview(s.text) : std::string("(empty)")) << "\n";
    }
    return ok(out.str());
}

CommandResult cmdGoto(const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    if (arg.empty()) return ErrorManager::report("ERR_SLIDE_MISSING_ID");
    if (!o->selectSlide(arg)) return ErrorManager::report("ERR_SLIDE_NOT_FOUND", arg);
    return ok("[Slides] Live: " + arg);
}

CommandResult cmdNext([[maybe_unused]] const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    if (!o->step(+1)) return ok("[Slides] Already at the last slide (" + liveLine(*o) + ")");
    return ok("[Slides] Live: " + liveLine(*o));
}

CommandResult cmdPrev([[maybe_unused]] const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    if (!o->step(-1)) return ok("[Slides] Already at the first slide (" + liveLine(*o) + ")");
    return ok("[Slides] Live: " + liveLine(*o));
}

CommandResult cmdSchedule(const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    if (arg.empty()) return ErrorManager::report("ERR_SCHEDULE_MISSING_FILE");

    std::vector<std::string> sessions;
    std::string err;
    if (!Follow::loadSessionTitlesFromFile(arg, sessions, &err)) {
        return ErrorManager::report("ERR_SCHEDULE_LOAD", err);
    }

    auto slides = o->slides();
    size_t aligned = 0;
    std::ostringstream body;
    for (const auto& s : slides) {
        if (!Follow::isEligible(s)) continue;
        auto idx = Follow::findMatchingSession(Follow::firstLine(s.text), sessions);
        body << "   " << s.id << "  -> " << (idx ? sessions[*idx] : std::string("(no session)")) << "\n";
        if (idx) ++aligned;
    }

    std::ostringstream out;
    out << "[Schedule] " << aligned << " of " << slides.size() << " slides aligned with "
        << sessions.size() << " sessions\n" << body.str();
    return ok(out.str());
}

// ------------------------------------------------------------
// [Follow] pause / resume / reset / say
// ------------------------------------------------------------
CommandResult cmdPause([[maybe_unused]] const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    o->setAllowMatch(false);
    return ok("[Follow] Paused. Transcript is still collected.");
}

CommandResult cmdResume([[maybe_unused]] const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    o->setAllowMatch(true);
    return ok("[Follow] Resumed.");
}

CommandResult cmdReset([[maybe_unused]] const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    o->resetFollow();
    return ok("[Follow] State cleared.");
}

CommandResult cmdSay(const std::string& arg) {
    auto* o = orchestrator();
    if (!o) return notReady();

    if (arg.empty()) return ErrorManager::report("ERR_SAY_NO_TEXT");

    auto match = o->submitFinalTranscript(arg);
    if (!match) return ok("[Follow] No change (live: " + liveLine(*o) + ")");

    std::ostringstream out;
    out << "[Follow] Live: " << match->slideId << " ("
        << Follow::toString(match->reason) << ", score " << match->score << ")";
    return ok(out.str());
}

// ------------------------------------------------------------
// [Interface] help / quit
// ------------------------------------------------------------
CommandResult cmdShowHelp([[maybe_unused]] const std::string& arg) {
    std::string helpText =
        "[Help] Available commands:\n"
        "- start            start speech recognition\n"
        "- stop             stop speech recognition\n"
        "- status\n"
        "- slides [file]    load and/or list slides\n"
        "- goto <id>\n"
        "- next\n"
        "- prev\n"
        "- schedule <file>  align slides with an event schedule\n"
        "- pause            keep listening, stop advancing\n"
        "- resume\n"
        "- reset            forget live slide, cooldown and transcript\n"
        "- say <text>       feed text as if it was spoken\n"
        "- help\n"
        "- quit\n";

    return ok(helpText);
}

CommandResult cmdQuit([[maybe_unused]] const std::string& arg) {
    g_commandContext.quitRequested = true;
    return ok("[Exit] Bye.");
}
