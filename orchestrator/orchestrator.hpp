#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <atomic>

#include "event_loop.hpp"
#include "follow/follow_engine.hpp"
#include "voice/recognition_backend.hpp"
#include "net/reconnect_policy.hpp"
#include "commands/commands_core.hpp"

namespace App {

// Hooks run on whichever thread called into the Orchestrator
// (the event loop for recognition and sync traffic).
struct OrchestratorHooks {
    // New live slide. match is empty for manual or remote selection.
    std::function<void(const std::string& slideId,
                       const std::optional<Follow::MatchResult>& match)> onLiveSlide;

    // Broadcast to the sync collaborator (local changes only)
    std::function<void(const std::string& slideId)> publish;

    std::function<void(const std::string& combined)> onInterim;

    // User-visible status and failures
    std::function<void(const CommandResult& notice)> onNotice;
};

struct OrchestratorStatus {
    std::optional<std::string> liveSlideId;
    size_t slideCount = 0;
    size_t windowWords = 0;
    bool allowMatch = true;
    bool followEnabled = true;
    Voice::SessionState recognition = Voice::SessionState::Idle;
    int retryAttempt = 0;
};

// ------------------------------------------------------------
// Owns the authoritative follow state. Each operation is one
// atomic read-modify-write of that state; final transcripts are
// applied in arrival order.
// ------------------------------------------------------------
class Orchestrator {
public:
    Orchestrator(EventLoop& loop,
                 Follow::FollowSettings settings,
                 Net::ReconnectPolicy recognitionRetry);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Safe from any thread; calls already in flight finish with the old hooks
    void setHooks(OrchestratorHooks hooks);

    // ---------------- Slides & settings ----------------
    void setSlides(std::vector<Follow::Slide> slides);
    std::vector<Follow::Slide> slides() const;

    bool setSettings(const Follow::FollowSettings& settings, std::string* err = nullptr);
    Follow::FollowSettings settings() const;

    // ---------------- Follow ----------------
    std::optional<Follow::MatchResult> submitFinalTranscript(const std::string& text);
    std::optional<Follow::MatchResult> submitFinalTranscript(const std::string& text,
                                                             Follow::TimePoint now);

    // Manual or remote override; writes into the same follow state
    bool selectSlide(const std::string& slideId, bool fromRemote = false);
    bool selectSlide(const std::string& slideId, bool fromRemote, Follow::TimePoint now);

    // +1 / -1 through eligible slides
    bool step(int delta);

    void setAllowMatch(bool allow);
    bool allowMatch() const;

    // Forget current slide, cooldown and transcript window
    void resetFollow();

    Follow::FollowState followState() const;
    std::optional<std::string> liveSlideId() const;
    OrchestratorStatus status() const;

    // ---------------- Recognition ----------------
    // Subscribes to the backend; its events are re-posted onto the loop.
    void attachBackend(std::shared_ptr<Voice::RecognitionBackend> backend);

    bool startRecognition(std::string* err = nullptr);
    void stopRecognition();

private:
    void handleSessionError(const Voice::SessionError& error, uint64_t runId);
    void handleStateChange(Voice::SessionState state, uint64_t runId);
    void notify(const CommandResult& notice) const;
    OrchestratorHooks hooks() const;     // copy taken under mtx_; never call a hook while holding it

    EventLoop& loop_;

    mutable std::mutex mtx_;
    std::vector<Follow::Slide> slides_;        // ordered snapshot
    Follow::FollowSettings settings_;
    Follow::FollowState state_;
    bool allowMatch_ = true;

    OrchestratorHooks hooks_;

    std::shared_ptr<Voice::RecognitionBackend> backend_;
    Voice::Subscription subscription_;
    Net::ReconnectPolicy retry_;
    std::atomic<Voice::SessionState> recognitionState_{Voice::SessionState::Idle};
    std::atomic<int> retryAttempt_{0};
    std::atomic<uint64_t> runId_{0};           // bumped by stopRecognition to void pending retries
    std::atomic<bool> wanted_{false};
};

} // namespace App
