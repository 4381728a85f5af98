#include "orchestrator.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>

namespace App {

Orchestrator::Orchestrator(EventLoop& loop,
                           Follow::FollowSettings settings,
                           Net::ReconnectPolicy recognitionRetry)
    : loop_(loop),
      settings_(settings),
      retry_(recognitionRetry) {}

Orchestrator::~Orchestrator() {
    subscription_.reset();
}

void Orchestrator::setHooks(OrchestratorHooks hooks) {
    std::lock_guard<std::mutex> lock(mtx_);
    hooks_ = std::move(hooks);
}

OrchestratorHooks Orchestrator::hooks() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return hooks_;
}

void Orchestrator::notify(const CommandResult& notice) const {
    auto h = hooks();
    if (h.onNotice) h.onNotice(notice);
}

// ------------------------------------------------------------
// Slides & settings
// ------------------------------------------------------------
void Orchestrator::setSlides(std::vector<Follow::Slide> slides) {
    auto ordered = Follow::orderedSlides(slides);
    std::lock_guard<std::mutex> lock(mtx_);
    slides_ = std::move(ordered);
    LOG_DEBUG("Orchestrator", "Slide snapshot: " + std::to_string(slides_.size()) + " slides");
}

std::vector<Follow::Slide> Orchestrator::slides() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return slides_;
}

bool Orchestrator::setSettings(const Follow::FollowSettings& settings, std::string* err) {
    if (!Follow::validateFollowSettings(settings, err)) return false;
    std::lock_guard<std::mutex> lock(mtx_);
    settings_ = settings;
    return true;
}

Follow::FollowSettings Orchestrator::settings() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return settings_;
}

// ------------------------------------------------------------
// Follow
// ------------------------------------------------------------
std::optional<Follow::MatchResult> Orchestrator::submitFinalTranscript(const std::string& text) {
    return submitFinalTranscript(text, Follow::Clock::now());
}

std::optional<Follow::MatchResult> Orchestrator::submitFinalTranscript(const std::string& text,
                                                                       Follow::TimePoint now) {
    std::optional<Follow::MatchResult> match;
    OrchestratorHooks h;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        h = hooks_;
        auto outcome = Follow::applyFollow(text, slides_, state_, settings_, allowMatch_, now);
        state_ = std::move(outcome.nextState);
        if (outcome.match) {
            state_ = Follow::acceptMatch(state_, *outcome.match, now);
            match = outcome.match;
        }
    }

    if (!match) return match;

    LOG_TRACE("Orchestrator", std::string("Live slide -> ") + match->slideId + " (" +
                              Follow::toString(match->reason) + ", " +
                              std::to_string(match->score) + ")");
    if (h.onLiveSlide) h.onLiveSlide(match->slideId, match);
    if (h.publish) h.publish(match->slideId);
    return match;
}

bool Orchestrator::selectSlide(const std::string& slideId, bool fromRemote) {
    return selectSlide(slideId, fromRemote, Follow::Clock::now());
}

bool Orchestrator::selectSlide(const std::string& slideId, bool fromRemote, Follow::TimePoint now) {
    OrchestratorHooks h;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        h = hooks_;
        auto it = std::find_if(slides_.begin(), slides_.end(),
                               [&](const Follow::Slide& s) { return s.id == slideId; });
        if (it == slides_.end()) return false;

        state_.currentSlideId = slideId;
        state_.lastAdvanceAt = now;
    }

    LOG_DEBUG("Orchestrator", std::string(fromRemote ? "Remote" : "Manual") + " select: " + slideId);
    if (h.onLiveSlide) h.onLiveSlide(slideId, std::nullopt);
    if (!fromRemote && h.publish) h.publish(slideId);
    return true;
}

bool Orchestrator::step(int delta) {
    std::string target;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<size_t> eligible;
        for (size_t i = 0; i < slides_.size(); ++i) {
            if (Follow::isEligible(slides_[i])) eligible.push_back(i);
        }
        if (eligible.empty() || delta == 0) return false;

        long pos = -1;
        if (state_.currentSlideId) {
            for (size_t k = 0; k < eligible.size(); ++k) {
                if (slides_[eligible[k]].id == *state_.currentSlideId) {
                    pos = static_cast<long>(k);
                    break;
                }
            }
        }

        long next = (pos < 0) ? (delta > 0 ? 0 : static_cast<long>(eligible.size()) - 1)
                              : pos + delta;
        if (next < 0 || next >= static_cast<long>(eligible.size())) return false;
        target = slides_[eligible[static_cast<size_t>(next)]].id;
    }
    return selectSlide(target, false);
}

void Orchestrator::setAllowMatch(bool allow) {
    std::lock_guard<std::mutex> lock(mtx_);
    allowMatch_ = allow;
}

bool Orchestrator::allowMatch() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return allowMatch_;
}

void Orchestrator::resetFollow() {
    std::lock_guard<std::mutex> lock(mtx_);
    state_ = Follow::FollowState{};
    LOG_DEBUG("Orchestrator", "Follow state reset");
}

Follow::FollowState Orchestrator::followState() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

std::optional<std::string> Orchestrator::liveSlideId() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_.currentSlideId;
}

OrchestratorStatus Orchestrator::status() const {
    OrchestratorStatus s;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        s.liveSlideId   = state_.currentSlideId;
        s.slideCount    = slides_.size();
        s.windowWords   = state_.transcriptTokens.size();
        s.allowMatch    = allowMatch_;
        s.followEnabled = settings_.enabled;
    }
    s.recognition  = recognitionState_.load();
    s.retryAttempt = retryAttempt_.load();
    return s;
}

// ------------------------------------------------------------
// Recognition
// ------------------------------------------------------------
void Orchestrator::attachBackend(std::shared_ptr<Voice::RecognitionBackend> backend) {
    subscription_.reset();
    backend_ = std::move(backend);
    if (!backend_) return;

    // 🔹 Session threads never touch follow state; everything is re-posted
    Voice::TranscriptListeners l;
    l.onInterim = [this](const std::string& combined) {
        loop_.post([this, combined]() {
            auto h = hooks();
            if (h.onInterim) h.onInterim(combined);
        });
    };
    l.onFinal = [this](const Voice::TranscriptSegment& seg) {
        loop_.post([this, text = seg.text]() { submitFinalTranscript(text); });
    };
    l.onError = [this](const Voice::SessionError& e) {
        uint64_t run = runId_.load();
        loop_.post([this, e, run]() { handleSessionError(e, run); });
    };
    l.onStateChange = [this](Voice::SessionState s) {
        uint64_t run = runId_.load();
        loop_.post([this, s, run]() { handleStateChange(s, run); });
    };
    subscription_ = backend_->subscribe(std::move(l));
}

bool Orchestrator::startRecognition(std::string* err) {
    if (!backend_) {
        if (err) *err = "No recognition backend attached";
        return false;
    }
    if (backend_->state() != Voice::SessionState::Idle) {
        if (err) *err = "Recognition already running";
        return false;
    }

    wanted_ = true;
    LOG_DEBUG("Orchestrator", "Starting recognition (" + backend_->name() + ")");
    backend_->start();
    return true;
}

void Orchestrator::stopRecognition() {
    wanted_ = false;
    ++runId_;
    retryAttempt_ = 0;
    if (backend_) backend_->stop();
    recognitionState_ = Voice::SessionState::Idle;
}

void Orchestrator::handleStateChange(Voice::SessionState state, uint64_t runId) {
    if (runId != runId_.load()) return;
    recognitionState_ = state;

    if (state == Voice::SessionState::Streaming) {
        if (retryAttempt_ > 0) LOG_PHASE("Recognition reconnected", true);
        retryAttempt_ = 0;
        notify({ "[Recognition] Listening (" + (backend_ ? backend_->name() : std::string("?")) + ")",
                 true, "ERR_NONE" });
    }
}

void Orchestrator::handleSessionError(const Voice::SessionError& error, uint64_t runId) {
    // Follow state is untouched by any session failure
    notify(ErrorManager::report(error.code, std::string(Voice::toString(error.kind)) + ": " + error.detail));

    if (error.kind == Voice::SessionErrorKind::Protocol) return;
    if (runId != runId_.load() || !wanted_) return;

    // Only connection failures are retried; auth and permission need the user
    if (error.kind != Voice::SessionErrorKind::Connection) {
        wanted_ = false;
        return;
    }

    int attempt = retryAttempt_ + 1;
    if (!retry_.shouldRetry(attempt)) {
        if (retry_.enabled) {
            LOG_ERROR("Orchestrator", "Recognition retries exhausted after " +
                                      std::to_string(attempt - 1) + " attempts");
        }
        wanted_ = false;
        retryAttempt_ = 0;
        return;
    }

    retryAttempt_ = attempt;
    auto delay = retry_.nextDelay(attempt);
    LOG_DEBUG("Orchestrator", "Recognition retry " + std::to_string(attempt) + " in " +
                              std::to_string(delay.count()) + "ms");

    loop_.postAfter(delay, [this, runId]() {
        if (runId != runId_.load() || !wanted_ || !backend_) return;
        if (backend_->state() != Voice::SessionState::Idle) return;
        backend_->start();
    });
}

} // namespace App
