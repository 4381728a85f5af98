#include "recognition_session.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace Voice {

// ------------------------------------------------------------
// Config helpers
// ------------------------------------------------------------
StreamingConfig streamingConfigFromJson(const nlohmann::json& section) {
    StreamingConfig c;
    if (!section.is_object()) return c;

    c.streamingUrl       = section.value("streaming_url", c.streamingUrl);
    c.sampleRate         = section.value("sample_rate", c.sampleRate);
    c.connectTimeoutMs   = section.value("connect_timeout_ms", c.connectTimeoutMs);
    c.awaitSessionBegins = section.value("await_session_begins", c.awaitSessionBegins);
    return c;
}

std::string buildStreamingUrl(const std::string& base, int sampleRate, const std::string& token) {
    std::string url = base;
    url += (base.find('?') == std::string::npos) ? '?' : '&';
    url += "sample_rate=" + std::to_string(sampleRate);
    url += "&token=" + token;
    return url;
}

SessionError classifyClose(int code, const std::string& reason) {
    SessionError e;
    // 4001 = not authorized, 1008 = policy violation (bad or expired token)
    if (code == 4001 || code == 1008) {
        e.kind = SessionErrorKind::Auth;
        e.code = "ERR_AUTH_REJECTED";
    } else {
        e.kind = SessionErrorKind::Connection;
        e.code = "ERR_CONN_CLOSED";
    }
    e.detail = "Closed with code " + std::to_string(code) + (reason.empty() ? "" : ": " + reason);
    return e;
}

SessionError classifyServerError(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    SessionError e;
    if (lower.find("auth") != std::string::npos || lower.find("token") != std::string::npos) {
        e.kind = SessionErrorKind::Auth;
        e.code = "ERR_AUTH_REJECTED";
    } else {
        e.kind = SessionErrorKind::Connection;
        e.code = "ERR_CONN_CLOSED";
    }
    e.detail = message;
    return e;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------
RecognitionSession::RecognitionSession(StreamingConfig config,
                                       Audio::CaptureFormat capture,
                                       std::unique_ptr<Audio::AudioSource> audio,
                                       std::shared_ptr<TokenProvider> tokens,
                                       std::unique_ptr<RecognitionTransport> transport)
    : config_(std::move(config)),
      capture_(capture),
      audio_(std::move(audio)),
      tokens_(std::move(tokens)),
      transport_(std::move(transport)),
      encoder_(capture.sampleRate, config_.sampleRate),
      queue_(std::max<size_t>(1, capture.maxPendingFrames)) {
    TransportHandlers h;
    h.onOpen    = [this]() { handleOpen(); };
    h.onMessage = [this](const std::string& text) { handleMessage(text); };
    h.onClose   = [this](int code, const std::string& reason) { handleClose(code, reason); };
    h.onError   = [this](const std::string& reason) { handleSocketError(reason); };
    transport_->setHandlers(std::move(h));
}

RecognitionSession::~RecognitionSession() {
    stop();
}

SessionState RecognitionSession::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

bool RecognitionSession::isCurrent(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return generation_ == generation;
}

std::shared_future<StartResult> RecognitionSession::start() {
    uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != SessionState::Idle) {
            // Already connecting or streaming: hand back the same start
            if (startFuture_.valid()) return startFuture_;
        }
        state_ = SessionState::Connecting;
        gen = ++generation_;
        handshakeDone_ = false;
        handshakeError_.reset();
        cancelStart_ = false;
    }
    listeners_->emitState(SessionState::Connecting);
    LOG_PHASE("Recognition starting", true);

    auto fut = std::async(std::launch::async, [this, gen]() {
        workerThread_ = std::this_thread::get_id();
        StartResult r = runStart(gen);
        workerThread_ = std::thread::id();
        return r;
    }).share();

    std::lock_guard<std::mutex> lock(mtx_);
    startFuture_ = fut;
    return fut;
}

StartResult RecognitionSession::runStart(uint64_t generation) {
    std::string err;

    // 🔹 Microphone first: a denied device must never reach the network
    auto cb = [this](const float* in, unsigned long n, int ch) { onAudio(in, n, ch); };
    if (!audio_->open(capture_, cb, &err)) {
        return failStart(generation, { SessionErrorKind::Permission, "ERR_MIC_PERMISSION", err });
    }
    if (!isCurrent(generation)) return cancelledStart();

    // 🔹 Short-lived token
    std::string token;
    SessionError tokenErr;
    if (!tokens_->fetchToken(token, &tokenErr, cancelStart_)) {
        return failStart(generation, tokenErr);
    }
    if (!isCurrent(generation)) return cancelledStart();

    // 🔹 Socket + handshake
    transport_->open(buildStreamingUrl(config_.streamingUrl, config_.sampleRate, token));
    {
        std::unique_lock<std::mutex> lock(mtx_);
        bool ready = handshakeCv_.wait_for(lock,
            std::chrono::milliseconds(config_.connectTimeoutMs),
            [&]() { return handshakeDone_ || handshakeError_ || generation_ != generation; });

        if (generation_ != generation) {
            return cancelledStart();
        }
        if (handshakeError_) {
            SessionError e = *handshakeError_;
            lock.unlock();
            return failStart(generation, e);
        }
        if (!ready) {
            lock.unlock();
            return failStart(generation, { SessionErrorKind::Connection, "ERR_CONN_TIMEOUT",
                "No session start within " + std::to_string(config_.connectTimeoutMs) + " ms" });
        }

        state_ = SessionState::Streaming;
        streaming_ = true;
    }

    // 🔹 Audio flows only after the handshake
    startPump();
    if (!audio_->start(&err)) {
        SessionError e{ SessionErrorKind::Permission, "ERR_MIC_PERMISSION", err };
        bool changed = false;
        {
            // Leave Streaming before the socket goes, so its close is not a failure
            std::lock_guard<std::mutex> lock(mtx_);
            if (generation_ == generation && state_ != SessionState::Idle) {
                state_ = SessionState::Idle;
                changed = true;
            }
            streaming_ = false;
        }
        haltAudio();
        closeTransport(false);
        LOG_ERROR("Recognition", "Microphone failed to start: " + err);
        listeners_->emitError(e);
        if (changed) listeners_->emitState(SessionState::Idle);
        return { false, false, e };
    }

    listeners_->emitState(SessionState::Streaming);
    LOG_PHASE("Recognition streaming", true);
    return { true, false, {} };
}

StartResult RecognitionSession::failStart(uint64_t generation, const SessionError& error) {
    haltAudio();
    closeTransport(false);

    bool current = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        current = (generation_ == generation);
        if (current) state_ = SessionState::Idle;
        streaming_ = false;
    }

    if (!current) return cancelledStart();

    LOG_ERROR("Recognition", std::string(toString(error.kind)) + " " + error.code + ": " + error.detail);
    LOG_PHASE("Recognition starting", false);
    listeners_->emitError(error);
    listeners_->emitState(SessionState::Idle);
    return { false, false, error };
}

StartResult RecognitionSession::cancelledStart() const {
    LOG_DEBUG("Recognition", "Start cancelled");
    StartResult r;
    r.cancelled = true;
    r.error = { SessionErrorKind::Connection, "ERR_CONN_CLOSED", "Stopped before streaming began" };
    return r;
}

void RecognitionSession::stop() {
    std::shared_future<StartResult> pending;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        ++generation_;
        pending = startFuture_;
        streaming_ = false;
    }
    cancelStart_ = true;
    handshakeCv_.notify_all();

    if (pending.valid() && workerThread_.load() != std::this_thread::get_id()) {
        pending.wait();
    }

    // 🔹 Idle before teardown: the close our own stop causes is not a failure
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        changed = (state_ != SessionState::Idle);
        state_ = SessionState::Idle;
    }

    haltAudio();
    closeTransport(true);
    {
        std::lock_guard<std::mutex> lock(interimMtx_);
        interim_.clear();
    }

    if (changed) {
        listeners_->emitState(SessionState::Idle);
        LOG_PHASE("Recognition stopped", true);
    }
}

// ------------------------------------------------------------
// Audio path
// ------------------------------------------------------------
void RecognitionSession::onAudio(const float* interleaved, unsigned long frameCount, int channels) {
    if (!streaming_) return;
    // No logging here; drops are counted by the queue and reported by the pump
    queue_.push(encoder_.encode(interleaved, frameCount, channels));
}

void RecognitionSession::startPump() {
    std::lock_guard<std::mutex> lock(audioMtx_);
    if (pumpThread_.joinable()) return;
    queue_.reopen();
    pumping_ = true;
    pumpThread_ = std::thread(&RecognitionSession::pumpLoop, this);
}

void RecognitionSession::pumpLoop() {
    setThreadLabel("pump");
    size_t reportedDrops = queue_.dropped();
    while (pumping_) {
        size_t drops = queue_.dropped();
        if (drops != reportedDrops) {
            LOG_DEBUG("Recognition", "Frame queue full, dropped " +
                                     std::to_string(drops - reportedDrops) + " frame(s)");
            reportedDrops = drops;
        }

        auto frame = queue_.waitPop(std::chrono::milliseconds(50));
        if (!frame) continue;
        if (!streaming_) continue;
        if (transport_->sendBinary(*frame)) {
            ++sentFrames_;
        } else {
            LOG_TRACE("Recognition", "Send failed, frame discarded");
        }
    }
}

void RecognitionSession::haltAudio() {
    std::lock_guard<std::mutex> lock(audioMtx_);
    pumping_ = false;
    queue_.close();
    if (pumpThread_.joinable()) pumpThread_.join();

    audio_->stop();
    audio_->close();
}

void RecognitionSession::closeTransport(bool sendTerminate) {
    if (sendTerminate && transport_->isOpen()) {
        if (!transport_->sendText(terminateMessage())) {
            LOG_DEBUG("Recognition", "Terminate message not delivered");
        }
    }
    transport_->close();
}

// ------------------------------------------------------------
// Socket thread
// ------------------------------------------------------------
void RecognitionSession::handleOpen() {
    if (config_.awaitSessionBegins) return;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        handshakeDone_ = true;
    }
    handshakeCv_.notify_all();
}

void RecognitionSession::handleMessage(const std::string& text) {
    ServerEvent ev;
    SessionError perr;
    if (!parseServerEvent(text, ev, &perr)) {
        LOG_ERROR("Recognition", "Malformed server event: " + perr.detail);
        listeners_->emitError(perr);
        return;
    }

    if (auto* begins = std::get_if<SessionBegins>(&ev)) {
        LOG_DEBUG("Recognition", "Session begins: " + begins->sessionId);
        {
            std::lock_guard<std::mutex> lock(mtx_);
            handshakeDone_ = true;
        }
        handshakeCv_.notify_all();
    }
    else if (auto* partial = std::get_if<PartialTranscript>(&ev)) {
        if (partial->text.empty()) return;
        std::string combined;
        {
            std::lock_guard<std::mutex> lock(interimMtx_);
            combined = interim_.update(partial->audioStart, partial->text);
        }
        listeners_->emitInterim(combined);
    }
    else if (auto* fin = std::get_if<FinalTranscript>(&ev)) {
        {
            std::lock_guard<std::mutex> lock(interimMtx_);
            interim_.erase(fin->audioStart);
        }
        if (fin->text.empty()) return;

        TranscriptSegment seg;
        seg.id = nextSegmentId_++;
        seg.text = fin->text;
        seg.timestamp = std::chrono::system_clock::now();
        LOG_TRACE("Recognition", "Final #" + std::to_string(seg.id) + ": " + seg.text);
        listeners_->emitFinal(seg);
    }
    else if (std::get_if<SessionTerminated>(&ev)) {
        LOG_DEBUG("Recognition", "Session terminated by server");
    }
    else if (auto* serverErr = std::get_if<ServerError>(&ev)) {
        LOG_ERROR("Recognition", "Server error: " + serverErr->message);
        SessionState s = state();
        if (s == SessionState::Connecting) failHandshake(classifyServerError(serverErr->message));
        else if (s == SessionState::Streaming) failStreaming(classifyServerError(serverErr->message));
    }
}

void RecognitionSession::handleClose(int code, const std::string& reason) {
    SessionState s = state();
    if (s == SessionState::Connecting) failHandshake(classifyClose(code, reason));
    else if (s == SessionState::Streaming) failStreaming(classifyClose(code, reason));
}

void RecognitionSession::handleSocketError(const std::string& reason) {
    SessionError e{ SessionErrorKind::Connection, "ERR_CONN_CLOSED", reason };
    SessionState s = state();
    if (s == SessionState::Connecting) failHandshake(e);
    else if (s == SessionState::Streaming) failStreaming(e);
}

void RecognitionSession::failHandshake(const SessionError& error) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (handshakeDone_ || handshakeError_) return;
        handshakeError_ = error;
    }
    handshakeCv_.notify_all();
}

void RecognitionSession::failStreaming(const SessionError& error) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != SessionState::Streaming) return;
        state_ = SessionState::Idle;
        streaming_ = false;
    }

    // Socket is already gone; it is reaped by the next open() or stop()
    haltAudio();
    {
        std::lock_guard<std::mutex> lock(interimMtx_);
        interim_.clear();
    }

    LOG_ERROR("Recognition", std::string(toString(error.kind)) + " " + error.code + ": " + error.detail);
    listeners_->emitError(error);
    listeners_->emitState(SessionState::Idle);
}

} // namespace Voice
