#include "whisper_session.hpp"
#include "logger.hpp"

#include <whisper.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <algorithm>
#include <cmath>

namespace fs = std::filesystem;

namespace Voice {

// Minimum new audio before another decode (~100ms at 16kHz)
constexpr size_t MIN_SAMPLES = 1600;

// Cap on buffered audio if the decoder falls behind (~30s at 16kHz)
constexpr size_t MAX_PENDING_SAMPLES = 16000 * 30;

constexpr int WHISPER_RATE = 16000;
constexpr int WHISPER_WINDOW_MS = 30000;

WhisperConfig whisperConfigFromJson(const nlohmann::json& section) {
    WhisperConfig c;
    if (!section.is_object()) return c;

    c.model            = section.value("model", c.model);
    c.language         = section.value("language", c.language);
    c.maxTokens        = section.value("max_tokens", c.maxTokens);
    c.silenceThreshold = section.value("silence_threshold", c.silenceThreshold);
    c.silenceTimeoutMs = section.value("silence_timeout_ms", c.silenceTimeoutMs);
    c.maxUtteranceMs   = section.value("max_utterance_ms", c.maxUtteranceMs);
    return c;
}

size_t maxUtteranceSamples(const WhisperConfig& config) {
    int ms = std::clamp(config.maxUtteranceMs, 1000, WHISPER_WINDOW_MS);
    return static_cast<size_t>(ms) * WHISPER_RATE / 1000;
}

bool utteranceComplete(size_t samples, int64_t silenceMs, const WhisperConfig& config) {
    if (samples == 0) return false;
    if (samples >= maxUtteranceSamples(config)) return true;
    return silenceMs > config.silenceTimeoutMs;
}

double rmsLevel(const std::vector<float>& pcm) {
    if (pcm.empty()) return 0.0;

    double energy = 0.0;
    for (float s : pcm) energy += static_cast<double>(s) * s;
    energy /= static_cast<double>(pcm.size());
    return std::sqrt(energy);
}

void WhisperSession::ContextDeleter::operator()(whisper_context* ctx) const {
    if (ctx) whisper_free(ctx);
}

WhisperSession::WhisperSession(WhisperConfig config,
                               std::string modelPath,
                               Audio::CaptureFormat capture,
                               std::unique_ptr<Audio::AudioSource> audio)
    : config_(std::move(config)),
      modelPath_(std::move(modelPath)),
      capture_(capture),
      audio_(std::move(audio)),
      encoder_(capture.sampleRate, WHISPER_RATE) {}

WhisperSession::~WhisperSession() {
    stop();
}

SessionState WhisperSession::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

// ---------------- Model ----------------
bool WhisperSession::loadModel(std::string* err) {
    if (ctx_) return true;

    LOG_DEBUG("Whisper", "Looking for Whisper model at: " + modelPath_);
    if (!fs::exists(modelPath_)) {
        if (err) *err = "Whisper model missing: " + modelPath_;
        return false;
    }

    whisper_context_params wparams = whisper_context_default_params();
    ctx_.reset(whisper_init_from_file_with_params(modelPath_.c_str(), wparams));
    if (!ctx_) {
        if (err) *err = "Failed to load Whisper model: " + modelPath_;
        return false;
    }

    LOG_PHASE("Whisper model load", true);
    return true;
}

// ---------------- Control ----------------
std::shared_future<StartResult> WhisperSession::start() {
    uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != SessionState::Idle && startFuture_.valid()) return startFuture_;
        state_ = SessionState::Connecting;
        gen = ++generation_;
    }
    listeners_->emitState(SessionState::Connecting);

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

StartResult WhisperSession::runStart(uint64_t generation) {
    std::string err;

    if (!loadModel(&err)) {
        return fail(generation, { SessionErrorKind::Connection, "ERR_WHISPER_MODEL", err });
    }

    auto cb = [this](const float* in, unsigned long n, int ch) { onAudio(in, n, ch); };
    if (!audio_->open(capture_, cb, &err)) {
        return fail(generation, { SessionErrorKind::Permission, "ERR_MIC_PERMISSION", err });
    }

    {
        std::unique_lock<std::mutex> lock(mtx_);
        if (generation_ != generation) {
            lock.unlock();
            audio_->close();
            StartResult r;
            r.cancelled = true;
            return r;
        }
        state_ = SessionState::Streaming;
    }

    {
        std::lock_guard<std::mutex> lock(pcmMtx_);
        pending_.clear();
    }
    utterance_.clear();
    decodedSamples_ = 0;
    lastSpeech_ = std::chrono::steady_clock::now();

    running_ = true;
    decoder_ = std::thread(&WhisperSession::decodeLoop, this);

    if (!audio_->start(&err)) {
        return fail(generation, { SessionErrorKind::Permission, "ERR_MIC_PERMISSION", err });
    }

    listeners_->emitState(SessionState::Streaming);
    LOG_PHASE("Whisper streaming", true);
    return { true, false, {} };
}

StartResult WhisperSession::fail(uint64_t generation, const SessionError& error) {
    running_ = false;
    if (decoder_.joinable()) decoder_.join();
    audio_->stop();
    audio_->close();

    bool current = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        current = (generation_ == generation);
        if (current) state_ = SessionState::Idle;
    }
    if (!current) {
        StartResult r;
        r.cancelled = true;
        return r;
    }

    LOG_ERROR("Whisper", error.code + ": " + error.detail);
    listeners_->emitError(error);
    listeners_->emitState(SessionState::Idle);
    return { false, false, error };
}

void WhisperSession::stop() {
    std::shared_future<StartResult> pending;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        ++generation_;
        pending = startFuture_;
    }
    if (pending.valid() && workerThread_.load() != std::this_thread::get_id()) {
        pending.wait();
    }

    running_ = false;
    if (decoder_.joinable()) decoder_.join();
    audio_->stop();
    audio_->close();

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        changed = (state_ != SessionState::Idle);
        state_ = SessionState::Idle;
    }
    if (changed) {
        listeners_->emitState(SessionState::Idle);
        LOG_PHASE("Whisper stopped", true);
    }
}

// ---------------- Audio thread ----------------
void WhisperSession::onAudio(const float* interleaved, unsigned long frameCount, int channels) {
    std::vector<float> mono = encoder_.toMono(interleaved, frameCount, channels);

    std::lock_guard<std::mutex> lock(pcmMtx_);
    pending_.insert(pending_.end(), mono.begin(), mono.end());
    if (pending_.size() > MAX_PENDING_SAMPLES) {
        pending_.erase(pending_.begin(),
                       pending_.begin() + static_cast<std::ptrdiff_t>(pending_.size() - MAX_PENDING_SAMPLES));
    }
}

// ---------------- Decoder thread ----------------
std::string WhisperSession::transcribe(const std::vector<float>& pcm) {
    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.no_timestamps = true;
    params.print_progress = false;
    params.print_realtime = false;
    params.max_tokens = config_.maxTokens;
    params.language = config_.language.c_str();

    if (whisper_full(ctx_.get(), params, pcm.data(), static_cast<int>(pcm.size())) != 0) {
        LOG_ERROR("Whisper", "whisper_full() failed");
        return "";
    }

    std::string text;
    int n = whisper_full_n_segments(ctx_.get());
    for (int i = 0; i < n; ++i) {
        text += whisper_full_get_segment_text(ctx_.get(), i);
    }

    // Trim
    size_t b = text.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = text.find_last_not_of(" \t\r\n");
    return text.substr(b, e - b + 1);
}

void WhisperSession::flushUtterance() {
    std::string text = transcribe(utterance_);
    utterance_.clear();
    decodedSamples_ = 0;

    if (text.empty()) return;

    TranscriptSegment seg;
    seg.id = nextSegmentId_++;
    seg.text = text;
    seg.timestamp = std::chrono::system_clock::now();
    LOG_TRACE("Whisper", "Final #" + std::to_string(seg.id) + ": " + text);
    listeners_->emitFinal(seg);
}

void WhisperSession::decodeLoop() {
    setThreadLabel("decode");
    while (running_) {
        std::vector<float> pcm;
        {
            std::lock_guard<std::mutex> lock(pcmMtx_);
            pcm.swap(pending_);
        }

        auto now = std::chrono::steady_clock::now();

        if (!pcm.empty()) {
            bool voiced = rmsLevel(pcm) >= config_.silenceThreshold;
            if (voiced) lastSpeech_ = now;

            // Leading silence is not worth decoding
            if (voiced || !utterance_.empty()) {
                utterance_.insert(utterance_.end(), pcm.begin(), pcm.end());
            }

            if (voiced && utterance_.size() - decodedSamples_ >= MIN_SAMPLES) {
                decodedSamples_ = utterance_.size();
                std::string interim = transcribe(utterance_);
                if (!interim.empty()) listeners_->emitInterim(interim);
            }
        }

        auto silenceMs = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastSpeech_).count();
        if (utteranceComplete(utterance_.size(), silenceMs, config_)) {
            if (utterance_.size() >= maxUtteranceSamples(config_)) {
                LOG_DEBUG("Whisper", "Utterance reached " + std::to_string(config_.maxUtteranceMs) +
                                     " ms, finalizing");
            }
            flushUtterance();
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    // Do not lose the last words on stop
    if (!utterance_.empty()) flushUtterance();
}

} // namespace Voice
