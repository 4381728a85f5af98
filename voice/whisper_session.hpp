#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

#include "recognition_backend.hpp"
#include "audio/audio_source.hpp"
#include "audio/pcm_encoder.hpp"

struct whisper_context;

namespace Voice {

struct WhisperConfig {
    std::string model = "ggml-base.en.bin";   // resolved under <resources>/models
    std::string language = "en";
    int maxTokens = 32;
    double silenceThreshold = 0.02;           // RMS below this counts as silence
    int silenceTimeoutMs = 1200;              // silence that closes an utterance
    int maxUtteranceMs = 30000;               // speech that closes one regardless (whisper window)
};

WhisperConfig whisperConfigFromJson(const nlohmann::json& section);

// Root mean square of a mono buffer; 0 for an empty one
double rmsLevel(const std::vector<float>& pcm);

// Longest utterance at 16 kHz; never more than whisper's 30 s window
size_t maxUtteranceSamples(const WhisperConfig& config);

// An open utterance is finalized after enough silence, or once it is full
bool utteranceComplete(size_t samples, int64_t silenceMs, const WhisperConfig& config);

// ------------------------------------------------------------
// Local recognizer (whisper.cpp)
// Interim text is a full re-decode of the open utterance; the
// final transcript is emitted once the speaker has been silent
// for silenceTimeoutMs.
// ------------------------------------------------------------
class WhisperSession : public RecognitionBackend {
public:
    WhisperSession(WhisperConfig config,
                   std::string modelPath,
                   Audio::CaptureFormat capture,
                   std::unique_ptr<Audio::AudioSource> audio);
    ~WhisperSession() override;

    WhisperSession(const WhisperSession&) = delete;
    WhisperSession& operator=(const WhisperSession&) = delete;

    std::shared_future<StartResult> start() override;
    void stop() override;

    SessionState state() const override;
    std::string name() const override { return "whisper"; }

private:
    StartResult runStart(uint64_t generation);
    StartResult fail(uint64_t generation, const SessionError& error);
    bool loadModel(std::string* err);

    void onAudio(const float* interleaved, unsigned long frameCount, int channels);
    void decodeLoop();
    std::string transcribe(const std::vector<float>& pcm);
    void flushUtterance();

    struct ContextDeleter { void operator()(whisper_context* ctx) const; };

    WhisperConfig config_;
    std::string modelPath_;
    Audio::CaptureFormat capture_;
    std::unique_ptr<Audio::AudioSource> audio_;
    Audio::PcmEncoder encoder_;
    std::unique_ptr<whisper_context, ContextDeleter> ctx_;

    mutable std::mutex mtx_;
    SessionState state_ = SessionState::Idle;
    uint64_t generation_ = 0;
    std::shared_future<StartResult> startFuture_;
    std::atomic<std::thread::id> workerThread_{};

    std::mutex pcmMtx_;
    std::vector<float> pending_;       // captured, not yet seen by the decoder

    std::thread decoder_;
    std::atomic<bool> running_{false};

    // Decoder thread only
    std::vector<float> utterance_;
    size_t decodedSamples_ = 0;
    std::chrono::steady_clock::time_point lastSpeech_;
    uint64_t nextSegmentId_ = 1;
};

} // namespace Voice
