#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <optional>
#include <nlohmann/json_fwd.hpp>

#include "recognition_backend.hpp"
#include "token_provider.hpp"
#include "transport.hpp"
#include "audio/audio_source.hpp"
#include "audio/pcm_encoder.hpp"
#include "audio/frame_queue.hpp"

namespace Voice {

struct StreamingConfig {
    std::string streamingUrl = "wss://api.assemblyai.com/v2/realtime/ws";
    int sampleRate = 16000;
    int connectTimeoutMs = 10000;
    bool awaitSessionBegins = true;   // false: socket open counts as the handshake
};

StreamingConfig streamingConfigFromJson(const nlohmann::json& section);

// base?sample_rate=N&token=T (appends with '&' when base already has a query)
std::string buildStreamingUrl(const std::string& base, int sampleRate, const std::string& token);

// Close codes and server error text -> session error
SessionError classifyClose(int code, const std::string& reason);
SessionError classifyServerError(const std::string& message);

// ------------------------------------------------------------
// Cloud streaming session
//   start: microphone -> token -> socket + SessionBegins -> Streaming
//   stop:  halt pump -> release microphone -> terminate -> close socket
// Listener callbacks run on the audio, socket or start worker threads.
// Do not call start()/stop() from inside a listener; re-post instead.
// ------------------------------------------------------------
class RecognitionSession : public RecognitionBackend {
public:
    RecognitionSession(StreamingConfig config,
                       Audio::CaptureFormat capture,
                       std::unique_ptr<Audio::AudioSource> audio,
                       std::shared_ptr<TokenProvider> tokens,
                       std::unique_ptr<RecognitionTransport> transport);
    ~RecognitionSession() override;

    RecognitionSession(const RecognitionSession&) = delete;
    RecognitionSession& operator=(const RecognitionSession&) = delete;

    std::shared_future<StartResult> start() override;
    void stop() override;

    SessionState state() const override;
    std::string name() const override { return "cloud"; }

    size_t droppedFrames() const { return queue_.dropped(); }
    size_t sentFrames() const { return sentFrames_.load(); }

private:
    StartResult runStart(uint64_t generation);
    StartResult failStart(uint64_t generation, const SessionError& error);
    StartResult cancelledStart() const;
    bool isCurrent(uint64_t generation) const;

    // Socket thread
    void handleMessage(const std::string& text);
    void handleOpen();
    void handleClose(int code, const std::string& reason);
    void handleSocketError(const std::string& reason);
    void failHandshake(const SessionError& error);
    void failStreaming(const SessionError& error);

    // Audio thread
    void onAudio(const float* interleaved, unsigned long frameCount, int channels);

    void startPump();
    void pumpLoop();
    void haltAudio();
    void closeTransport(bool sendTerminate);

    StreamingConfig config_;
    Audio::CaptureFormat capture_;
    std::unique_ptr<Audio::AudioSource> audio_;
    std::shared_ptr<TokenProvider> tokens_;
    std::unique_ptr<RecognitionTransport> transport_;
    Audio::PcmEncoder encoder_;
    Audio::FrameQueue queue_;

    mutable std::mutex mtx_;
    std::condition_variable handshakeCv_;
    SessionState state_ = SessionState::Idle;
    uint64_t generation_ = 0;
    bool handshakeDone_ = false;
    std::optional<SessionError> handshakeError_;
    std::shared_future<StartResult> startFuture_;
    std::atomic<std::thread::id> workerThread_{};
    std::atomic<bool> cancelStart_{false};     // aborts a token fetch in flight

    std::mutex audioMtx_;
    std::thread pumpThread_;
    std::atomic<bool> pumping_{false};
    std::atomic<bool> streaming_{false};
    std::atomic<size_t> sentFrames_{0};

    std::mutex interimMtx_;
    InterimCoalescer interim_;
    std::atomic<uint64_t> nextSegmentId_{1};
};

} // namespace Voice
