#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <future>
#include <thread>
#include <chrono>
#include <functional>

#include "audio/audio_source.hpp"
#include "voice/token_provider.hpp"
#include "voice/transport.hpp"
#include "voice/recognition_backend.hpp"

namespace TestFakes {

// Polls until pred() holds or the timeout passes
inline bool waitFor(const std::function<bool()>& pred,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// ------------------------------------------------------------
// Microphone
// ------------------------------------------------------------
class FakeAudioSource : public Audio::AudioSource {
public:
    bool openOk = true;
    bool startOk = true;
    std::atomic<int> opens{0};
    std::atomic<int> stops{0};
    std::atomic<int> closes{0};

    bool open(const Audio::CaptureFormat&, Audio::FrameCallback cb, std::string* err) override {
        ++opens;
        if (!openOk) {
            if (err) *err = "Permission denied";
            return false;
        }
        std::lock_guard<std::mutex> lock(mtx_);
        callback_ = std::move(cb);
        return true;
    }

    bool start(std::string* err) override {
        if (!startOk) {
            if (err) *err = "Device busy";
            return false;
        }
        active_ = true;
        return true;
    }

    void stop() override {
        ++stops;
        active_ = false;
    }

    void close() override {
        ++closes;
        std::lock_guard<std::mutex> lock(mtx_);
        callback_ = nullptr;
    }

    bool isActive() const override { return active_; }

    // Simulates one buffer from the audio thread
    void feed(const std::vector<float>& samples, int channels = 1) {
        Audio::FrameCallback cb;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            cb = callback_;
        }
        if (cb) cb(samples.data(), static_cast<unsigned long>(samples.size() / channels), channels);
    }

private:
    std::mutex mtx_;
    Audio::FrameCallback callback_;
    std::atomic<bool> active_{false};
};

// ------------------------------------------------------------
// Token endpoint
// ------------------------------------------------------------
class FakeTokenProvider : public Voice::TokenProvider {
public:
    bool ok = true;
    Voice::SessionError failure{ Voice::SessionErrorKind::Auth, "ERR_AUTH_TOKEN", "401 Unauthorized" };
    std::chrono::milliseconds delay{0};     // simulated round trip, cut short by cancellation
    std::atomic<int> calls{0};
    std::atomic<int> cancellations{0};

    bool fetchToken(std::string& token, Voice::SessionError* err,
                    const std::atomic<bool>& cancelled) override {
        ++calls;
        auto deadline = std::chrono::steady_clock::now() + delay;
        while (std::chrono::steady_clock::now() < deadline && !cancelled) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (cancelled) {
            ++cancellations;
            if (err) *err = { Voice::SessionErrorKind::Connection, "ERR_CONN_CLOSED", "Token request cancelled" };
            return false;
        }
        if (!ok) {
            if (err) *err = failure;
            return false;
        }
        token = "tok123";
        return true;
    }
};

// ------------------------------------------------------------
// Socket
// ------------------------------------------------------------
class FakeTransport : public Voice::RecognitionTransport {
public:
    enum class OnOpen {
        Handshake,     // open + SessionBegins
        OpenOnly,      // open, no SessionBegins
        Silent,        // nothing
        RejectAuth     // close 4001
    };

    OnOpen behaviour = OnOpen::Handshake;
    std::atomic<bool> holdSends{false};     // parks the sender inside sendBinary
    std::atomic<bool> sendParked{false};

    void setHandlers(Voice::TransportHandlers handlers) override { handlers_ = std::move(handlers); }

    void open(const std::string& url) override {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            urls_.push_back(url);
        }
        switch (behaviour) {
            case OnOpen::Handshake:
                open_ = true;
                handlers_.onOpen();
                handlers_.onMessage(R"({"message_type":"SessionBegins","session_id":"s-1"})");
                break;
            case OnOpen::OpenOnly:
                open_ = true;
                handlers_.onOpen();
                break;
            case OnOpen::Silent:
                break;
            case OnOpen::RejectAuth:
                handlers_.onClose(4001, "Not authorized");
                break;
        }
    }

    bool sendBinary(const std::string& data) override {
        if (!open_) return false;
        while (holdSends) {
            sendParked = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        sendParked = false;
        std::lock_guard<std::mutex> lock(mtx_);
        binary_.push_back(data);
        return true;
    }

    bool sendText(const std::string& text) override {
        if (!open_) return false;
        std::lock_guard<std::mutex> lock(mtx_);
        text_.push_back(text);
        return true;
    }

    // Like ix::WebSocket::stop(), closing an open socket reports a normal close
    void close() override {
        bool wasOpen = open_.exchange(false);
        ++closes;
        if (wasOpen && handlers_.onClose) handlers_.onClose(1000, "Normal closure");
    }

    bool isOpen() const override { return open_; }

    // Server side
    void serverSend(const std::string& text) { handlers_.onMessage(text); }
    void serverClose(int code, const std::string& reason) {
        open_ = false;
        handlers_.onClose(code, reason);
    }

    std::vector<std::string> urls() const { std::lock_guard<std::mutex> l(mtx_); return urls_; }
    std::vector<std::string> binary() const { std::lock_guard<std::mutex> l(mtx_); return binary_; }
    std::vector<std::string> text() const { std::lock_guard<std::mutex> l(mtx_); return text_; }

    std::atomic<int> closes{0};

private:
    Voice::TransportHandlers handlers_;
    mutable std::mutex mtx_;
    std::vector<std::string> urls_;
    std::vector<std::string> binary_;
    std::vector<std::string> text_;
    std::atomic<bool> open_{false};
};

// ------------------------------------------------------------
// Recognition backend driven by hand
// ------------------------------------------------------------
class FakeBackend : public Voice::RecognitionBackend {
public:
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};

    std::shared_future<Voice::StartResult> start() override {
        ++starts;
        state_ = Voice::SessionState::Connecting;
        std::promise<Voice::StartResult> p;
        p.set_value({ true, false, {} });
        return p.get_future().share();
    }

    void stop() override {
        ++stops;
        state_ = Voice::SessionState::Idle;
    }

    Voice::SessionState state() const override { return state_; }
    std::string name() const override { return "fake"; }

    void setState(Voice::SessionState s) {
        state_ = s;
        listeners_->emitState(s);
    }
    void sendFinal(const std::string& text) {
        Voice::TranscriptSegment seg;
        seg.id = ++segments_;
        seg.text = text;
        seg.timestamp = std::chrono::system_clock::now();
        listeners_->emitFinal(seg);
    }
    void sendInterim(const std::string& text) { listeners_->emitInterim(text); }
    void fail(Voice::SessionErrorKind kind, const std::string& code) {
        state_ = Voice::SessionState::Idle;
        listeners_->emitError({ kind, code, "injected" });
    }

private:
    std::atomic<Voice::SessionState> state_{Voice::SessionState::Idle};
    uint64_t segments_ = 0;
};

} // namespace TestFakes
