#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <ixwebsocket/IXWebSocket.h>

#include "reconnect_policy.hpp"

namespace Net {

// publisher: sends live slide changes
// subscriber: follows another instance
// peer: both
enum class SyncRole {
    Off,
    Publisher,
    Subscriber,
    Peer
};

const char* toString(SyncRole role);
bool parseSyncRole(const std::string& name, SyncRole& out);

struct SyncConfig {
    SyncRole role = SyncRole::Off;
    std::string host = "127.0.0.1";
    int port = 9877;
    std::string clientId;                       // generated when empty
    ReconnectPolicy reconnect{ true, 10, 1000, 30000 };
};

SyncConfig syncConfigFromJson(const nlohmann::json& section);

// ---------------- Wire helpers ----------------
std::string buildSyncUrl(const std::string& host, int port);
std::string buildJoinMessage(SyncRole role, const std::string& clientId);
std::string buildLiveSlideMessage(const std::string& slideId, int64_t timestampMs);

struct SyncMessage {
    std::string type;        // sync_welcome, sync_live_slide, sync_error, ...
    std::string slideId;     // sync_live_slide
    int64_t timestamp = 0;
    std::string message;     // sync_error
};

bool parseSyncMessage(const std::string& text, SyncMessage& out, std::string* err = nullptr);

// ------------------------------------------------------------
// Live slide sync over a websocket relay. Callbacks run on the
// socket thread.
// ------------------------------------------------------------
class SyncClient {
public:
    explicit SyncClient(SyncConfig config);
    ~SyncClient();

    SyncClient(const SyncClient&) = delete;
    SyncClient& operator=(const SyncClient&) = delete;

    void setOnLiveSlide(std::function<void(const std::string& slideId)> cb);
    void setOnConnectionChange(std::function<void(bool connected)> cb);

    bool connect(std::string* err = nullptr);

    // Closes and disables further reconnection
    void disconnect();

    // Ignored (false) for subscribers or while disconnected
    bool publishLiveSlide(const std::string& slideId);

    bool isConnected() const { return connected_.load(); }
    int reconnectAttempts() const { return attempts_.load(); }
    const SyncConfig& config() const { return config_; }

private:
    void onSocketMessage(const ix::WebSocketMessagePtr& msg);
    void handleText(const std::string& text);
    void scheduleReconnect(const std::string& why);
    void reconnectLoop();

    SyncConfig config_;
    ix::WebSocket socket_;

    std::function<void(const std::string&)> onLiveSlide_;
    std::function<void(bool)> onConnectionChange_;

    std::atomic<bool> connected_{false};
    std::atomic<int> attempts_{0};
    std::atomic<bool> restarting_{false};   // close events from our own stop() are not failures

    std::mutex socketMtx_;                  // serializes stop()/start() on the socket

    std::mutex mtx_;
    std::condition_variable cv_;
    bool shutdown_ = false;
    bool active_ = false;
    std::optional<std::chrono::steady_clock::time_point> reconnectAt_;
    std::thread reconnectThread_;
};

} // namespace Net
