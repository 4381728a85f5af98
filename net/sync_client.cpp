#include "sync_client.hpp"
#include "logger.hpp"

#include <ixwebsocket/IXNetSystem.h>
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>
#include <iomanip>

namespace Net {

// ------------------------------------------------------------
// Roles
// ------------------------------------------------------------
const char* toString(SyncRole role) {
    switch (role) {
        case SyncRole::Off:        return "off";
        case SyncRole::Publisher:  return "publisher";
        case SyncRole::Subscriber: return "subscriber";
        case SyncRole::Peer:       return "peer";
    }
    return "off";
}

bool parseSyncRole(const std::string& name, SyncRole& out) {
    if (name == "off")        { out = SyncRole::Off;        return true; }
    if (name == "publisher")  { out = SyncRole::Publisher;  return true; }
    if (name == "subscriber") { out = SyncRole::Subscriber; return true; }
    if (name == "peer")       { out = SyncRole::Peer;       return true; }
    return false;
}

static std::string randomClientId() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream ss;
    ss << "slidefollow-" << std::hex << std::setw(12) << std::setfill('0')
       << (gen() & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

SyncConfig syncConfigFromJson(const nlohmann::json& section) {
    SyncConfig c;
    if (!section.is_object()) return c;

    std::string mode = section.value("mode", std::string("off"));
    if (!parseSyncRole(mode, c.role)) {
        LOG_ERROR("Sync", "Unknown sync mode '" + mode + "', sync disabled");
        c.role = SyncRole::Off;
    }
    c.host     = section.value("host", c.host);
    c.port     = section.value("port", c.port);
    c.clientId = section.value("client_id", c.clientId);
    if (section.contains("reconnect")) {
        c.reconnect = reconnectPolicyFromJson(section["reconnect"], c.reconnect);
    }
    return c;
}

// ------------------------------------------------------------
// Wire helpers
// ------------------------------------------------------------
std::string buildSyncUrl(const std::string& host, int port) {
    return "ws://" + host + ":" + std::to_string(port) + "/sync";
}

std::string buildJoinMessage(SyncRole role, const std::string& clientId) {
    return nlohmann::json{
        {"type", "sync_join"},
        {"clientMode", toString(role)},
        {"clientId", clientId}
    }.dump();
}

std::string buildLiveSlideMessage(const std::string& slideId, int64_t timestampMs) {
    return nlohmann::json{
        {"type", "sync_live_slide"},
        {"slideId", slideId},
        {"timestamp", timestampMs}
    }.dump();
}

bool parseSyncMessage(const std::string& text, SyncMessage& out, std::string* err) {
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
            if (err) *err = "Sync message without type";
            return false;
        }

        SyncMessage m;
        m.type = j["type"].get<std::string>();
        if (m.type == "sync_live_slide") {
            if (!j.contains("slideId") || !j["slideId"].is_string()) {
                if (err) *err = "sync_live_slide without slideId";
                return false;
            }
            m.slideId = j["slideId"].get<std::string>();
        }
        m.timestamp = j.value("timestamp", int64_t{0});
        m.message = j.value("message", std::string());
        out = std::move(m);
        return true;
    } catch (const std::exception& e) {
        if (err) *err = std::string("Bad sync message: ") + e.what();
        return false;
    }
}

// ------------------------------------------------------------
// Client
// ------------------------------------------------------------
SyncClient::SyncClient(SyncConfig config)
    : config_(std::move(config)) {
    if (config_.clientId.empty()) config_.clientId = randomClientId();

    ix::initNetSystem();
    socket_.disableAutomaticReconnection();
    socket_.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
        onSocketMessage(msg);
    });

    reconnectThread_ = std::thread(&SyncClient::reconnectLoop, this);
}

SyncClient::~SyncClient() {
    disconnect();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        shutdown_ = true;
    }
    cv_.notify_all();
    if (reconnectThread_.joinable()) reconnectThread_.join();
}

void SyncClient::setOnLiveSlide(std::function<void(const std::string&)> cb) {
    onLiveSlide_ = std::move(cb);
}

void SyncClient::setOnConnectionChange(std::function<void(bool)> cb) {
    onConnectionChange_ = std::move(cb);
}

bool SyncClient::connect(std::string* err) {
    if (config_.role == SyncRole::Off) {
        if (err) *err = "Sync is off";
        return false;
    }
    if (config_.host.empty() || config_.port <= 0 || config_.port > 65535) {
        if (err) *err = "Invalid sync address " + config_.host + ":" + std::to_string(config_.port);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        active_ = true;
        reconnectAt_.reset();
    }
    attempts_ = 0;

    std::string url = buildSyncUrl(config_.host, config_.port);
    LOG_DEBUG("Sync", "Connecting to " + url + " as " + toString(config_.role));

    std::lock_guard<std::mutex> socketLock(socketMtx_);
    restarting_ = true;
    socket_.stop();
    restarting_ = false;
    socket_.setUrl(url);
    socket_.start();
    return true;
}

void SyncClient::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        active_ = false;
        reconnectAt_.reset();
    }
    cv_.notify_all();
    {
        std::lock_guard<std::mutex> socketLock(socketMtx_);
        socket_.stop();
    }

    if (connected_.exchange(false) && onConnectionChange_) onConnectionChange_(false);
}

bool SyncClient::publishLiveSlide(const std::string& slideId) {
    if (config_.role != SyncRole::Publisher && config_.role != SyncRole::Peer) return false;
    if (!connected_) return false;

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return socket_.send(buildLiveSlideMessage(slideId, ms)).success;
}

void SyncClient::onSocketMessage(const ix::WebSocketMessagePtr& msg) {
    switch (msg->type) {
        case ix::WebSocketMessageType::Open:
            LOG_PHASE("Sync connected", true);
            attempts_ = 0;
            connected_ = true;
            if (!socket_.send(buildJoinMessage(config_.role, config_.clientId)).success) {
                LOG_ERROR("Sync", "Failed to send join message");
            }
            if (onConnectionChange_) onConnectionChange_(true);
            break;

        case ix::WebSocketMessageType::Message:
            if (!msg->binary) handleText(msg->str);
            break;

        case ix::WebSocketMessageType::Close:
            LOG_DEBUG("Sync", "Connection closed: " + std::to_string(msg->closeInfo.code) +
                              " " + msg->closeInfo.reason);
            if (connected_.exchange(false) && onConnectionChange_) onConnectionChange_(false);
            scheduleReconnect("closed");
            break;

        case ix::WebSocketMessageType::Error:
            LOG_ERROR("Sync", "Socket error: " + msg->errorInfo.reason);
            if (connected_.exchange(false) && onConnectionChange_) onConnectionChange_(false);
            scheduleReconnect(msg->errorInfo.reason);
            break;

        default:
            break;
    }
}

void SyncClient::handleText(const std::string& text) {
    SyncMessage m;
    std::string err;
    if (!parseSyncMessage(text, m, &err)) {
        LOG_ERROR("Sync", err);
        return;
    }

    if (m.type == "sync_welcome") {
        LOG_DEBUG("Sync", "Welcome received");
    }
    else if (m.type == "sync_live_slide") {
        if (config_.role != SyncRole::Subscriber && config_.role != SyncRole::Peer) return;
        LOG_TRACE("Sync", "Live slide from relay: " + m.slideId);
        if (onLiveSlide_) onLiveSlide_(m.slideId);
    }
    else if (m.type == "sync_error") {
        LOG_ERROR("Sync", "Relay error: " + m.message);
    }
}

// 🔹 Reconnect runs on its own thread: the socket cannot be restarted from its callback
void SyncClient::scheduleReconnect(const std::string& why) {
    if (restarting_) return;

    std::lock_guard<std::mutex> lock(mtx_);
    if (!active_ || reconnectAt_) return;

    int attempt = attempts_ + 1;
    if (!config_.reconnect.shouldRetry(attempt)) {
        LOG_ERROR("Sync", "Max reconnect attempts reached (" + why + ")");
        active_ = false;
        return;
    }

    attempts_ = attempt;
    auto delay = config_.reconnect.nextDelay(attempt);
    LOG_DEBUG("Sync", "Reconnecting in " + std::to_string(delay.count()) +
                      "ms (attempt " + std::to_string(attempt) + ")");
    reconnectAt_ = std::chrono::steady_clock::now() + delay;
    cv_.notify_all();
}

void SyncClient::reconnectLoop() {
    setThreadLabel("sync");
    std::unique_lock<std::mutex> lock(mtx_);
    while (!shutdown_) {
        if (!reconnectAt_) {
            cv_.wait(lock, [this]() { return shutdown_ || reconnectAt_.has_value(); });
            continue;
        }

        auto due = *reconnectAt_;
        if (cv_.wait_until(lock, due, [this, due]() {
                return shutdown_ || !reconnectAt_ || *reconnectAt_ != due;
            })) {
            continue;
        }

        reconnectAt_.reset();
        if (!active_) continue;
        lock.unlock();

        {
            std::lock_guard<std::mutex> socketLock(socketMtx_);
            bool stillActive = false;
            {
                std::lock_guard<std::mutex> check(mtx_);
                stillActive = active_;
            }
            if (stillActive) {
                restarting_ = true;
                socket_.stop();
                restarting_ = false;
                socket_.start();
            }
        }
        lock.lock();
    }
}

} // namespace Net
