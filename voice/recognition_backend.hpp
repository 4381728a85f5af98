#pragma once
#include <string>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <map>
#include <vector>
#include <cstdint>

#include "recognition_events.hpp"

namespace Voice {

// Idle -> Connecting -> Streaming -> Idle. A failure in any state lands in
// Idle with the error reported through onError first.
enum class SessionState {
    Idle,
    Connecting,
    Streaming
};

const char* toString(SessionState state);

struct StartResult {
    bool success = false;
    bool cancelled = false;     // stop() arrived before streaming began
    SessionError error;         // valid when !success && !cancelled
};

// Callbacks run on the session's own threads. Receivers that need a
// single-threaded view re-post them (see EventLoop).
struct TranscriptListeners {
    std::function<void(const std::string& combined)> onInterim;
    std::function<void(const TranscriptSegment& segment)> onFinal;
    std::function<void(const SessionError& error)> onError;
    std::function<void(SessionState state)> onStateChange;
};

class ListenerTable {
public:
    uint64_t add(TranscriptListeners listeners);
    void remove(uint64_t id);
    size_t size() const;

    void emitInterim(const std::string& combined) const;
    void emitFinal(const TranscriptSegment& segment) const;
    void emitError(const SessionError& error) const;
    void emitState(SessionState state) const;

private:
    std::vector<TranscriptListeners> snapshot() const;

    mutable std::mutex mtx_;
    uint64_t nextId_ = 1;
    std::map<uint64_t, TranscriptListeners> listeners_;
};

// Unsubscribes on destruction or reset(). Safe to outlive the session.
class Subscription {
public:
    Subscription() = default;
    Subscription(std::weak_ptr<ListenerTable> table, uint64_t id);
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset();
    bool active() const;

private:
    std::weak_ptr<ListenerTable> table_;
    uint64_t id_ = 0;
};

// ------------------------------------------------------------
// Common contract of the cloud and local recognizers
// ------------------------------------------------------------
class RecognitionBackend {
public:
    virtual ~RecognitionBackend() = default;

    // Completes once streaming has begun, failed, or was cancelled by stop()
    virtual std::shared_future<StartResult> start() = 0;

    // Idempotent. Cancels an in-flight start.
    virtual void stop() = 0;

    virtual SessionState state() const = 0;
    virtual std::string name() const = 0;

    Subscription subscribe(TranscriptListeners listeners);
    size_t listenerCount() const { return listeners_->size(); }

protected:
    std::shared_ptr<ListenerTable> listeners_ = std::make_shared<ListenerTable>();
};

} // namespace Voice
