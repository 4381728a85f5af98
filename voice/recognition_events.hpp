#pragma once
#include <string>
#include <map>
#include <variant>
#include <chrono>
#include <cstdint>

namespace Voice {

// ------------------------------------------------------------
// Failures surfaced by a recognition session
// ------------------------------------------------------------
enum class SessionErrorKind {
    Permission,   // microphone denied or unavailable
    Auth,         // token fetch failed or credential rejected
    Connection,   // handshake timeout, unexpected close, backend unavailable
    Protocol      // malformed server event (never fatal)
};

const char* toString(SessionErrorKind kind);

struct SessionError {
    SessionErrorKind kind = SessionErrorKind::Connection;
    std::string code;     // errors.json key
    std::string detail;   // debug text
};

// ------------------------------------------------------------
// Server -> client events
// ------------------------------------------------------------
struct SessionBegins {
    std::string sessionId;
};

struct PartialTranscript {
    int64_t audioStart = 0;   // utterance offset in ms, the coalescing key
    std::string text;
};

struct FinalTranscript {
    int64_t audioStart = 0;
    std::string text;
};

struct SessionTerminated {};

struct ServerError {
    std::string message;
};

using ServerEvent = std::variant<SessionBegins,
                                 PartialTranscript,
                                 FinalTranscript,
                                 SessionTerminated,
                                 ServerError>;

// Unknown message_type, bad JSON or missing fields -> false with a Protocol error
bool parseServerEvent(const std::string& text, ServerEvent& out, SessionError* err = nullptr);

// Client -> server control message asking for a graceful end of session
std::string terminateMessage();

// ------------------------------------------------------------
// Final segment handed to listeners
// ------------------------------------------------------------
struct TranscriptSegment {
    uint64_t id = 0;                                   // monotonic per session
    std::string text;
    std::chrono::system_clock::time_point timestamp;
};

// ------------------------------------------------------------
// Interim coalescing: one entry per utterance offset, last write wins.
// Combined text joins entries by ascending offset.
// ------------------------------------------------------------
class InterimCoalescer {
public:
    // Returns the combined text after the update
    std::string update(int64_t audioStart, const std::string& text);
    void erase(int64_t audioStart);
    void clear();

    std::string combined() const;
    bool empty() const { return parts_.empty(); }
    size_t size() const { return parts_.size(); }

private:
    std::map<int64_t, std::string> parts_;
};

} // namespace Voice
