#include "recognition_backend.hpp"

namespace Voice {

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Idle:       return "idle";
        case SessionState::Connecting: return "connecting";
        case SessionState::Streaming:  return "streaming";
    }
    return "unknown";
}

// ------------------------------------------------------------
// ListenerTable
// ------------------------------------------------------------
uint64_t ListenerTable::add(TranscriptListeners listeners) {
    std::lock_guard<std::mutex> lock(mtx_);
    uint64_t id = nextId_++;
    listeners_.emplace(id, std::move(listeners));
    return id;
}

void ListenerTable::remove(uint64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    listeners_.erase(id);
}

size_t ListenerTable::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return listeners_.size();
}

// Copy out so callbacks run without the lock held
std::vector<TranscriptListeners> ListenerTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<TranscriptListeners> out;
    out.reserve(listeners_.size());
    for (const auto& [id, l] : listeners_) {
        (void)id;
        out.push_back(l);
    }
    return out;
}

void ListenerTable::emitInterim(const std::string& combined) const {
    for (const auto& l : snapshot()) {
        if (l.onInterim) l.onInterim(combined);
    }
}

void ListenerTable::emitFinal(const TranscriptSegment& segment) const {
    for (const auto& l : snapshot()) {
        if (l.onFinal) l.onFinal(segment);
    }
}

void ListenerTable::emitError(const SessionError& error) const {
    for (const auto& l : snapshot()) {
        if (l.onError) l.onError(error);
    }
}

void ListenerTable::emitState(SessionState state) const {
    for (const auto& l : snapshot()) {
        if (l.onStateChange) l.onStateChange(state);
    }
}

// ------------------------------------------------------------
// Subscription
// ------------------------------------------------------------
Subscription::Subscription(std::weak_ptr<ListenerTable> table, uint64_t id)
    : table_(std::move(table)), id_(id) {}

Subscription::~Subscription() {
    reset();
}

Subscription::Subscription(Subscription&& other) noexcept
    : table_(std::move(other.table_)), id_(other.id_) {
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        table_ = std::move(other.table_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void Subscription::reset() {
    if (id_ == 0) return;
    if (auto table = table_.lock()) {
        table->remove(id_);
    }
    table_.reset();
    id_ = 0;
}

bool Subscription::active() const {
    return id_ != 0 && !table_.expired();
}

// ------------------------------------------------------------
// RecognitionBackend
// ------------------------------------------------------------
Subscription RecognitionBackend::subscribe(TranscriptListeners listeners) {
    uint64_t id = listeners_->add(std::move(listeners));
    return Subscription(listeners_, id);
}

} // namespace Voice
