#pragma once
#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <atomic>

namespace Audio {

// Bounded hand-off between the capture thread and the network pump.
// push() never waits: when full, the oldest unsent frame is dropped.
class FrameQueue {
public:
    explicit FrameQueue(size_t capacity);

    // Returns false when an older frame had to be dropped (or the queue is closed)
    bool push(std::string frame);

    std::optional<std::string> tryPop();
    std::optional<std::string> waitPop(std::chrono::milliseconds timeout);

    void close();       // wakes waiters; later pushes are discarded
    void reopen();      // empty and accepting again
    void clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t dropped() const { return dropped_.load(); }

private:
    const size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::string> frames_;
    bool closed_ = false;
    std::atomic<size_t> dropped_{0};
};

} // namespace Audio
