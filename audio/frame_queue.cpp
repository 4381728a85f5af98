#include "frame_queue.hpp"

#include <algorithm>

namespace Audio {

FrameQueue::FrameQueue(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

bool FrameQueue::push(std::string frame) {
    bool droppedOldest = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (closed_) return false;

        if (frames_.size() >= capacity_) {
            frames_.pop_front();
            ++dropped_;
            droppedOldest = true;
        }
        frames_.push_back(std::move(frame));
    }
    cv_.notify_one();
    return !droppedOldest;
}

std::optional<std::string> FrameQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (frames_.empty()) return std::nullopt;

    std::string frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

std::optional<std::string> FrameQueue::waitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !frames_.empty(); });
    if (frames_.empty()) return std::nullopt;

    std::string frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

void FrameQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

void FrameQueue::reopen() {
    std::lock_guard<std::mutex> lock(mtx_);
    frames_.clear();
    closed_ = false;
}

void FrameQueue::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    frames_.clear();
}

size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return frames_.size();
}

} // namespace Audio
