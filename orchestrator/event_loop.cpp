#include "event_loop.hpp"
#include "logger.hpp"

#include <exception>

namespace App {

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        ready_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void EventLoop::postAfter(std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        timers_.push({ Clock::now() + delay, nextSeq_++, std::move(task) });
    }
    cv_.notify_one();
}

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (thread_.joinable()) return;
    stopping_ = false;
    thread_ = std::thread(&EventLoop::threadMain, this);
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
        ready_.clear();
        timers_ = decltype(timers_)();
    }
    cv_.notify_all();

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool EventLoop::running() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return thread_.joinable() && !stopping_;
}

bool EventLoop::isLoopThread() const {
    return thread_.get_id() == std::this_thread::get_id();
}

size_t EventLoop::pendingCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return ready_.size() + timers_.size();
}

void EventLoop::promoteDueLocked(Clock::time_point now) {
    while (!timers_.empty() && timers_.top().due <= now) {
        ready_.push_back(timers_.top().task);
        timers_.pop();
    }
}

void EventLoop::runTask(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        LOG_ERROR("EventLoop", std::string("Task threw: ") + e.what());
    }
}

bool EventLoop::pumpOnce() {
    Task task;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        promoteDueLocked(Clock::now());
        if (ready_.empty()) return false;
        task = std::move(ready_.front());
        ready_.pop_front();
    }
    runTask(task);
    return true;
}

size_t EventLoop::runPending() {
    size_t budget = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        promoteDueLocked(Clock::now());
        budget = ready_.size();
    }

    // Tasks posted while draining wait for the next call
    size_t ran = 0;
    while (ran < budget && pumpOnce()) ++ran;
    return ran;
}

void EventLoop::threadMain() {
    setThreadLabel("loop");
    LOG_DEBUG("EventLoop", "Started");

    std::unique_lock<std::mutex> lock(mtx_);
    while (!stopping_) {
        promoteDueLocked(Clock::now());

        if (ready_.empty()) {
            if (timers_.empty()) {
                cv_.wait(lock);
            } else {
                cv_.wait_until(lock, timers_.top().due);
            }
            continue;
        }

        Task task = std::move(ready_.front());
        ready_.pop_front();

        lock.unlock();
        runTask(task);
        lock.lock();
    }

    LOG_DEBUG("EventLoop", "Stopped");
}

} // namespace App
