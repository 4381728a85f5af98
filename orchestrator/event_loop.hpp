#pragma once
#include <functional>
#include <deque>
#include <queue>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <chrono>
#include <cstdint>

namespace App {

// ------------------------------------------------------------
// Single consumer task queue. Everything that touches follow state
// runs here, one task at a time, in the order it was posted.
// ------------------------------------------------------------
class EventLoop {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task);
    void postAfter(std::chrono::milliseconds delay, Task task);

    // Consumer thread
    void start();
    void stop();                 // pending tasks are discarded
    bool running() const;
    bool isLoopThread() const;

    // Manual pumping (tests, or a loop driven by the caller)
    bool pumpOnce();             // runs one ready task, false if none
    size_t runPending();         // runs everything ready right now
    size_t pendingCount() const;

private:
    struct Timed {
        Clock::time_point due;
        uint64_t seq;
        Task task;
    };
    struct Later {
        bool operator()(const Timed& a, const Timed& b) const {
            return a.due != b.due ? a.due > b.due : a.seq > b.seq;
        }
    };

    void promoteDueLocked(Clock::time_point now);
    void runTask(Task& task);
    void threadMain();

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Task> ready_;
    std::priority_queue<Timed, std::vector<Timed>, Later> timers_;
    uint64_t nextSeq_ = 0;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace App
