#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace rune {

/// Serial executor for orchestration work: state transitions, engine
/// calls and history writes all run here, one at a time, so they may block
/// without touching the capture thread.
///
/// Tasks run in submission order.  Delayed tasks run once their delay has
/// passed, after any task already queued.
class Worker {
public:
    using Task    = std::function<void()>;
    using TimerId = uint64_t;

    explicit Worker(std::string name = "worker");
    ~Worker();

    // Non-copyable.
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /// Queue a task.  Ignored after stop().
    void post(Task task);

    /// Queue a task to run after `delay`.  Returns an id for cancel_timer().
    TimerId post_after(std::chrono::milliseconds delay, Task task);

    /// Cancel a delayed task that has not started yet.
    /// @return true if the task was removed.
    bool cancel_timer(TimerId id);

    /// Finish the running task, drop everything still queued, join.
    void stop();

    /// True when called from the worker thread itself.
    bool on_worker_thread() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point due;
        Task              task;
    };

    void run();

    std::string                 name_;
    mutable std::mutex          mu_;
    std::condition_variable     cv_;
    std::deque<Task>            tasks_;
    std::map<TimerId, Timer>    timers_;
    TimerId                     next_timer_ = 1;
    bool                        stopping_ = false;
    std::thread                 thread_;
};

} // namespace rune
