#include "Worker.hpp"

#include "Log.hpp"

#include <exception>
#include <utility>

namespace rune {

Worker::Worker(std::string name)
    : name_(std::move(name)) {
    thread_ = std::thread(&Worker::run, this);
}

Worker::~Worker() {
    stop();
}

void Worker::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_) return;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

Worker::TimerId Worker::post_after(std::chrono::milliseconds delay, Task task) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_) return 0;
        id = next_timer_++;
        timers_.emplace(id, Timer{Clock::now() + delay, std::move(task)});
    }
    cv_.notify_one();
    return id;
}

bool Worker::cancel_timer(TimerId id) {
    std::lock_guard<std::mutex> lock(mu_);
    return timers_.erase(id) > 0;
}

void Worker::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_ && !thread_.joinable()) return;
        stopping_ = true;
        tasks_.clear();
        timers_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
        thread_.join();
    }
}

bool Worker::on_worker_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

void Worker::run() {
    std::unique_lock<std::mutex> lock(mu_);
    while (!stopping_) {
        Task task;

        if (!tasks_.empty()) {
            task = std::move(tasks_.front());
            tasks_.pop_front();
        } else if (!timers_.empty()) {
            auto next = timers_.begin();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.due < next->second.due) next = it;
            }
            const Clock::time_point due = next->second.due;
            if (due <= Clock::now()) {
                task = std::move(next->second.task);
                timers_.erase(next);
            } else {
                cv_.wait_until(lock, due);
                continue;
            }
        } else {
            cv_.wait(lock);
            continue;
        }

        lock.unlock();
        try {
            if (task) task();
        } catch (const std::exception& e) {
            log::error(name_.c_str(), std::string("task failed: ") + e.what());
        }
        lock.lock();
    }
}

} // namespace rune
