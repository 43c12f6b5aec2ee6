#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>

namespace rune {

/// Cooperative cancellation shared between the session controller and the
/// engines it calls.  Engines poll `should_abort()` at their own
/// boundaries; whisper.cpp polls it from its abort callback.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

    /// Arm a deadline for the next engine call.
    void set_deadline(Clock::time_point deadline) {
        std::lock_guard<std::mutex> lock(mu_);
        deadline_ = deadline;
    }

    void clear_deadline() {
        std::lock_guard<std::mutex> lock(mu_);
        deadline_.reset();
    }

    bool expired() const {
        std::lock_guard<std::mutex> lock(mu_);
        return deadline_ && Clock::now() >= *deadline_;
    }

    bool should_abort() const { return is_cancelled() || expired(); }

private:
    std::atomic<bool>                cancelled_{false};
    mutable std::mutex               mu_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace rune
