#pragma once

#include "CancellationToken.hpp"
#include "Resampler.hpp"
#include "Types.hpp"
#include "Worker.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rune {

/// Single-producer single-consumer float ring between the capture thread
/// and the session worker.  Pushes are all-or-nothing so that interleaved
/// frames never get split; a push that does not fit is dropped and counted.
class SampleRing {
public:
    explicit SampleRing(std::size_t capacity)
        : buffer_(capacity), capacity_(capacity), head_(0), tail_(0) {}

    std::size_t capacity() const { return capacity_; }

    /// Producer side.  Returns false (and drops the batch) if it does not fit.
    bool push(const float* data, std::size_t n) {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t tail = tail_.load(std::memory_order_acquire);
        if (capacity_ - (head - tail) < n) {
            overruns_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        for (std::size_t i = 0; i < n; ++i) {
            buffer_[(head + i) % capacity_] = data[i];
        }
        head_.store(head + n, std::memory_order_release);
        return true;
    }

    /// Consumer side.  Pop up to n samples, returns samples actually read.
    std::size_t pop(float* out, std::size_t n) {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        const std::size_t head = head_.load(std::memory_order_acquire);
        const std::size_t available = head - tail;
        const std::size_t to_read = n < available ? n : available;
        for (std::size_t i = 0; i < to_read; ++i) {
            out[i] = buffer_[(tail + i) % capacity_];
        }
        tail_.store(tail + to_read, std::memory_order_release);
        return to_read;
    }

    std::size_t size() const {
        return head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire);
    }

    uint64_t overruns() const { return overruns_.load(std::memory_order_relaxed); }

private:
    std::vector<float>       buffer_;
    const std::size_t        capacity_;
    std::atomic<std::size_t> head_;
    std::atomic<std::size_t> tail_;
    std::atomic<uint64_t>    overruns_{0};
};

/// Latest level summary, written by the capture thread and read by the
/// session worker.  Lock-free; a reader may see bands from two
/// neighbouring frames, which is harmless for a meter.
class LevelSlot {
public:
    void store(const LevelFrame& levels) {
        for (std::size_t i = 0; i < kLevelBands; ++i) {
            bands_[i].store(levels[i], std::memory_order_relaxed);
        }
        seq_.fetch_add(1, std::memory_order_release);
    }

    /// Copy the levels out if they changed since `seen`.
    bool take(uint64_t& seen, LevelFrame& out) const {
        const uint64_t seq = seq_.load(std::memory_order_acquire);
        if (seq == seen) return false;
        for (std::size_t i = 0; i < kLevelBands; ++i) {
            out[i] = bands_[i].load(std::memory_order_relaxed);
        }
        seen = seq;
        return true;
    }

private:
    std::array<std::atomic<float>, kLevelBands> bands_{};
    std::atomic<uint64_t>                       seq_{0};
};

/// Per-session tunables, copied from the controller at begin().
struct SessionConfig {
    std::chrono::milliseconds max_duration{120000};
    std::chrono::milliseconds completion_grace{1500};
    std::chrono::milliseconds engine_timeout{120000};
    std::chrono::milliseconds min_recording{100};
    std::chrono::milliseconds drain_interval{20};
    bool                      keep_recordings = false;
    std::string               recordings_dir;
    bool                      inject_text = false;
};

/// One recording-to-transcript attempt.  Owned by the SessionController's
/// single slot; the capture callbacks and worker tasks hold shared
/// references so a late callback never touches freed memory.
///
/// `status`, `transcript`, `revision` and `committed` are guarded by the
/// controller mutex.  The ring and level slot are written only by the
/// capture thread.  The resampler and `pcm` belong to the session worker
/// until the final drain, then to the pipeline worker.
struct Session {
    explicit Session(std::size_t ring_capacity);

    std::string                           id;
    std::chrono::steady_clock::time_point started;
    SessionConfig                         config;

    ProcessingStatus                      status = ProcessingStatus::idle;
    std::string                           transcript;
    uint64_t                              revision = 0;
    bool                                  committed = false;   // history row being committed
    CancellationToken                     token;

    StreamFormat                          format;
    SampleRing                            ring;
    LevelSlot                             levels;
    uint64_t                              levels_seen = 0;     // session worker only
    std::unique_ptr<Resampler>            resampler;
    std::vector<float>                    pcm;             // mono, engine rate
    int                                   pcm_rate = 16000;

    Worker::TimerId                       timeout_timer = 0;
    Worker::TimerId                       drain_timer   = 0;
};

/// Random UUID v4 string.
std::string generate_session_id();

} // namespace rune
