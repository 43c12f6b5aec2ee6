#pragma once

#include "AudioInput.hpp"
#include "LevelMeter.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rune {

struct CaptureConfig {
    std::size_t               frame_size = 1024;                 // frames per AudioFrame
    std::chrono::milliseconds level_interval{50};                // level callback cadence
};

/// Owns the microphone for the duration of a session.
///
/// A dedicated capture thread pulls PCM from the AudioInput, cuts it into
/// fixed-size AudioFrames, computes the 8-band level summary and hands both
/// to the callbacks.  All buffers are sized in `start()`, so the capture
/// thread does not allocate in steady state.
class AudioCaptureEngine {
public:
    explicit AudioCaptureEngine(std::unique_ptr<AudioInput> input,
                                CaptureConfig config = {});
    ~AudioCaptureEngine();

    // Non-copyable.
    AudioCaptureEngine(const AudioCaptureEngine&) = delete;
    AudioCaptureEngine& operator=(const AudioCaptureEngine&) = delete;

    /// Open the device and start the capture thread.
    /// With no id the configured default is used, then the system default.
    /// @throws RuneError(already_recording) if capture is already running.
    /// @throws RuneError(permission_denied / device_unavailable) from the input.
    StreamFormat start(const std::optional<std::string>& device_id,
                       FrameCallback frame_cb,
                       LevelCallback level_cb = nullptr,
                       CaptureErrorCallback error_cb = nullptr);

    /// Stop capture and release the device.  Idempotent.
    void stop();

    bool is_capturing() const;

    /// Open and immediately close a device to see whether the OS lets us
    /// use it.  Throws exactly what `start()` would.
    void probe(const std::optional<std::string>& device_id);

    std::vector<AudioDeviceDescriptor> list_devices();
    std::optional<AudioDeviceDescriptor> system_default_device();

    /// Configured default device; empty optional means "system default".
    void set_default_device(std::optional<std::string> device_id);
    std::optional<std::string> default_device() const;

    /// RMS of the most recent frame in [0, 1].  Thread-safe.
    float current_level() const { return current_level_.load(); }

    /// Format of the running stream (zeroes when stopped).
    StreamFormat format() const;

private:
    /// Capture thread entry point.
    void capture_loop();

    std::string resolve_device(const std::optional<std::string>& device_id) const;

    std::unique_ptr<AudioInput> input_;
    CaptureConfig               config_;
    LevelMeter                  meter_;

    mutable std::mutex          mu_;          // start/stop/probe and the fields below
    std::mutex                  device_mu_;   // serializes enumeration against open/close
    std::optional<std::string>  default_device_;
    StreamFormat                format_;

    std::atomic<bool>           running_{false};
    std::atomic<float>          current_level_{0.0f};
    std::thread                 capture_thread_;

    FrameCallback               frame_cb_;
    LevelCallback               level_cb_;
    CaptureErrorCallback        error_cb_;

    // Capture-thread buffers, sized in start().
    std::vector<float>          read_buf_;
    std::vector<float>          frame_buf_;
};

} // namespace rune
