#pragma once

#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rune {

/// A source of interleaved float PCM.  AudioCaptureEngine drives one of
/// these from its capture thread.
///
/// Implementations:
/// - FfmpegAudioInput (libavdevice: pulse / alsa / avfoundation)
/// - SyntheticAudioInput (generated tone, for demos and tests)
class AudioInput {
public:
    virtual ~AudioInput() = default;

    /// Input devices currently known to the OS.
    virtual std::vector<AudioDeviceDescriptor> list_devices() = 0;

    /// The system default input, if there is one.
    virtual std::optional<AudioDeviceDescriptor> system_default_device() = 0;

    /// Open a device for capture.  An empty id means the system default.
    /// @throws RuneError(permission_denied) if the OS refuses access.
    /// @throws RuneError(device_unavailable) for every other failure.
    virtual StreamFormat open(const std::string& device_id) = 0;

    /// Block until the next batch is available and replace `out` with it.
    /// @return number of frames read; 0 means the stream ended.
    /// @throws RuneError(device_unavailable) if the device went away.
    virtual std::size_t read(std::vector<float>& out) = 0;

    /// Largest batch `read()` can return for the open stream, in frames.
    /// 0 when unknown.  Lets the caller size its buffer once.
    virtual std::size_t max_frames_per_read() const { return 0; }

    /// Release the device.  Safe to call when not open.
    virtual void close() = 0;
};

} // namespace rune
