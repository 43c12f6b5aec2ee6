#include "SyntheticAudioInput.hpp"

#include "Errors.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace rune {

SyntheticAudioInput::SyntheticAudioInput(SyntheticInputConfig config)
    : config_(config) {
    config_.sample_rate  = std::max(1, config_.sample_rate);
    config_.channels     = std::max(1, config_.channels);
    config_.chunk_frames = std::max(1, config_.chunk_frames);
}

std::vector<AudioDeviceDescriptor> SyntheticAudioInput::list_devices() {
    return {AudioDeviceDescriptor{kDeviceId, "Synthetic tone"}};
}

std::optional<AudioDeviceDescriptor> SyntheticAudioInput::system_default_device() {
    return AudioDeviceDescriptor{kDeviceId, "Synthetic tone"};
}

StreamFormat SyntheticAudioInput::open(const std::string& device_id) {
    if (!device_id.empty() && device_id != kDeviceId) {
        throw RuneError(ErrorCode::device_unavailable,
                        "Audio device '" + device_id + "' is not available");
    }
    open_     = true;
    produced_ = 0;
    started_  = std::chrono::steady_clock::now();
    return StreamFormat{config_.sample_rate, config_.channels};
}

std::size_t SyntheticAudioInput::read(std::vector<float>& out) {
    if (!open_) return 0;

    int64_t frames = config_.chunk_frames;
    if (config_.max_frames > 0) {
        frames = std::min<int64_t>(frames, config_.max_frames - produced_);
        if (frames <= 0) return 0;
    }

    if (config_.realtime) {
        const auto due = started_ + std::chrono::microseconds(
            (produced_ + frames) * 1000000 / config_.sample_rate);
        std::this_thread::sleep_until(due);
    }

    const double step = 2.0 * M_PI * config_.frequency_hz / config_.sample_rate;
    out.resize(static_cast<std::size_t>(frames * config_.channels));
    for (int64_t f = 0; f < frames; ++f) {
        const float v = config_.amplitude
                        * static_cast<float>(std::sin(step * static_cast<double>(produced_ + f)));
        for (int c = 0; c < config_.channels; ++c) {
            out[static_cast<std::size_t>(f * config_.channels + c)] = v;
        }
    }
    produced_ += frames;
    return static_cast<std::size_t>(frames);
}

void SyntheticAudioInput::close() {
    open_ = false;
}

} // namespace rune
