#pragma once

#include "AudioInput.hpp"

#include <chrono>
#include <cstdint>

namespace rune {

struct SyntheticInputConfig {
    int    sample_rate   = 48000;
    int    channels      = 1;
    float  frequency_hz  = 220.0f;
    float  amplitude     = 0.3f;
    int    chunk_frames  = 480;     // 10 ms at 48 kHz
    bool   realtime      = true;    // pace reads to the wall clock
    int64_t max_frames   = 0;       // 0 = endless
};

/// Sine-tone input used by `runed --synthetic` and by the tests.  Reports
/// a single device with id "synthetic".
class SyntheticAudioInput : public AudioInput {
public:
    explicit SyntheticAudioInput(SyntheticInputConfig config = {});

    std::vector<AudioDeviceDescriptor> list_devices() override;
    std::optional<AudioDeviceDescriptor> system_default_device() override;
    StreamFormat open(const std::string& device_id) override;
    std::size_t read(std::vector<float>& out) override;
    std::size_t max_frames_per_read() const override {
        return static_cast<std::size_t>(config_.chunk_frames);
    }
    void close() override;

    static constexpr const char* kDeviceId = "synthetic";

private:
    SyntheticInputConfig config_;
    bool                 open_ = false;
    int64_t              produced_ = 0;
    std::chrono::steady_clock::time_point started_;
};

} // namespace rune
