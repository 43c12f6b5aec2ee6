#pragma once

#include "AudioInput.hpp"

#include <string>

struct AVFormatContext;
struct AVPacket;

namespace rune {

struct FfmpegInputConfig {
    std::string input_format;       // empty = platform default
    int         sample_rate = 48000;
    int         channels    = 1;
};

/// Captures from the microphone using FFmpeg's libavdevice.
///
/// Input format defaults to "pulse" on Linux and "avfoundation" on macOS;
/// "alsa" works as well.  Raw PCM packets (s16, s32 or f32) are converted
/// to interleaved float in `read()`.
class FfmpegAudioInput : public AudioInput {
public:
    explicit FfmpegAudioInput(FfmpegInputConfig config = {});
    ~FfmpegAudioInput() override;

    // Non-copyable.
    FfmpegAudioInput(const FfmpegAudioInput&) = delete;
    FfmpegAudioInput& operator=(const FfmpegAudioInput&) = delete;

    std::vector<AudioDeviceDescriptor> list_devices() override;
    std::optional<AudioDeviceDescriptor> system_default_device() override;
    StreamFormat open(const std::string& device_id) override;
    std::size_t read(std::vector<float>& out) override;
    std::size_t max_frames_per_read() const override { return max_read_frames_; }
    void close() override;

    const std::string& input_format() const { return config_.input_format; }

    static std::string default_input_format();

private:
    /// Device URL understood by the selected input format.
    std::string device_url(const std::string& device_id) const;

    FfmpegInputConfig config_;
    AVFormatContext*  fmt_ctx_ = nullptr;
    AVPacket*         packet_  = nullptr;
    int               codec_id_    = 0;   // AVCodecID of the raw PCM stream
    int               stream_index_ = 0;
    std::size_t       max_read_frames_ = 0;
    StreamFormat      format_;
};

} // namespace rune
