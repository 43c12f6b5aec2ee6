#include "FfmpegAudioInput.hpp"

#include "Errors.hpp"
#include "Log.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <thread>
#include <utility>

extern "C" {
#include <libavdevice/avdevice.h>
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
}

namespace rune {

namespace {

constexpr const char* kTag = "capture";

std::string av_error_string(int err) {
    char errbuf[256];
    av_strerror(err, errbuf, sizeof(errbuf));
    return errbuf;
}

/// RAII for the list returned by avdevice_list_input_sources().
class DeviceList {
public:
    explicit DeviceList(const AVInputFormat* fmt) {
        ret_ = avdevice_list_input_sources(fmt, nullptr, nullptr, &list_);
    }
    ~DeviceList() {
        if (list_) avdevice_free_list_devices(&list_);
    }
    bool ok() const { return ret_ >= 0 && list_ != nullptr; }
    int error() const { return ret_; }
    const AVDeviceInfoList* operator->() const { return list_; }

private:
    AVDeviceInfoList* list_ = nullptr;
    int ret_ = 0;
};

AudioDeviceDescriptor to_descriptor(const AVDeviceInfo* info) {
    AudioDeviceDescriptor d;
    d.id   = info->device_name ? info->device_name : "";
    d.name = (info->device_description && *info->device_description)
                 ? info->device_description
                 : d.id;
    return d;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

FfmpegAudioInput::FfmpegAudioInput(FfmpegInputConfig config)
    : config_(std::move(config)) {
    avdevice_register_all();
    if (config_.input_format.empty()) {
        config_.input_format = default_input_format();
    }
}

FfmpegAudioInput::~FfmpegAudioInput() {
    close();
}

std::string FfmpegAudioInput::default_input_format() {
#if defined(__APPLE__)
    return "avfoundation";
#else
    return "pulse";
#endif
}

std::string FfmpegAudioInput::device_url(const std::string& device_id) const {
    if (config_.input_format == "avfoundation") {
        // "<video>:<audio>" -- audio only.
        return ":" + (device_id.empty() ? std::string("default") : device_id);
    }
    return device_id.empty() ? std::string("default") : device_id;
}

// ---------------------------------------------------------------------------
// Device enumeration
// ---------------------------------------------------------------------------

std::vector<AudioDeviceDescriptor> FfmpegAudioInput::list_devices() {
    std::vector<AudioDeviceDescriptor> devices;

    const AVInputFormat* fmt = av_find_input_format(config_.input_format.c_str());
    if (!fmt) return devices;

    DeviceList list(fmt);
    if (!list.ok()) {
        log::debug(kTag, "device listing not supported by '" + config_.input_format
                             + "': " + av_error_string(list.error()));
        return devices;
    }

    for (int i = 0; i < list->nb_devices; ++i) {
        devices.push_back(to_descriptor(list->devices[i]));
    }
    return devices;
}

std::optional<AudioDeviceDescriptor> FfmpegAudioInput::system_default_device() {
    const AVInputFormat* fmt = av_find_input_format(config_.input_format.c_str());
    if (!fmt) return std::nullopt;

    DeviceList list(fmt);
    if (!list.ok() || list->nb_devices == 0) return std::nullopt;

    int idx = list->default_device;
    if (idx < 0 || idx >= list->nb_devices) idx = 0;
    return to_descriptor(list->devices[idx]);
}

// ---------------------------------------------------------------------------
// open
// ---------------------------------------------------------------------------

StreamFormat FfmpegAudioInput::open(const std::string& device_id) {
    close();

    const AVInputFormat* fmt = av_find_input_format(config_.input_format.c_str());
    if (!fmt) {
        throw RuneError(ErrorCode::device_unavailable,
                        "Input format '" + config_.input_format + "' is not available");
    }

    // A named device must still be present.  Formats that cannot list
    // devices are trusted.
    if (!device_id.empty()) {
        DeviceList list(fmt);
        if (list.ok()) {
            bool found = false;
            for (int i = 0; i < list->nb_devices && !found; ++i) {
                const char* name = list->devices[i]->device_name;
                found = name && device_id == name;
            }
            if (!found) {
                throw RuneError(ErrorCode::device_unavailable,
                                "Audio device '" + device_id + "' is not available");
            }
        }
    }

    AVDictionary* options = nullptr;
    av_dict_set(&options, "sample_rate", std::to_string(config_.sample_rate).c_str(), 0);
    av_dict_set(&options, "channels", std::to_string(config_.channels).c_str(), 0);

    AVFormatContext* ctx = nullptr;
    const std::string url = device_url(device_id);
    int ret = avformat_open_input(&ctx, url.c_str(), fmt, &options);
    av_dict_free(&options);
    if (ret < 0) {
        const std::string msg = "Failed to open audio device '" + url + "': " + av_error_string(ret);
        if (ret == AVERROR(EACCES) || ret == AVERROR(EPERM)) {
            throw RuneError(ErrorCode::permission_denied, msg);
        }
        throw RuneError(ErrorCode::device_unavailable, msg);
    }

    ret = avformat_find_stream_info(ctx, nullptr);
    if (ret < 0) {
        avformat_close_input(&ctx);
        throw RuneError(ErrorCode::device_unavailable,
                        "Failed to read stream info: " + av_error_string(ret));
    }

    int audio_idx = av_find_best_stream(ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_idx < 0) {
        avformat_close_input(&ctx);
        throw RuneError(ErrorCode::device_unavailable, "Device has no audio stream");
    }

    const AVCodecParameters* par = ctx->streams[audio_idx]->codecpar;
    switch (par->codec_id) {
        case AV_CODEC_ID_PCM_S16LE:
        case AV_CODEC_ID_PCM_S32LE:
        case AV_CODEC_ID_PCM_F32LE:
            break;
        default:
            avformat_close_input(&ctx);
            throw RuneError(ErrorCode::device_unavailable,
                            std::string("Unsupported capture sample format: ")
                                + avcodec_get_name(par->codec_id));
    }

    packet_ = av_packet_alloc();
    if (!packet_) {
        avformat_close_input(&ctx);
        throw RuneError(ErrorCode::device_unavailable, "Out of memory allocating packet");
    }

    fmt_ctx_      = ctx;
    stream_index_ = audio_idx;
    codec_id_     = par->codec_id;
    format_.sample_rate = par->sample_rate;
    format_.channels    = std::max(1, par->ch_layout.nb_channels);
    // Raw PCM demuxers rarely announce a packet size; a second of audio is
    // more than any of them hand out at once.
    max_read_frames_ = static_cast<std::size_t>(
        par->frame_size > 0 ? par->frame_size : std::max(1, par->sample_rate));

    log::info(kTag, "opened '" + url + "' via " + config_.input_format + " ("
                        + std::to_string(format_.sample_rate) + " Hz, "
                        + std::to_string(format_.channels) + " ch)");
    return format_;
}

// ---------------------------------------------------------------------------
// read  (capture thread)
// ---------------------------------------------------------------------------

std::size_t FfmpegAudioInput::read(std::vector<float>& out) {
    if (!fmt_ctx_) return 0;

    for (;;) {
        int ret = av_read_frame(fmt_ctx_, packet_);
        if (ret == AVERROR(EAGAIN)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            continue;
        }
        if (ret == AVERROR_EOF) {
            return 0;
        }
        if (ret < 0) {
            throw RuneError(ErrorCode::device_unavailable,
                            "Audio device read failed: " + av_error_string(ret));
        }

        if (packet_->stream_index != stream_index_ || !packet_->data || packet_->size <= 0) {
            av_packet_unref(packet_);
            continue;
        }

        const std::size_t bytes = static_cast<std::size_t>(packet_->size);
        std::size_t count = 0;

        switch (codec_id_) {
            case AV_CODEC_ID_PCM_S16LE: {
                count = bytes / sizeof(int16_t);
                out.resize(count);
                for (std::size_t i = 0; i < count; ++i) {
                    int16_t v;
                    std::memcpy(&v, packet_->data + i * sizeof(int16_t), sizeof(v));
                    out[i] = static_cast<float>(v) / 32768.0f;
                }
                break;
            }
            case AV_CODEC_ID_PCM_S32LE: {
                count = bytes / sizeof(int32_t);
                out.resize(count);
                for (std::size_t i = 0; i < count; ++i) {
                    int32_t v;
                    std::memcpy(&v, packet_->data + i * sizeof(int32_t), sizeof(v));
                    out[i] = static_cast<float>(static_cast<double>(v) / 2147483648.0);
                }
                break;
            }
            default: {
                count = bytes / sizeof(float);
                out.resize(count);
                std::memcpy(out.data(), packet_->data, count * sizeof(float));
                break;
            }
        }

        av_packet_unref(packet_);
        const std::size_t frames = count / static_cast<std::size_t>(format_.channels);
        if (frames == 0) continue;
        out.resize(frames * static_cast<std::size_t>(format_.channels));
        return frames;
    }
}

// ---------------------------------------------------------------------------
// close
// ---------------------------------------------------------------------------

void FfmpegAudioInput::close() {
    if (packet_) {
        av_packet_free(&packet_);
        packet_ = nullptr;
    }
    if (fmt_ctx_) {
        avformat_close_input(&fmt_ctx_);
        fmt_ctx_ = nullptr;
    }
    format_ = StreamFormat{};
    max_read_frames_ = 0;
}

} // namespace rune
