#include "Resampler.hpp"

#include "Errors.hpp"

#include <string>

extern "C" {
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
#include <libavutil/opt.h>
}

namespace rune {

namespace {

std::string av_error_string(int err) {
    char errbuf[256];
    av_strerror(err, errbuf, sizeof(errbuf));
    return errbuf;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

Resampler::Resampler(int input_rate, int input_channels, int output_rate)
    : input_rate_(input_rate),
      input_channels_(input_channels),
      output_rate_(output_rate) {
    if (input_rate <= 0 || output_rate <= 0 || input_channels <= 0) {
        throw RuneError(ErrorCode::invalid_argument,
                        "Resampler needs positive rates and channel count");
    }
    passthrough_ = (input_rate_ == output_rate_ && input_channels_ == 1);
    open_context();
}

Resampler::~Resampler() {
    close_context();
}

// ---------------------------------------------------------------------------
// open_context / close_context
// ---------------------------------------------------------------------------

void Resampler::open_context() {
    if (passthrough_) return;

    AVChannelLayout in_layout;
    av_channel_layout_default(&in_layout, input_channels_);
    AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;

    SwrContext* swr = nullptr;
    int ret = swr_alloc_set_opts2(&swr,
        &out_layout, AV_SAMPLE_FMT_FLT, output_rate_,
        &in_layout, AV_SAMPLE_FMT_FLT, input_rate_,
        0, nullptr);
    av_channel_layout_uninit(&in_layout);

    if (ret >= 0) ret = swr_init(swr);
    if (ret < 0) {
        if (swr) swr_free(&swr);
        throw RuneError(ErrorCode::invalid_argument,
                        "Failed to initialize audio resampler: " + av_error_string(ret));
    }
    swr_ = swr;
}

void Resampler::close_context() {
    if (swr_) {
        swr_free(&swr_);
        swr_ = nullptr;
    }
}

// ---------------------------------------------------------------------------
// process / flush / reset
// ---------------------------------------------------------------------------

std::size_t Resampler::process(const float* input, std::size_t frame_count,
                               std::vector<float>& out) {
    if (!input || frame_count == 0) return 0;

    if (passthrough_) {
        out.insert(out.end(), input, input + frame_count);
        return frame_count;
    }

    const int in_frames = static_cast<int>(frame_count);
    const int max_out = static_cast<int>(av_rescale_rnd(
        swr_get_delay(swr_, input_rate_) + in_frames,
        output_rate_, input_rate_, AV_ROUND_UP));
    if (max_out <= 0) return 0;

    const std::size_t base = out.size();
    out.resize(base + static_cast<std::size_t>(max_out));

    uint8_t* out_buf = reinterpret_cast<uint8_t*>(out.data() + base);
    const uint8_t* in_buf = reinterpret_cast<const uint8_t*>(input);

    int converted = swr_convert(swr_, &out_buf, max_out, &in_buf, in_frames);
    if (converted < 0) {
        out.resize(base);
        throw RuneError(ErrorCode::engine_failure,
                        "Resampling failed: " + av_error_string(converted));
    }
    out.resize(base + static_cast<std::size_t>(converted));
    return static_cast<std::size_t>(converted);
}

std::size_t Resampler::flush(std::vector<float>& out) {
    if (passthrough_ || !swr_) return 0;

    std::size_t total = 0;
    for (;;) {
        const int pending = static_cast<int>(swr_get_delay(swr_, output_rate_)) + 32;
        const std::size_t base = out.size();
        out.resize(base + static_cast<std::size_t>(pending));
        uint8_t* out_buf = reinterpret_cast<uint8_t*>(out.data() + base);

        int converted = swr_convert(swr_, &out_buf, pending, nullptr, 0);
        if (converted <= 0) {
            out.resize(base);
            break;
        }
        out.resize(base + static_cast<std::size_t>(converted));
        total += static_cast<std::size_t>(converted);
    }
    return total;
}

void Resampler::reset() {
    close_context();
    open_context();
}

// ---------------------------------------------------------------------------
// resample  (static)
// ---------------------------------------------------------------------------

std::vector<float> Resampler::resample(const std::vector<float>& input,
                                       int input_rate,
                                       int output_rate) {
    if (input.empty() || input_rate <= 0 || output_rate <= 0) {
        return {};
    }

    if (input_rate == output_rate) {
        return input;   // no-op
    }

    Resampler r(input_rate, 1, output_rate);
    std::vector<float> output;
    output.reserve(static_cast<std::size_t>(
        av_rescale_rnd(static_cast<int64_t>(input.size()), output_rate, input_rate, AV_ROUND_UP)) + 64);
    r.process(input.data(), input.size(), output);
    r.flush(output);
    return output;
}

} // namespace rune
