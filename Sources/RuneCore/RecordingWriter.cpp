#include "RecordingWriter.hpp"

#include "Errors.hpp"
#include "Log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <system_error>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
}

namespace rune {

namespace {

constexpr const char* kTag = "recording";
constexpr int kSamplesPerPacket = 4096;

std::string av_error_string(int err) {
    char errbuf[256];
    av_strerror(err, errbuf, sizeof(errbuf));
    return errbuf;
}

/// Owns the muxer context and the output file.
class OutputFile {
public:
    explicit OutputFile(const std::string& path) : path_(path) {}
    ~OutputFile() {
        if (ctx_) {
            if (ctx_->pb) avio_closep(&ctx_->pb);
            avformat_free_context(ctx_);
        }
        if (!done_) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }
    AVFormatContext*& ctx() { return ctx_; }
    void finished() { done_ = true; }

private:
    std::string      path_;
    AVFormatContext* ctx_ = nullptr;
    bool             done_ = false;
};

[[noreturn]] void fail(const std::string& what, int err) {
    throw RuneError(ErrorCode::storage_unavailable, what + ": " + av_error_string(err));
}

} // namespace

void write_wav(const std::string& path, const std::vector<float>& pcm, int sample_rate) {
    if (sample_rate <= 0) {
        throw RuneError(ErrorCode::invalid_argument, "Sample rate must be positive");
    }

    const std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw RuneError(ErrorCode::storage_unavailable,
                            "Cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    OutputFile out(path);

    int ret = avformat_alloc_output_context2(&out.ctx(), nullptr, "wav", path.c_str());
    if (ret < 0 || !out.ctx()) fail("Cannot allocate wav muxer", ret);
    AVFormatContext* ofmt = out.ctx();

    AVStream* stream = avformat_new_stream(ofmt, nullptr);
    if (!stream) fail("Cannot add audio stream", AVERROR(ENOMEM));

    AVCodecParameters* par = stream->codecpar;
    par->codec_type            = AVMEDIA_TYPE_AUDIO;
    par->codec_id              = AV_CODEC_ID_PCM_S16LE;
    par->format                = AV_SAMPLE_FMT_S16;
    par->sample_rate           = sample_rate;
    par->bits_per_coded_sample = 16;
    par->block_align           = 2;
    par->bit_rate              = static_cast<int64_t>(sample_rate) * 16;
    av_channel_layout_default(&par->ch_layout, 1);
    stream->time_base = AVRational{1, sample_rate};

    ret = avio_open(&ofmt->pb, path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) fail("Cannot open " + path, ret);

    ret = avformat_write_header(ofmt, nullptr);
    if (ret < 0) fail("Cannot write wav header", ret);

    AVPacket* pkt = av_packet_alloc();
    if (!pkt) fail("Cannot allocate packet", AVERROR(ENOMEM));

    int64_t pts = 0;
    for (std::size_t offset = 0; offset < pcm.size(); offset += kSamplesPerPacket) {
        const std::size_t n = std::min<std::size_t>(kSamplesPerPacket, pcm.size() - offset);
        ret = av_new_packet(pkt, static_cast<int>(n * sizeof(int16_t)));
        if (ret < 0) {
            av_packet_free(&pkt);
            fail("Cannot allocate packet", ret);
        }
        for (std::size_t i = 0; i < n; ++i) {
            const float clamped = std::max(-1.0f, std::min(1.0f, pcm[offset + i]));
            const auto s = static_cast<int16_t>(clamped * 32767.0f);
            std::memcpy(pkt->data + i * sizeof(int16_t), &s, sizeof(s));
        }
        pkt->stream_index = stream->index;
        pkt->pts = pkt->dts = pts;
        pkt->duration = static_cast<int64_t>(n);
        pts += static_cast<int64_t>(n);

        ret = av_interleaved_write_frame(ofmt, pkt);
        if (ret < 0) {
            av_packet_free(&pkt);
            fail("Cannot write samples", ret);
        }
    }
    av_packet_free(&pkt);

    ret = av_write_trailer(ofmt);
    if (ret < 0) fail("Cannot finish wav file", ret);

    out.finished();
    log::debug(kTag, "wrote " + std::to_string(pcm.size()) + " samples to " + path);
}

} // namespace rune
