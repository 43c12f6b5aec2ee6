#pragma once

#include <cstddef>
#include <vector>

// Forward-declare so FFmpeg headers stay out of the public interface.
struct SwrContext;

namespace rune {

/// Streaming conversion from captured PCM (any rate, interleaved float,
/// 1..N channels) to mono float32 at the transcription rate, using FFmpeg's
/// libswresample.
///
/// One instance serves one session.  The SwrContext keeps its filter
/// history between `process()` calls, so splitting a stream into buffers
/// gives the same output as converting it in one piece.  `flush()` drains
/// the filter tail at the end of the session.
class Resampler {
public:
    /// @throws RuneError(invalid_argument) for non-positive rates/channels.
    Resampler(int input_rate, int input_channels, int output_rate);
    ~Resampler();

    // Non-copyable.
    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    /// Convert `frame_count` interleaved frames; output is appended to `out`.
    /// @return number of samples appended.
    std::size_t process(const float* input, std::size_t frame_count,
                        std::vector<float>& out);

    /// Emit whatever is still buffered in the filter.
    std::size_t flush(std::vector<float>& out);

    /// Discard all filter state.
    void reset();

    int input_rate() const { return input_rate_; }
    int input_channels() const { return input_channels_; }
    int output_rate() const { return output_rate_; }

    /// One-shot mono conversion (tests, offline use).
    static std::vector<float> resample(const std::vector<float>& input,
                                       int input_rate,
                                       int output_rate);

private:
    void open_context();
    void close_context();

    int         input_rate_;
    int         input_channels_;
    int         output_rate_;
    bool        passthrough_ = false;
    SwrContext* swr_ = nullptr;
};

} // namespace rune
