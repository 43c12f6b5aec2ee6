#include "LevelMeter.hpp"

#include <algorithm>
#include <cmath>

namespace rune {

LevelMeter::LevelMeter(float release)
    : release_(std::min(1.0f, std::max(0.0f, release))) {}

// ---------------------------------------------------------------------------
// process
// ---------------------------------------------------------------------------

const LevelFrame& LevelMeter::process(const float* samples,
                                      std::size_t frame_count,
                                      int channels) {
    if (!samples || frame_count == 0 || channels <= 0) {
        for (auto& band : levels_) band *= release_;
        return levels_;
    }

    const std::size_t per_band = std::max<std::size_t>(1, frame_count / kLevelBands);

    for (std::size_t band = 0; band < kLevelBands; ++band) {
        const std::size_t start = band * per_band;
        const std::size_t end   = (band + 1 == kLevelBands)
                                      ? frame_count
                                      : std::min(frame_count, start + per_band);

        float peak = 0.0f;
        for (std::size_t f = start; f < end; ++f) {
            float mixed = 0.0f;
            for (int c = 0; c < channels; ++c) {
                mixed += samples[f * channels + c];
            }
            mixed /= static_cast<float>(channels);
            peak = std::max(peak, std::fabs(mixed));
        }

        // NaN compares false everywhere; force it to silence.
        if (!(peak >= 0.0f)) peak = 0.0f;
        peak = std::min(1.0f, peak);

        const float decayed = levels_[band] * release_;
        levels_[band] = std::max(peak, decayed);
    }

    return levels_;
}

void LevelMeter::reset() {
    levels_.fill(0.0f);
}

// ---------------------------------------------------------------------------
// compute_rms
// ---------------------------------------------------------------------------

float LevelMeter::compute_rms(const float* samples, std::size_t count) {
    if (!samples || count == 0) return 0.0f;

    double sum = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * static_cast<double>(samples[i]);
    }
    float rms = static_cast<float>(std::sqrt(sum / static_cast<double>(count)));

    // Clamp to [0, 1].
    return std::min(1.0f, std::max(0.0f, rms));
}

} // namespace rune
