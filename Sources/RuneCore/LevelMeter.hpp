#pragma once

#include "Types.hpp"

#include <cstddef>

namespace rune {

/// Turns PCM batches into the 8-band level arrays shown by the HUD.
///
/// The batch is split into kLevelBands equal time slices; each band is the
/// peak absolute amplitude of its slice (channels are averaged first).
/// Bands rise instantly and fall by `release` per update so the meter does
/// not flicker.  Allocation-free; safe to call from the capture thread.
class LevelMeter {
public:
    explicit LevelMeter(float release = 0.75f);

    /// Feed one interleaved batch and return the smoothed levels.
    const LevelFrame& process(const float* samples, std::size_t frame_count,
                              int channels);

    const LevelFrame& levels() const { return levels_; }

    /// Drop smoothing memory (start of a new session).
    void reset();

    /// Single RMS value in [0, 1] for a whole batch.
    static float compute_rms(const float* samples, std::size_t count);

private:
    float      release_;
    LevelFrame levels_{};
};

} // namespace rune
