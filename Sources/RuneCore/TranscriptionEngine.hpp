#pragma once

#include "CancellationToken.hpp"

#include <string>
#include <vector>

namespace rune {

/// Turns finalized mono PCM into text.
///
/// Called from the pipeline worker, never from the capture thread.
/// Implementations check `token.should_abort()` at least at entry and exit;
/// engines that can interrupt inference (whisper.cpp) poll it mid-flight.
class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;

    /// Sample rate the engine expects `pcm` in.
    virtual int sample_rate() const { return 16000; }

    /// @throws RuneError(engine_failure) when inference fails or is aborted.
    virtual std::string transcribe(const std::vector<float>& pcm,
                                   const CancellationToken& token) = 0;
};

} // namespace rune
