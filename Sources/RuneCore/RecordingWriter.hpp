#pragma once

#include <string>
#include <vector>

namespace rune {

/// Write mono float PCM to `path` as a 16-bit little-endian WAV file using
/// libavformat's wav muxer.  The parent directory is created if needed.
/// @throws RuneError(storage_unavailable) on any I/O or muxer failure; a
///         partially written file is removed.
void write_wav(const std::string& path, const std::vector<float>& pcm, int sample_rate);

} // namespace rune
