#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace rune {

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

enum class ProcessingStatus {
    idle,
    recording,
    transcribing,
    thinking_action,
    generating_text,
    completed,
    cancelled,
    error
};

/// Convert status enum to the string carried by `audio-processing-status`.
inline const char* status_to_string(ProcessingStatus s) {
    switch (s) {
        case ProcessingStatus::idle:            return "idle";
        case ProcessingStatus::recording:       return "recording";
        case ProcessingStatus::transcribing:    return "transcribing";
        case ProcessingStatus::thinking_action: return "thinking_action";
        case ProcessingStatus::generating_text: return "generating_text";
        case ProcessingStatus::completed:       return "completed";
        case ProcessingStatus::cancelled:       return "cancelled";
        case ProcessingStatus::error:           return "error";
    }
    return "unknown";
}

/// Parse a status string back to the enum.  Unknown strings are `error`.
inline ProcessingStatus status_from_string(const std::string& s) {
    if (s == "idle")            return ProcessingStatus::idle;
    if (s == "recording")       return ProcessingStatus::recording;
    if (s == "transcribing")    return ProcessingStatus::transcribing;
    if (s == "thinking_action") return ProcessingStatus::thinking_action;
    if (s == "generating_text") return ProcessingStatus::generating_text;
    if (s == "completed")       return ProcessingStatus::completed;
    if (s == "cancelled")       return ProcessingStatus::cancelled;
    return ProcessingStatus::error;
}

inline bool is_terminal(ProcessingStatus s) {
    return s == ProcessingStatus::completed
        || s == ProcessingStatus::cancelled
        || s == ProcessingStatus::error;
}

/// Statuses during which a session occupies the recording slot.
inline bool is_active(ProcessingStatus s) {
    return s == ProcessingStatus::recording
        || s == ProcessingStatus::transcribing
        || s == ProcessingStatus::thinking_action
        || s == ProcessingStatus::generating_text;
}

// ---------------------------------------------------------------------------
// Structs
// ---------------------------------------------------------------------------

constexpr std::size_t kLevelBands = 8;

/// Smoothed per-band amplitude summary, every value in [0, 1].
using LevelFrame = std::array<float, kLevelBands>;

/// One completed transcription as persisted by the HistoryStore.
struct TranscriptionRecord {
    int64_t                    id = 0;          // storage-assigned
    std::string                timestamp;       // ISO 8601, UTC
    std::optional<std::string> audio_path;
    std::string                text;
};

/// Input device snapshot.  Not owned by us; re-query for fresh data.
struct AudioDeviceDescriptor {
    std::string id;
    std::string name;
};

/// Native format of an opened capture stream.
struct StreamFormat {
    int sample_rate = 0;
    int channels    = 0;
};

/// A fixed-size batch of interleaved float PCM straight from the device,
/// plus its level summary.  Only valid for the duration of the callback.
struct AudioFrame {
    const float* samples     = nullptr;
    std::size_t  frame_count = 0;
    int          channels    = 0;
    int          sample_rate = 0;
    LevelFrame   levels{};
};

// ---------------------------------------------------------------------------
// Callback types
// ---------------------------------------------------------------------------

/// Fired on the capture thread for every complete AudioFrame.
using FrameCallback = std::function<void(const AudioFrame&)>;

/// Fired on the capture thread at the level cadence.
using LevelCallback = std::function<void(const LevelFrame&)>;

/// Fired on the capture thread when the device fails mid-stream.
using CaptureErrorCallback = std::function<void(const std::string& message)>;

} // namespace rune
