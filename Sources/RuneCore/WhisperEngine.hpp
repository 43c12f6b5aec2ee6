#pragma once

#include "TranscriptionEngine.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rune {

struct WhisperConfig {
    std::string language  = "en";
    int         n_threads = std::max(1, std::min(4, static_cast<int>(std::thread::hardware_concurrency())));
    bool        use_gpu   = true;
};

/// TranscriptionEngine backed by whisper.cpp.
/// Loads a ggml model once, then transcribes 16 kHz mono buffers on demand.
/// The cancellation token is polled from whisper's abort callback, so a
/// cancel or deadline stops inference between decoder steps.
class WhisperEngine : public TranscriptionEngine {
public:
    explicit WhisperEngine(WhisperConfig config = {});
    ~WhisperEngine() override;

    // Non-copyable, movable.
    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;
    WhisperEngine(WhisperEngine&&) noexcept;
    WhisperEngine& operator=(WhisperEngine&&) noexcept;

    /// Load the ggml model file (e.g. "ggml-base.en.bin").
    /// Returns true on success.  Thread-safe.
    bool init(const std::string& model_path);

    /// Whether a model has been successfully loaded.
    bool is_loaded() const;

    void set_language(const std::string& language);

    /// @throws RuneError(engine_failure) if no model is loaded, inference
    ///         fails, or the token aborts it.
    std::string transcribe(const std::vector<float>& pcm,
                           const CancellationToken& token) override;

private:
    WhisperConfig           config_;
    struct whisper_context* ctx_ = nullptr;   // opaque whisper.h handle
    mutable std::mutex      mu_;
};

} // namespace rune
