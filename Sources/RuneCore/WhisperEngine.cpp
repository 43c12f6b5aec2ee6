#include "WhisperEngine.hpp"

#include "Errors.hpp"
#include "Log.hpp"

#include <cctype>
#include <utility>

#include "whisper.h"

namespace rune {

namespace {

constexpr const char* kTag = "whisper";

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

WhisperEngine::WhisperEngine(WhisperConfig config)
    : config_(std::move(config)) {
    if (config_.n_threads <= 0) config_.n_threads = 1;
}

WhisperEngine::~WhisperEngine() {
    std::lock_guard<std::mutex> lock(mu_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

WhisperEngine::WhisperEngine(WhisperEngine&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.mu_);
    config_ = std::move(other.config_);
    ctx_ = other.ctx_;
    other.ctx_ = nullptr;
}

WhisperEngine& WhisperEngine::operator=(WhisperEngine&& other) noexcept {
    if (this != &other) {
        std::lock_guard<std::mutex> lk1(mu_);
        std::lock_guard<std::mutex> lk2(other.mu_);
        if (ctx_) {
            whisper_free(ctx_);
        }
        config_ = std::move(other.config_);
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

// ---------------------------------------------------------------------------
// init
// ---------------------------------------------------------------------------

bool WhisperEngine::init(const std::string& model_path) {
    std::lock_guard<std::mutex> lock(mu_);

    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.use_gpu;

    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        log::error(kTag, "failed to load model '" + model_path + "'");
        return false;
    }
    log::info(kTag, "loaded model '" + model_path + "'");
    return true;
}

bool WhisperEngine::is_loaded() const {
    std::lock_guard<std::mutex> lock(mu_);
    return ctx_ != nullptr;
}

void WhisperEngine::set_language(const std::string& language) {
    std::lock_guard<std::mutex> lock(mu_);
    config_.language = language.empty() ? std::string("en") : language;
}

// ---------------------------------------------------------------------------
// transcribe
// ---------------------------------------------------------------------------

std::string WhisperEngine::transcribe(const std::vector<float>& pcm,
                                      const CancellationToken& token) {
    std::lock_guard<std::mutex> lock(mu_);

    if (!ctx_) {
        throw RuneError(ErrorCode::engine_failure, "No transcription model is loaded");
    }
    if (pcm.empty()) {
        throw RuneError(ErrorCode::empty_recording, "Nothing to transcribe");
    }
    if (token.should_abort()) {
        throw RuneError(ErrorCode::engine_failure,
                        token.expired() ? "Transcription timed out" : "Transcription cancelled");
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.print_progress   = false;
    params.print_realtime   = false;
    params.print_timestamps = false;
    params.single_segment   = false;
    params.no_context       = true;
    params.language         = config_.language.c_str();
    params.n_threads        = config_.n_threads;

    params.abort_callback = [](void* user_data) -> bool {
        return static_cast<const CancellationToken*>(user_data)->should_abort();
    };
    params.abort_callback_user_data =
        const_cast<void*>(static_cast<const void*>(&token));

    const int ret = whisper_full(ctx_, params, pcm.data(), static_cast<int>(pcm.size()));

    if (token.should_abort()) {
        throw RuneError(ErrorCode::engine_failure,
                        token.expired() ? "Transcription timed out" : "Transcription cancelled");
    }
    if (ret != 0) {
        throw RuneError(ErrorCode::engine_failure,
                        "whisper_full failed with code " + std::to_string(ret));
    }

    std::string result;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(ctx_, i);
        if (text) {
            result += text;
        }
    }
    return trim(result);
}

} // namespace rune
