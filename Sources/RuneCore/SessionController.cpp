#include "SessionController.hpp"

#include "ActionEngine.hpp"
#include "AudioCaptureEngine.hpp"
#include "EventBus.hpp"
#include "HistoryStore.hpp"
#include "Log.hpp"
#include "RecordingWriter.hpp"
#include "TextInjector.hpp"
#include "TranscriptionEngine.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>

namespace rune {

namespace {

constexpr const char* kTag = "session";

// About 5 s of 48 kHz stereo; the session worker drains every few
// milliseconds and never waits on an engine.
constexpr std::size_t kRingCapacity = 1u << 19;
constexpr std::size_t kDrainFrames  = 4096;

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

SessionController::SessionController(AudioCaptureEngine& capture,
                                     HistoryStore& history,
                                     EventBus& bus,
                                     SessionConfig config)
    : capture_(capture), history_(history), bus_(bus), config_(std::move(config)),
      worker_("session"), pipeline_("pipeline") {}

SessionController::~SessionController() {
    shutdown();
}

void SessionController::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (shut_down_) return;
        shut_down_ = true;
    }
    cancel();
    worker_.stop();
    pipeline_.stop();
    capture_.stop();
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

void SessionController::set_transcription_engine(TranscriptionEngine* engine) {
    std::lock_guard<std::mutex> lock(mu_);
    engine_ = engine;
}

void SessionController::set_action_engine(ActionEngine* engine) {
    std::lock_guard<std::mutex> lock(mu_);
    action_ = engine;
}

void SessionController::set_text_injector(TextInjector* injector) {
    std::lock_guard<std::mutex> lock(mu_);
    injector_ = injector;
}

void SessionController::set_config(const SessionConfig& config) {
    std::lock_guard<std::mutex> lock(mu_);
    config_ = config;
}

SessionConfig SessionController::config() const {
    std::lock_guard<std::mutex> lock(mu_);
    return config_;
}

std::optional<std::string> SessionController::active_session_id() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!session_) return std::nullopt;
    return session_->id;
}

// ---------------------------------------------------------------------------
// begin
// ---------------------------------------------------------------------------

std::string SessionController::begin(const std::optional<std::string>& device_id) {
    std::lock_guard<std::mutex> lock(mu_);

    if (shut_down_) {
        throw RuneError(ErrorCode::device_unavailable, "Recording pipeline is shutting down");
    }
    if (session_) {
        throw RuneError(ErrorCode::already_recording, "A recording session is already active");
    }

    // Still showing the previous result: pass through idle first.
    if (idle_timer_) {
        worker_.cancel_timer(idle_timer_);
        idle_timer_ = 0;
    }
    if (status_.load() != ProcessingStatus::idle) {
        set_idle_locked(last_session_id_);
    }

    ++generation_;

    auto s = std::make_shared<Session>(kRingCapacity);
    s->id       = generate_session_id();
    s->config   = config_;
    s->pcm_rate = engine_ ? engine_->sample_rate() : 16000;

    session_         = s;
    last_session_id_ = s->id;

    std::weak_ptr<Session> weak = s;
    try {
        s->format = capture_.start(
            device_id,
            [s](const AudioFrame& frame) {
                s->ring.push(frame.samples, frame.frame_count * static_cast<std::size_t>(frame.channels));
            },
            [s](const LevelFrame& levels) {
                s->levels.store(levels);
            },
            [this, weak](const std::string& message) {
                if (auto sp = weak.lock()) {
                    worker_.post([this, sp, message] { on_capture_failed(sp, message); });
                }
            });
    } catch (const RuneError& e) {
        log::error(kTag, std::string("could not start capture: ") + e.what());
        fail_locked(s, e.code(), e.what());
        throw;
    }

    transition_locked(s, ProcessingStatus::recording);
    log::info(kTag, "session " + short_id(s->id) + " recording");

    s->drain_timer = worker_.post_after(s->config.drain_interval, [this, s] { drain_tick(s); });
    s->timeout_timer = worker_.post_after(s->config.max_duration, [this, weak] {
        auto sp = weak.lock();
        if (!sp) return;
        std::lock_guard<std::mutex> lk(mu_);
        if (is_current_locked(sp) && sp->status == ProcessingStatus::recording) {
            log::info(kTag, "session " + short_id(sp->id) + " hit the maximum duration");
            finalize_locked(sp);
        }
    });

    return s->id;
}

// ---------------------------------------------------------------------------
// finalize / cancel
// ---------------------------------------------------------------------------

bool SessionController::finalize() {
    std::lock_guard<std::mutex> lock(mu_);
    return finalize_locked(session_);
}

bool SessionController::finalize_locked(const SessionPtr& s) {
    if (!s || !is_current_locked(s) || s->status != ProcessingStatus::recording) {
        return false;
    }
    stop_capture_locked(s);
    transition_locked(s, ProcessingStatus::transcribing);
    worker_.post([this, s] { collect(s); });
    return true;
}

bool SessionController::cancel() {
    std::lock_guard<std::mutex> lock(mu_);

    SessionPtr s = session_;
    if (!s || s->committed) return false;

    s->token.cancel();
    stop_capture_locked(s);

    transition_locked(s, ProcessingStatus::cancelled);
    release_locked(s);
    set_idle_locked(s->id);

    log::info(kTag, "session " + short_id(s->id) + " cancelled");
    return true;
}

// ---------------------------------------------------------------------------
// State helpers (mu_ held)
// ---------------------------------------------------------------------------

bool SessionController::is_current_locked(const SessionPtr& s) const {
    return s && session_ == s && !s->token.is_cancelled();
}

void SessionController::transition_locked(const SessionPtr& s, ProcessingStatus status) {
    s->status = status;
    status_.store(status);
    bus_.publish_status(status, s->id);
}

void SessionController::set_idle_locked(const std::string& session_id) {
    status_.store(ProcessingStatus::idle);
    bus_.publish_status(ProcessingStatus::idle, session_id);
}

void SessionController::release_locked(const SessionPtr& s) {
    worker_.cancel_timer(s->timeout_timer);
    worker_.cancel_timer(s->drain_timer);
    if (session_ == s) session_.reset();
}

void SessionController::stop_capture_locked(const SessionPtr& s) {
    worker_.cancel_timer(s->timeout_timer);
    worker_.cancel_timer(s->drain_timer);
    if (s->status == ProcessingStatus::recording) {
        capture_.stop();
        if (const uint64_t lost = s->ring.overruns()) {
            log::warn(kTag, "session " + short_id(s->id) + " dropped "
                                + std::to_string(lost) + " capture batch(es)");
        }
    }
}

void SessionController::fail_locked(const SessionPtr& s, ErrorCode code, const std::string& message) {
    log::error(kTag, "session " + short_id(s->id) + " failed (" + error_code_name(code)
                         + "): " + message);
    stop_capture_locked(s);
    transition_locked(s, ProcessingStatus::error);
    bus_.publish_error(code, message, s->id);
    release_locked(s);
    schedule_idle_locked(s->id, s->config.completion_grace);
}

void SessionController::cancel_empty_locked(const SessionPtr& s, const std::string& reason) {
    log::info(kTag, "session " + short_id(s->id) + " empty: " + reason);
    transition_locked(s, ProcessingStatus::cancelled);
    release_locked(s);
    set_idle_locked(s->id);
}

void SessionController::schedule_idle_locked(const std::string& session_id,
                                             std::chrono::milliseconds grace) {
    if (idle_timer_) worker_.cancel_timer(idle_timer_);
    const uint64_t gen = generation_;
    idle_timer_ = worker_.post_after(grace, [this, gen, session_id] {
        std::lock_guard<std::mutex> lock(mu_);
        if (generation_ != gen || session_ || !is_terminal(status_.load())) return;
        idle_timer_ = 0;
        set_idle_locked(session_id);
    });
}

void SessionController::update_transcript_locked(const SessionPtr& s, const std::string& text) {
    s->transcript = text;
    ++s->revision;
    bus_.publish_transcript(s->id, text, s->revision);
}

// ---------------------------------------------------------------------------
// Session worker tasks
// ---------------------------------------------------------------------------

void SessionController::drain_tick(const SessionPtr& s) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!is_current_locked(s) || s->status != ProcessingStatus::recording) return;
    }

    try {
        drain(s);
    } catch (const RuneError& e) {
        std::lock_guard<std::mutex> lock(mu_);
        if (is_current_locked(s)) fail_locked(s, ErrorCode::engine_failure, e.what());
        return;
    }

    LevelFrame levels;
    if (s->levels.take(s->levels_seen, levels)) bus_.publish_levels(levels);

    std::lock_guard<std::mutex> lock(mu_);
    if (is_current_locked(s) && s->status == ProcessingStatus::recording) {
        s->drain_timer = worker_.post_after(s->config.drain_interval, [this, s] { drain_tick(s); });
    }
}

void SessionController::drain(const SessionPtr& s) {
    if (s->format.channels <= 0 || s->format.sample_rate <= 0) return;

    const auto channels = static_cast<std::size_t>(s->format.channels);
    if (!s->resampler) {
        s->resampler = std::make_unique<Resampler>(s->format.sample_rate, s->format.channels,
                                                   s->pcm_rate);
    }
    scratch_.resize(kDrainFrames * channels);

    std::size_t n;
    while ((n = s->ring.pop(scratch_.data(), scratch_.size())) > 0) {
        s->resampler->process(scratch_.data(), n / channels, s->pcm);
    }
}

void SessionController::collect(const SessionPtr& s) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!is_current_locked(s) || s->status != ProcessingStatus::transcribing) return;
    }

    // Everything the capture thread left in the ring.
    try {
        drain(s);
        if (s->resampler) s->resampler->flush(s->pcm);
    } catch (const RuneError& e) {
        std::lock_guard<std::mutex> lock(mu_);
        if (is_current_locked(s)) fail_locked(s, ErrorCode::engine_failure, e.what());
        return;
    }

    // From here on `pcm` belongs to the pipeline worker.
    pipeline_.post([this, s] { process(s); });
}

void SessionController::on_capture_failed(const SessionPtr& s, const std::string& message) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!is_current_locked(s) || s->status != ProcessingStatus::recording) return;
    fail_locked(s, ErrorCode::device_unavailable, message);
}

// ---------------------------------------------------------------------------
// Pipeline worker tasks
// ---------------------------------------------------------------------------

template <typename Fn>
bool SessionController::run_engine_step(const SessionPtr& s, const char* stage, Fn&& fn) {
    std::optional<ErrorCode> code;
    std::string message;

    s->token.set_deadline(CancellationToken::Clock::now() + s->config.engine_timeout);
    try {
        fn();
    } catch (const RuneError& e) {
        code    = e.code();
        message = e.what();
    } catch (const std::exception& e) {
        code    = ErrorCode::engine_failure;
        message = e.what();
    }
    const bool timed_out = s->token.expired();
    s->token.clear_deadline();

    std::lock_guard<std::mutex> lock(mu_);
    if (!is_current_locked(s)) {
        log::debug(kTag, std::string(stage) + " result discarded for session " + short_id(s->id));
        return false;
    }
    if (timed_out) {
        fail_locked(s, ErrorCode::engine_failure, std::string(stage) + " timed out");
        return false;
    }
    if (code) {
        if (*code == ErrorCode::empty_recording) {
            cancel_empty_locked(s, message);
        } else {
            fail_locked(s, ErrorCode::engine_failure, std::string(stage) + " failed: " + message);
        }
        return false;
    }
    return true;
}

void SessionController::inject(const SessionPtr& s, TextInjector* injector,
                               const std::string& text) {
    if (!injector || !s->config.inject_text) return;
    try {
        injector->inject(text);
    } catch (const RuneError& e) {
        log::warn(kTag, "session " + short_id(s->id) + " text not injected: " + e.what());
    }
}

void SessionController::process(const SessionPtr& s) {
    TranscriptionEngine* engine   = nullptr;
    ActionEngine*        action   = nullptr;
    TextInjector*        injector = nullptr;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!is_current_locked(s) || s->status != ProcessingStatus::transcribing) return;
        engine   = engine_;
        action   = action_;
        injector = injector_;
    }

    // 1. Enough audio?
    const auto min_samples = std::max<std::size_t>(
        1, static_cast<std::size_t>(s->pcm_rate) * static_cast<std::size_t>(s->config.min_recording.count()) / 1000);
    if (s->pcm.size() < min_samples) {
        std::lock_guard<std::mutex> lock(mu_);
        if (is_current_locked(s)) {
            cancel_empty_locked(s, std::to_string(s->pcm.size()) + " samples captured");
        }
        return;
    }

    if (!engine) {
        std::lock_guard<std::mutex> lock(mu_);
        if (is_current_locked(s)) {
            fail_locked(s, ErrorCode::engine_failure, "No transcription engine is available");
        }
        return;
    }

    // 2. Transcribe.
    std::string text;
    if (!run_engine_step(s, "Transcription", [&] { text = trim(engine->transcribe(s->pcm, s->token)); })) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!is_current_locked(s)) return;
        if (text.empty()) {
            cancel_empty_locked(s, "no speech recognized");
            return;
        }
        update_transcript_locked(s, text);
    }

    // 3. Optional action / text generation.
    if (action) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (!is_current_locked(s)) return;
            transition_locked(s, ProcessingStatus::thinking_action);
        }

        // A failed action step still types what was said.
        auto fall_back = [&] {
            bool failed = false;
            {
                std::lock_guard<std::mutex> lock(mu_);
                failed = s->status == ProcessingStatus::error;
            }
            if (failed) inject(s, injector, text);
        };

        bool generate = false;
        if (!run_engine_step(s, "Intent detection",
                             [&] { generate = action->detect_intent(text, s->token); })) {
            fall_back();
            return;
        }

        if (generate) {
            std::lock_guard<std::mutex> lock(mu_);
            if (!is_current_locked(s)) return;
            transition_locked(s, ProcessingStatus::generating_text);
        }

        std::string out;
        if (!run_engine_step(s, generate ? "Text generation" : "Text transform", [&] {
                out = trim(generate ? action->generate(text, s->token)
                                    : action->transform(text, s->token));
            })) {
            fall_back();
            return;
        }

        std::lock_guard<std::mutex> lock(mu_);
        if (!is_current_locked(s)) return;
        if (!out.empty() && out != s->transcript) update_transcript_locked(s, out);
    }

    // 4. Keep the audio if asked to.
    std::optional<std::string> audio_path;
    if (s->config.keep_recordings) {
        const std::string dir  = s->config.recordings_dir.empty() ? std::string(".")
                                                                   : s->config.recordings_dir;
        const std::string path = dir + "/" + s->id + ".wav";
        try {
            write_wav(path, s->pcm, s->pcm_rate);
            audio_path = path;
        } catch (const RuneError& e) {
            log::warn(kTag, std::string("recording not kept: ") + e.what());
        }
    }

    // 5. Persist without the lock.  The session commits just before the
    // row does; a cancel that gets in first rolls the row back.
    TranscriptionRecord record;
    record.timestamp  = HistoryStore::now_iso8601();
    record.audio_path = audio_path;
    {
        std::lock_guard<std::mutex> lock(mu_);
        record.text = s->transcript;
    }

    auto commit = [this, &s] {
        std::lock_guard<std::mutex> lock(mu_);
        if (!is_current_locked(s)) return false;
        s->committed = true;
        return true;
    };

    std::optional<TranscriptionRecord> stored;
    std::optional<RuneError>           storage_error;
    try {
        stored = history_.append_if(record, s->id, commit);
    } catch (const RuneError& e) {
        storage_error = e;
    }

    // 6. Complete.
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!s->committed) {
            if (!is_current_locked(s)) {
                if (audio_path) {
                    std::error_code ec;
                    std::filesystem::remove(*audio_path, ec);
                }
                return;
            }
            s->committed = true;
        }

        if (storage_error) {
            log::warn(kTag, std::string("transcript not saved to history: ") + storage_error->what());
            bus_.publish_error(storage_error->code(), storage_error->what(), s->id);
        }
        if (stored) bus_.publish_record(s->id, *stored);
        transition_locked(s, ProcessingStatus::completed);
        release_locked(s);
        schedule_idle_locked(s->id, s->config.completion_grace);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - s->started);
    log::info(kTag, "session " + short_id(s->id) + " completed ("
                        + std::to_string(record.text.size()) + " chars, "
                        + std::to_string(elapsed.count()) + " ms)");

    // 7. Type the result where the user is.
    inject(s, injector, record.text);
}

} // namespace rune
