#pragma once

#include "Errors.hpp"
#include "Session.hpp"
#include "Types.hpp"
#include "Worker.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rune {

class ActionEngine;
class AudioCaptureEngine;
class EventBus;
class HistoryStore;
class TextInjector;
class TranscriptionEngine;

/// Drives one session at a time from trigger to transcript:
///
///   idle -> recording -> transcribing -> [thinking_action -> [generating_text]]
///        -> completed -> idle
///
/// `cancelled` is reachable from every active status and falls straight
/// back to `idle`; `error` is reached on capture or engine failure and falls
/// back to `idle` after the completion grace period, as does `completed`.
///
/// begin/cancel/finalize may be called from any thread.  Capture runs on
/// the AudioCaptureEngine thread.  The session worker drains and resamples
/// the capture ring, publishes levels and runs every timer.  Engine calls,
/// text injection and history writes run on a separate pipeline worker, so
/// an engine call that outlives its cancelled session cannot starve the
/// next session's capture.  All status changes are published under one
/// mutex, so observers see them in the order they happened.
///
/// The history write runs without the lock.  The session commits right
/// before the row does; a cancel that arrives first rolls the row back.
/// Text is injected after `completed` has been published.
class SessionController {
public:
    SessionController(AudioCaptureEngine& capture,
                      HistoryStore& history,
                      EventBus& bus,
                      SessionConfig config = {});
    ~SessionController();

    // Non-copyable.
    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /// Engines are not owned.  Changes apply to the next engine call.
    void set_transcription_engine(TranscriptionEngine* engine);
    void set_action_engine(ActionEngine* engine);

    /// Not owned.  Used when the session config asks for injection.
    void set_text_injector(TextInjector* injector);

    /// Applies to sessions started afterwards.
    void set_config(const SessionConfig& config);
    SessionConfig config() const;

    /// Claim the recording slot and start capturing.
    /// @return the new session id.
    /// @throws RuneError(already_recording) if a session is active.
    /// @throws RuneError(permission_denied / device_unavailable) if capture
    ///         could not start; status goes to `error` in that case.
    std::string begin(const std::optional<std::string>& device_id = std::nullopt);

    /// Stop capture and hand the audio to transcription.
    /// @return false if no session is recording.
    bool finalize();

    /// Abort the active session, whatever stage it is in.
    /// @return false if there was nothing to cancel, or the session was
    ///         already committed.
    bool cancel();

    ProcessingStatus status() const { return status_.load(); }
    std::optional<std::string> active_session_id() const;

    /// Cancel and stop both workers.  Called by the destructor.
    void shutdown();

private:
    using SessionPtr = std::shared_ptr<Session>;

    // All *_locked helpers require mu_.
    void transition_locked(const SessionPtr& s, ProcessingStatus status);
    void set_idle_locked(const std::string& session_id);
    void release_locked(const SessionPtr& s);
    void stop_capture_locked(const SessionPtr& s);
    void fail_locked(const SessionPtr& s, ErrorCode code, const std::string& message);
    void cancel_empty_locked(const SessionPtr& s, const std::string& reason);
    void schedule_idle_locked(const std::string& session_id, std::chrono::milliseconds grace);
    bool is_current_locked(const SessionPtr& s) const;
    bool finalize_locked(const SessionPtr& s);

    // Session worker tasks.
    void drain_tick(const SessionPtr& s);
    void drain(const SessionPtr& s);
    void collect(const SessionPtr& s);
    void on_capture_failed(const SessionPtr& s, const std::string& message);

    // Pipeline worker tasks.
    void process(const SessionPtr& s);
    void inject(const SessionPtr& s, TextInjector* injector, const std::string& text);

    /// Run one engine step with the deadline armed.  Returns false and
    /// moves the session to `error` (or drops it if cancelled) on failure.
    template <typename Fn>
    bool run_engine_step(const SessionPtr& s, const char* stage, Fn&& fn);

    /// Publish a new transcript revision.
    void update_transcript_locked(const SessionPtr& s, const std::string& text);

    AudioCaptureEngine&            capture_;
    HistoryStore&                  history_;
    EventBus&                      bus_;

    mutable std::mutex             mu_;
    SessionConfig                  config_;
    TranscriptionEngine*           engine_ = nullptr;
    ActionEngine*                  action_ = nullptr;
    TextInjector*                  injector_ = nullptr;
    SessionPtr                     session_;          // the single recording slot
    std::string                    last_session_id_;
    std::atomic<ProcessingStatus>  status_{ProcessingStatus::idle};
    uint64_t                       generation_ = 0;   // bumped by every begin()
    Worker::TimerId                idle_timer_ = 0;
    bool                           shut_down_ = false;

    std::vector<float>             scratch_;          // session worker only

    Worker                         worker_;           // drain, levels, timers
    Worker                         pipeline_;         // engines, injection, history
};

} // namespace rune
