#pragma once

#include "ActionEngine.hpp"
#include "AudioCaptureEngine.hpp"
#include "EventBus.hpp"
#include "HistoryStore.hpp"
#include "PermissionManager.hpp"
#include "SessionController.hpp"
#include "SettingsStore.hpp"
#include "ShortcutManager.hpp"
#include "TextInjector.hpp"
#include "TranscriptionEngine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rune {

struct RuneAppOptions {
    std::string settings_path;                 // empty = default_settings_path()
    std::string history_path;                  // empty = from settings
    std::string uinput_path = "/dev/uinput";
    CaptureConfig capture;
};

/// Everything the UI talks to, wired together.
///
/// Owns the bus, settings, capture engine, history, session controller,
/// permission and shortcut managers.  The audio input, transcription
/// engine, hotkey registrar and the optional action engine and text
/// injector are supplied by the caller, so the daemon can plug in FFmpeg
/// and whisper.cpp while tests plug in fakes.
///
/// The public methods are the boundary operations; each either returns
/// its result or throws RuneError.
class RuneApp {
public:
    RuneApp(RuneAppOptions options,
            std::unique_ptr<AudioInput> input,
            std::unique_ptr<TranscriptionEngine> engine,
            std::unique_ptr<HotkeyRegistrar> registrar,
            std::unique_ptr<ActionEngine> action = nullptr,
            std::unique_ptr<TextInjector> injector = nullptr);
    ~RuneApp();

    // Non-copyable.
    RuneApp(const RuneApp&) = delete;
    RuneApp& operator=(const RuneApp&) = delete;

    /// Register the stored shortcut.  Separate from construction so the
    /// caller can subscribe to events first.
    void start();

    /// Stop the pipeline.  Idempotent.
    void shutdown();

    // ---- Recording ----
    void begin_recording();
    void cancel_recording();
    void stop_recording();
    ProcessingStatus get_status() const;

    /// Global hotkey: press begins, release finalizes.
    void handle_hotkey(bool pressed);

    // ---- History ----
    std::vector<TranscriptionRecord> get_transcription_history() const;

    // ---- Devices ----
    std::vector<AudioDeviceDescriptor> get_devices();
    std::optional<AudioDeviceDescriptor> get_default_device();
    /// An empty id goes back to the system default.
    void set_default_device(const std::string& device_id);

    // ---- Shortcuts ----
    void update_shortcuts(const std::string& key, const std::string& modifier);

    // ---- Permissions ----
    bool check_accessibility_permissions();
    bool request_accessibility_permissions();
    bool check_microphone_permissions();
    bool request_microphone_permissions();
    bool check_all_permissions();

    // ---- Settings ----
    Settings get_settings() const;
    void update_user_profile(const UserProfile& profile);
    void update_api_key(const std::string& service, const std::string& api_key);

    // ---- Events ----
    std::shared_ptr<Subscription> subscribe(SubscriptionOptions options = {});

    EventBus& bus() { return bus_; }
    SettingsStore& settings() { return settings_; }
    SessionController& controller() { return *controller_; }

    /// Session tunables derived from the settings document.
    static SessionConfig session_config_from(const Settings& settings);

private:
    EventBus                             bus_;
    SettingsStore                        settings_;
    std::unique_ptr<TranscriptionEngine> engine_;
    std::unique_ptr<ActionEngine>        action_;
    std::unique_ptr<TextInjector>        injector_;
    std::unique_ptr<HotkeyRegistrar>     registrar_;
    std::unique_ptr<AudioCaptureEngine>  capture_;
    std::unique_ptr<HistoryStore>        history_;
    std::unique_ptr<SessionController>   controller_;
    std::unique_ptr<PermissionManager>   permissions_;
    std::unique_ptr<ShortcutManager>     shortcuts_;
    bool                                 shut_down_ = false;
};

} // namespace rune
