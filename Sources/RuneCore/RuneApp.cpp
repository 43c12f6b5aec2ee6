#include "RuneApp.hpp"

#include "Errors.hpp"
#include "Log.hpp"

#include <algorithm>
#include <utility>

namespace rune {

namespace {
constexpr const char* kTag = "app";
} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

RuneApp::RuneApp(RuneAppOptions options,
                 std::unique_ptr<AudioInput> input,
                 std::unique_ptr<TranscriptionEngine> engine,
                 std::unique_ptr<HotkeyRegistrar> registrar,
                 std::unique_ptr<ActionEngine> action,
                 std::unique_ptr<TextInjector> injector)
    : settings_(options.settings_path, &bus_),
      engine_(std::move(engine)),
      action_(std::move(action)),
      injector_(std::move(injector)),
      registrar_(std::move(registrar)) {
    if (!registrar_) {
        throw RuneError(ErrorCode::invalid_argument, "RuneApp needs a hotkey registrar");
    }

    try {
        settings_.load();
    } catch (const RuneError& e) {
        log::error(kTag, std::string(e.what()) + "; running on defaults");
    }
    const Settings s = settings_.get();

    capture_ = std::make_unique<AudioCaptureEngine>(std::move(input), options.capture);
    capture_->set_default_device(s.audio.default_device);

    const std::string history_path = options.history_path.empty()
                                         ? resolved_history_path(s)
                                         : options.history_path;
    history_ = std::make_unique<HistoryStore>(history_path);
    try {
        history_->open();
    } catch (const RuneError& e) {
        // Sessions still complete; each failed write is reported.
        log::error(kTag, std::string("history unavailable: ") + e.what());
    }

    controller_ = std::make_unique<SessionController>(*capture_, *history_, bus_,
                                                      session_config_from(s));
    controller_->set_transcription_engine(engine_.get());
    controller_->set_action_engine(action_.get());
    controller_->set_text_injector(injector_.get());

    permissions_ = std::make_unique<PermissionManager>(*capture_, &bus_, options.uinput_path);
    shortcuts_   = std::make_unique<ShortcutManager>(
        settings_, *registrar_, [this](bool pressed) { handle_hotkey(pressed); });
}

RuneApp::~RuneApp() {
    shutdown();
}

void RuneApp::start() {
    shortcuts_->register_from_settings();
}

void RuneApp::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;
    registrar_->unregister_all();
    controller_->shutdown();
}

SessionConfig RuneApp::session_config_from(const Settings& settings) {
    const PipelineSettings& p = settings.pipeline;
    SessionConfig c;
    c.max_duration     = std::chrono::seconds(std::max(1, p.max_recording_seconds));
    c.completion_grace = std::chrono::milliseconds(std::max(0, p.completion_grace_ms));
    c.engine_timeout   = std::chrono::seconds(std::max(1, p.engine_timeout_seconds));
    c.min_recording    = std::chrono::milliseconds(std::max(0, p.min_recording_ms));
    c.keep_recordings  = p.keep_recordings;
    c.inject_text      = p.inject_text;
    c.recordings_dir   = resolved_recordings_dir(settings);
    return c;
}

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------

void RuneApp::begin_recording() {
    controller_->begin();
}

void RuneApp::cancel_recording() {
    controller_->cancel();
}

void RuneApp::stop_recording() {
    controller_->finalize();
}

ProcessingStatus RuneApp::get_status() const {
    return controller_->status();
}

void RuneApp::handle_hotkey(bool pressed) {
    if (pressed) {
        if (is_active(controller_->status())) return;   // key repeat
        try {
            controller_->begin();
        } catch (const RuneError& e) {
            // Already published as status `error`; nobody to return it to.
            log::warn(kTag, std::string("hotkey could not start recording: ") + e.what());
        }
    } else {
        controller_->finalize();
    }
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

std::vector<TranscriptionRecord> RuneApp::get_transcription_history() const {
    return history_->list();
}

// ---------------------------------------------------------------------------
// Devices
// ---------------------------------------------------------------------------

std::vector<AudioDeviceDescriptor> RuneApp::get_devices() {
    return capture_->list_devices();
}

std::optional<AudioDeviceDescriptor> RuneApp::get_default_device() {
    const std::optional<std::string> configured = capture_->default_device();
    if (!configured) return capture_->system_default_device();

    for (const auto& d : capture_->list_devices()) {
        if (d.id == *configured) return d;
    }
    // Configured but not currently present: still report what is stored.
    return AudioDeviceDescriptor{*configured, *configured};
}

void RuneApp::set_default_device(const std::string& device_id) {
    if (!device_id.empty()) {
        const auto devices = capture_->list_devices();
        const bool known = devices.empty()
            || std::any_of(devices.begin(), devices.end(),
                           [&](const AudioDeviceDescriptor& d) { return d.id == device_id; });
        if (!known) {
            throw RuneError(ErrorCode::device_unavailable,
                            "Audio device '" + device_id + "' is not available");
        }
    }

    std::optional<std::string> id;
    if (!device_id.empty()) id = device_id;
    settings_.set_default_device(id);
    capture_->set_default_device(id);
}

// ---------------------------------------------------------------------------
// Shortcuts / permissions / settings
// ---------------------------------------------------------------------------

void RuneApp::update_shortcuts(const std::string& key, const std::string& modifier) {
    shortcuts_->update_shortcuts(key, modifier);
}

bool RuneApp::check_accessibility_permissions()   { return permissions_->check_accessibility(); }
bool RuneApp::request_accessibility_permissions() { return permissions_->request_accessibility(); }
bool RuneApp::check_microphone_permissions()      { return permissions_->check_microphone(); }
bool RuneApp::request_microphone_permissions()    { return permissions_->request_microphone(); }
bool RuneApp::check_all_permissions()             { return permissions_->check_all(); }

Settings RuneApp::get_settings() const {
    return settings_.get();
}

void RuneApp::update_user_profile(const UserProfile& profile) {
    settings_.update_user_profile(profile);
}

void RuneApp::update_api_key(const std::string& service, const std::string& api_key) {
    settings_.update_api_key(service, api_key);
}

std::shared_ptr<Subscription> RuneApp::subscribe(SubscriptionOptions options) {
    return bus_.subscribe(options);
}

} // namespace rune
