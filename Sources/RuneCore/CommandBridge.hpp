#pragma once

#include "EventBus.hpp"
#include "Types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace rune {

class RuneApp;

/// JSON front door for the UI process.
///
/// Requests look like `{"cmd": "get_devices", "args": {...}, "id": 7}`;
/// responses are `{"ok": true, "result": ...}` or
/// `{"ok": false, "error": {"code": "DeviceUnavailable", "message": ...}}`,
/// echoing `id` when the request had one.
class CommandBridge {
public:
    explicit CommandBridge(RuneApp& app);

    nlohmann::json handle(const nlohmann::json& request);

    /// Parse one line of text and handle it.  Malformed JSON is answered
    /// with an InvalidArgument error rather than thrown.
    nlohmann::json handle_line(const std::string& line);

    /// `{"event": "<name>", "payload": ...}`
    static nlohmann::json event_to_json(const Event& event);

    static nlohmann::json record_to_json(const TranscriptionRecord& record);
    static nlohmann::json device_to_json(const AudioDeviceDescriptor& device);

private:
    using Handler = nlohmann::json (CommandBridge::*)(const nlohmann::json& args);

    nlohmann::json begin_recording(const nlohmann::json& args);
    nlohmann::json cancel_recording(const nlohmann::json& args);
    nlohmann::json stop_recording(const nlohmann::json& args);
    nlohmann::json get_status(const nlohmann::json& args);
    nlohmann::json hotkey(const nlohmann::json& args);
    nlohmann::json get_transcription_history(const nlohmann::json& args);
    nlohmann::json get_devices(const nlohmann::json& args);
    nlohmann::json get_default_device(const nlohmann::json& args);
    nlohmann::json set_default_device(const nlohmann::json& args);
    nlohmann::json update_shortcuts(const nlohmann::json& args);
    nlohmann::json check_accessibility_permissions(const nlohmann::json& args);
    nlohmann::json request_accessibility_permissions(const nlohmann::json& args);
    nlohmann::json check_microphone_permissions(const nlohmann::json& args);
    nlohmann::json request_microphone_permissions(const nlohmann::json& args);
    nlohmann::json check_all_permissions(const nlohmann::json& args);
    nlohmann::json get_settings(const nlohmann::json& args);
    nlohmann::json update_user_profile(const nlohmann::json& args);
    nlohmann::json update_api_key(const nlohmann::json& args);

    RuneApp&                        app_;
    std::map<std::string, Handler>  handlers_;
};

} // namespace rune
