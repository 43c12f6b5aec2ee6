#include "CommandBridge.hpp"

#include "Errors.hpp"
#include "Log.hpp"
#include "RuneApp.hpp"

using nlohmann::json;

namespace rune {

namespace {

constexpr const char* kTag = "bridge";

json error_json(ErrorCode code, const std::string& message) {
    return json{
        {"ok", false},
        {"error", {{"code", error_code_name(code)}, {"message", message}}},
    };
}

/// String argument under either spelling; throws InvalidArgument when absent.
std::string string_arg(const json& args, const char* name, const char* alt = nullptr) {
    for (const char* key : {name, alt}) {
        if (!key || !args.contains(key)) continue;
        const json& v = args.at(key);
        if (v.is_null()) return {};
        if (!v.is_string()) {
            throw RuneError(ErrorCode::invalid_argument,
                            std::string("Argument '") + key + "' must be a string");
        }
        return v.get<std::string>();
    }
    throw RuneError(ErrorCode::invalid_argument, std::string("Missing argument '") + name + "'");
}

std::string optional_string_arg(const json& args, const char* name) {
    if (!args.contains(name) || args.at(name).is_null()) return {};
    return string_arg(args, name);
}

} // namespace

CommandBridge::CommandBridge(RuneApp& app)
    : app_(app),
      handlers_{
          {"begin_recording", &CommandBridge::begin_recording},
          {"cancel_recording", &CommandBridge::cancel_recording},
          {"stop_recording", &CommandBridge::stop_recording},
          {"get_status", &CommandBridge::get_status},
          {"hotkey", &CommandBridge::hotkey},
          {"get_transcription_history", &CommandBridge::get_transcription_history},
          {"get_devices", &CommandBridge::get_devices},
          {"get_default_device", &CommandBridge::get_default_device},
          {"set_default_device", &CommandBridge::set_default_device},
          {"update_shortcuts", &CommandBridge::update_shortcuts},
          {"check_accessibility_permissions", &CommandBridge::check_accessibility_permissions},
          {"request_accessibility_permissions", &CommandBridge::request_accessibility_permissions},
          {"check_microphone_permissions", &CommandBridge::check_microphone_permissions},
          {"request_microphone_permissions", &CommandBridge::request_microphone_permissions},
          {"check_all_permissions", &CommandBridge::check_all_permissions},
          {"get_settings", &CommandBridge::get_settings},
          {"update_user_profile", &CommandBridge::update_user_profile},
          {"update_api_key", &CommandBridge::update_api_key},
      } {}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

json CommandBridge::handle(const json& request) {
    json response;

    if (!request.is_object() || !request.contains("cmd") || !request.at("cmd").is_string()) {
        response = error_json(ErrorCode::invalid_argument, "Request needs a string 'cmd'");
    } else {
        const std::string cmd = request.at("cmd").get<std::string>();
        const json args = request.contains("args") && request.at("args").is_object()
                              ? request.at("args")
                              : json::object();

        auto it = handlers_.find(cmd);
        if (it == handlers_.end()) {
            response = error_json(ErrorCode::invalid_argument, "Unknown command '" + cmd + "'");
        } else {
            try {
                response = json{{"ok", true}, {"result", (this->*(it->second))(args)}};
            } catch (const RuneError& e) {
                log::debug(kTag, cmd + " failed: " + e.what());
                response = error_json(e.code(), e.what());
            } catch (const json::exception& e) {
                response = error_json(ErrorCode::invalid_argument, e.what());
            }
        }
    }

    if (request.is_object() && request.contains("id")) {
        response["id"] = request.at("id");
    }
    return response;
}

json CommandBridge::handle_line(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        return error_json(ErrorCode::invalid_argument, std::string("Malformed request: ") + e.what());
    }
    return handle(request);
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

json CommandBridge::record_to_json(const TranscriptionRecord& record) {
    return json{
        {"id", record.id},
        {"timestamp", record.timestamp},
        {"audio_path", record.audio_path ? json(*record.audio_path) : json(nullptr)},
        {"text", record.text},
    };
}

json CommandBridge::device_to_json(const AudioDeviceDescriptor& device) {
    return json{{"id", device.id}, {"name", device.name}};
}

json CommandBridge::event_to_json(const Event& event) {
    json out{{"event", event_name(event.kind)}};

    switch (event.kind) {
        case EventKind::audio_levels:
            out["payload"] = event.levels;
            break;
        case EventKind::processing_status:
            out["payload"] = status_to_string(event.status);
            break;
        case EventKind::transcription_result:
            out["payload"]  = event.text;
            out["revision"] = event.revision;
            break;
        case EventKind::transcription_added:
            out["payload"] = event.record ? record_to_json(*event.record) : json(nullptr);
            break;
        case EventKind::settings_changed:
        case EventKind::permissions_changed:
            out["payload"] = event.data;
            break;
        case EventKind::pipeline_error:
            out["payload"] = {
                {"code", event.error_code ? error_code_name(*event.error_code) : "Unknown"},
                {"message", event.message},
            };
            break;
    }

    if (!event.session_id.empty()) out["session_id"] = event.session_id;
    return out;
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

json CommandBridge::begin_recording(const json&) {
    app_.begin_recording();
    return nullptr;
}

json CommandBridge::cancel_recording(const json&) {
    app_.cancel_recording();
    return nullptr;
}

json CommandBridge::stop_recording(const json&) {
    app_.stop_recording();
    return nullptr;
}

json CommandBridge::get_status(const json&) {
    return status_to_string(app_.get_status());
}

json CommandBridge::hotkey(const json& args) {
    if (!args.contains("pressed") || !args.at("pressed").is_boolean()) {
        throw RuneError(ErrorCode::invalid_argument, "Argument 'pressed' must be a boolean");
    }
    app_.handle_hotkey(args.at("pressed").get<bool>());
    return nullptr;
}

json CommandBridge::get_transcription_history(const json&) {
    json out = json::array();
    for (const auto& r : app_.get_transcription_history()) {
        out.push_back(record_to_json(r));
    }
    return out;
}

json CommandBridge::get_devices(const json&) {
    json out = json::array();
    for (const auto& d : app_.get_devices()) {
        out.push_back(device_to_json(d));
    }
    return out;
}

json CommandBridge::get_default_device(const json&) {
    const auto device = app_.get_default_device();
    return device ? device_to_json(*device) : json(nullptr);
}

json CommandBridge::set_default_device(const json& args) {
    app_.set_default_device(string_arg(args, "deviceId", "device_id"));
    return nullptr;
}

json CommandBridge::update_shortcuts(const json& args) {
    app_.update_shortcuts(optional_string_arg(args, "key"),
                          optional_string_arg(args, "modifier"));
    return nullptr;
}

json CommandBridge::check_accessibility_permissions(const json&) {
    return app_.check_accessibility_permissions();
}

json CommandBridge::request_accessibility_permissions(const json&) {
    return app_.request_accessibility_permissions();
}

json CommandBridge::check_microphone_permissions(const json&) {
    return app_.check_microphone_permissions();
}

json CommandBridge::request_microphone_permissions(const json&) {
    return app_.request_microphone_permissions();
}

json CommandBridge::check_all_permissions(const json&) {
    return app_.check_all_permissions();
}

json CommandBridge::get_settings(const json&) {
    json out;
    to_json(out, app_.get_settings());
    return out;
}

json CommandBridge::update_user_profile(const json& args) {
    UserProfile profile = app_.get_settings().user_profile;
    if (args.contains("name"))  profile.name  = optional_string_arg(args, "name");
    if (args.contains("email")) profile.email = optional_string_arg(args, "email");
    if (args.contains("about")) profile.about = optional_string_arg(args, "about");
    app_.update_user_profile(profile);
    return nullptr;
}

json CommandBridge::update_api_key(const json& args) {
    app_.update_api_key(string_arg(args, "service"), string_arg(args, "apiKey", "api_key"));
    return nullptr;
}

} // namespace rune
