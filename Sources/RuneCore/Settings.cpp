#include "Settings.hpp"

#include <cstdlib>

using nlohmann::json;

namespace rune {

namespace {

json optional_to_json(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

/// Absent key keeps `current`; explicit null clears it.
std::optional<std::string> optional_from_json(const json& j, const char* key,
                                              const std::optional<std::string>& current) {
    if (!j.contains(key)) return current;
    const json& v = j.at(key);
    if (v.is_null()) return std::nullopt;
    return v.get<std::string>();
}

std::string home_dir() {
    const char* home = std::getenv("HOME");
    return (home && *home) ? std::string(home) : std::string(".");
}

} // namespace

// ---------------------------------------------------------------------------
// to_json
// ---------------------------------------------------------------------------

void to_json(json& j, const Settings& s) {
    j = json{
        {"shortcuts", {
            {"record_key", optional_to_json(s.shortcuts.record_key)},
            {"record_modifier", optional_to_json(s.shortcuts.record_modifier)},
        }},
        {"audio", {
            {"default_device", optional_to_json(s.audio.default_device)},
            {"input_format", s.audio.input_format},
            {"sample_rate", s.audio.sample_rate},
            {"channels", s.audio.channels},
        }},
        {"window", {
            {"width", s.window.width},
            {"height", s.window.height},
        }},
        {"user_profile", {
            {"name", s.user_profile.name},
            {"email", s.user_profile.email},
            {"about", s.user_profile.about},
        }},
        {"api_keys", s.api_keys},
        {"pipeline", {
            {"max_recording_seconds", s.pipeline.max_recording_seconds},
            {"completion_grace_ms", s.pipeline.completion_grace_ms},
            {"engine_timeout_seconds", s.pipeline.engine_timeout_seconds},
            {"min_recording_ms", s.pipeline.min_recording_ms},
            {"model_path", s.pipeline.model_path},
            {"language", s.pipeline.language},
            {"keep_recordings", s.pipeline.keep_recordings},
            {"recordings_dir", s.pipeline.recordings_dir},
            {"history_path", s.pipeline.history_path},
            {"inject_text", s.pipeline.inject_text},
            {"typing_tool", s.pipeline.typing_tool},
        }},
        {"log_level", s.log_level},
    };
}

// ---------------------------------------------------------------------------
// from_json
// ---------------------------------------------------------------------------

void from_json(const json& j, Settings& s) {
    const Settings defaults;

    if (j.contains("shortcuts")) {
        const json& sc = j.at("shortcuts");
        s.shortcuts.record_key      = optional_from_json(sc, "record_key", defaults.shortcuts.record_key);
        s.shortcuts.record_modifier = optional_from_json(sc, "record_modifier", defaults.shortcuts.record_modifier);
    }

    if (j.contains("audio")) {
        const json& a = j.at("audio");
        s.audio.default_device = optional_from_json(a, "default_device", std::nullopt);
        s.audio.input_format   = a.value("input_format", defaults.audio.input_format);
        s.audio.sample_rate    = a.value("sample_rate", defaults.audio.sample_rate);
        s.audio.channels       = a.value("channels", defaults.audio.channels);
    }

    if (j.contains("window")) {
        const json& w = j.at("window");
        s.window.width  = w.value("width", defaults.window.width);
        s.window.height = w.value("height", defaults.window.height);
    }

    if (j.contains("user_profile")) {
        const json& u = j.at("user_profile");
        s.user_profile.name  = u.value("name", std::string());
        s.user_profile.email = u.value("email", std::string());
        s.user_profile.about = u.value("about", std::string());
    }

    if (j.contains("api_keys") && j.at("api_keys").is_object()) {
        s.api_keys = j.at("api_keys").get<std::map<std::string, std::string>>();
    }

    if (j.contains("pipeline")) {
        const json& p = j.at("pipeline");
        const PipelineSettings& d = defaults.pipeline;
        s.pipeline.max_recording_seconds  = p.value("max_recording_seconds", d.max_recording_seconds);
        s.pipeline.completion_grace_ms    = p.value("completion_grace_ms", d.completion_grace_ms);
        s.pipeline.engine_timeout_seconds = p.value("engine_timeout_seconds", d.engine_timeout_seconds);
        s.pipeline.min_recording_ms       = p.value("min_recording_ms", d.min_recording_ms);
        s.pipeline.model_path             = p.value("model_path", d.model_path);
        s.pipeline.language               = p.value("language", d.language);
        s.pipeline.keep_recordings        = p.value("keep_recordings", d.keep_recordings);
        s.pipeline.recordings_dir         = p.value("recordings_dir", d.recordings_dir);
        s.pipeline.history_path           = p.value("history_path", d.history_path);
        s.pipeline.inject_text            = p.value("inject_text", d.inject_text);
        s.pipeline.typing_tool            = p.value("typing_tool", d.typing_tool);
    }

    s.log_level = j.value("log_level", defaults.log_level);
}

// ---------------------------------------------------------------------------
// Paths
// ---------------------------------------------------------------------------

std::string expand_path(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return home_dir() + path.substr(1);
    }
    return path;
}

std::string default_settings_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/rune/settings.json";
    return home_dir() + "/.config/rune/settings.json";
}

std::string default_data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/rune";
    return home_dir() + "/.local/share/rune";
}

std::string resolved_history_path(const Settings& s) {
    if (!s.pipeline.history_path.empty()) return expand_path(s.pipeline.history_path);
    return default_data_dir() + "/history.db";
}

std::string resolved_recordings_dir(const Settings& s) {
    if (!s.pipeline.recordings_dir.empty()) return expand_path(s.pipeline.recordings_dir);
    return default_data_dir() + "/recordings";
}

} // namespace rune
