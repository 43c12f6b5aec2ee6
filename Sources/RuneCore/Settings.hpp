#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>

namespace rune {

struct ShortcutSettings {
    std::optional<std::string> record_key      = std::string("Space");
    std::optional<std::string> record_modifier = std::string("CONTROL");
};

struct AudioSettings {
    std::optional<std::string> default_device;
    std::string input_format;          // empty = platform default
    int         sample_rate = 48000;   // requested capture rate
    int         channels    = 1;
};

struct WindowSettings {
    double width  = 400.0;
    double height = 80.0;
};

struct UserProfile {
    std::string name;
    std::string email;
    std::string about;
};

struct PipelineSettings {
    int         max_recording_seconds  = 120;
    int         completion_grace_ms    = 1500;
    int         engine_timeout_seconds = 120;
    int         min_recording_ms       = 100;
    std::string model_path;
    std::string language       = "en";
    bool        keep_recordings = false;
    std::string recordings_dir;        // empty = <data dir>/recordings
    std::string history_path;          // empty = <data dir>/history.db
    bool        inject_text = true;    // type the result into the focused window
    std::string typing_tool;           // ydotool, wtype or xdotool; empty = first that works
};

/// The persisted settings document.
struct Settings {
    ShortcutSettings                   shortcuts;
    AudioSettings                      audio;
    WindowSettings                     window;
    UserProfile                        user_profile;
    std::map<std::string, std::string> api_keys;   // service -> key
    PipelineSettings                   pipeline;
    std::string                        log_level = "info";
};

// JSON mapping.  Missing keys keep their defaults; null clears optionals.
void to_json(nlohmann::json& j, const Settings& s);
void from_json(const nlohmann::json& j, Settings& s);

/// $XDG_CONFIG_HOME/rune/settings.json or ~/.config/rune/settings.json
std::string default_settings_path();

/// $XDG_DATA_HOME/rune or ~/.local/share/rune
std::string default_data_dir();

/// Expand a leading "~/" using $HOME.
std::string expand_path(const std::string& path);

/// history_path / recordings_dir with defaults applied and "~" expanded.
std::string resolved_history_path(const Settings& s);
std::string resolved_recordings_dir(const Settings& s);

} // namespace rune
