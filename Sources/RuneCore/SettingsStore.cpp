#include "SettingsStore.hpp"

#include "Errors.hpp"
#include "EventBus.hpp"
#include "Log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace rune {

namespace {
constexpr const char* kTag = "settings";
} // namespace

SettingsStore::SettingsStore(std::string path, EventBus* bus)
    : path_(path.empty() ? default_settings_path() : expand_path(path)), bus_(bus) {}

// ---------------------------------------------------------------------------
// load / save
// ---------------------------------------------------------------------------

void SettingsStore::load() {
    std::lock_guard<std::mutex> lock(mu_);

    std::ifstream f(path_);
    if (!f.good()) {
        log::info(kTag, "no settings at " + path_ + ", creating defaults");
        settings_  = Settings{};
        read_only_ = false;
        save_locked();
        return;
    }

    std::stringstream content;
    content << f.rdbuf();

    try {
        const nlohmann::json j = nlohmann::json::parse(content.str());
        if (!j.is_object()) {
            throw RuneError(ErrorCode::config_error, "Settings root must be an object");
        }
        Settings parsed;
        from_json(j, parsed);
        settings_  = std::move(parsed);
        read_only_ = false;
    } catch (const nlohmann::json::exception& e) {
        settings_  = Settings{};
        read_only_ = true;
        throw RuneError(ErrorCode::config_error,
                        "Cannot parse " + path_ + ": " + e.what());
    } catch (const RuneError& e) {
        settings_  = Settings{};
        read_only_ = true;
        throw RuneError(ErrorCode::config_error, "Cannot parse " + path_ + ": " + e.what());
    }

    log::debug(kTag, "loaded " + path_);
}

void SettingsStore::save_locked() const {
    if (read_only_) {
        log::warn(kTag, "not writing " + path_ + ": the file on disk could not be parsed");
        return;
    }

    const std::filesystem::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw RuneError(ErrorCode::config_error,
                            "Cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw RuneError(ErrorCode::config_error, "Cannot write " + tmp);
        }
        nlohmann::json j;
        rune::to_json(j, settings_);
        out << j.dump(2) << '\n';
        if (!out) {
            throw RuneError(ErrorCode::config_error, "Cannot write " + tmp);
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        throw RuneError(ErrorCode::config_error,
                        "Cannot replace " + path_ + ": " + ec.message());
    }
}

bool SettingsStore::read_only() const {
    std::lock_guard<std::mutex> lock(mu_);
    return read_only_;
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

Settings SettingsStore::get() const {
    std::lock_guard<std::mutex> lock(mu_);
    return settings_;
}

nlohmann::json SettingsStore::to_json() const {
    nlohmann::json j;
    rune::to_json(j, get());
    return j;
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

void SettingsStore::update(const std::function<void(Settings&)>& edit) {
    Settings snapshot;
    {
        std::lock_guard<std::mutex> lock(mu_);
        Settings next = settings_;
        edit(next);
        std::swap(settings_, next);
        try {
            save_locked();
        } catch (const RuneError&) {
            std::swap(settings_, next);   // keep memory and disk in step
            throw;
        }
        snapshot = settings_;
    }
    publish(snapshot);
}

void SettingsStore::update_shortcuts(const std::optional<std::string>& key,
                                     const std::optional<std::string>& modifier) {
    update([&](Settings& s) {
        s.shortcuts.record_key      = key;
        s.shortcuts.record_modifier = modifier;
    });
}

void SettingsStore::set_default_device(const std::optional<std::string>& device_id) {
    update([&](Settings& s) {
        if (device_id && !device_id->empty()) {
            s.audio.default_device = device_id;
        } else {
            s.audio.default_device.reset();
        }
    });
}

void SettingsStore::update_user_profile(const UserProfile& profile) {
    update([&](Settings& s) { s.user_profile = profile; });
}

void SettingsStore::update_api_key(const std::string& service, const std::string& key) {
    if (service.empty()) {
        throw RuneError(ErrorCode::invalid_argument, "API key service name is empty");
    }
    update([&](Settings& s) {
        if (key.empty()) {
            s.api_keys.erase(service);
        } else {
            s.api_keys[service] = key;
        }
    });
}

void SettingsStore::publish(const Settings& snapshot) const {
    if (!bus_) return;
    nlohmann::json j;
    rune::to_json(j, snapshot);
    bus_->publish_settings(j);
}

} // namespace rune
