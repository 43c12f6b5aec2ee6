#pragma once

#include "Settings.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace rune {

class EventBus;

/// Owns the settings document on disk.
///
/// Thread-safe.  Every successful mutation is written back (temp file +
/// rename) and published as `settings-changed`.  If the file on disk could
/// not be parsed the store runs on defaults and never writes, so a broken
/// file is left for the user to fix.
class SettingsStore {
public:
    explicit SettingsStore(std::string path, EventBus* bus = nullptr);

    /// Read the file.  A missing file is created with defaults.
    /// @throws RuneError(config_error) if the file exists but is not a
    ///         valid settings document.  The store then holds defaults.
    void load();

    Settings get() const;
    nlohmann::json to_json() const;

    void update_shortcuts(const std::optional<std::string>& key,
                          const std::optional<std::string>& modifier);
    void set_default_device(const std::optional<std::string>& device_id);
    void update_user_profile(const UserProfile& profile);

    /// An empty key removes the entry.
    /// @throws RuneError(invalid_argument) for an empty service name.
    void update_api_key(const std::string& service, const std::string& key);

    /// Apply an arbitrary edit.
    void update(const std::function<void(Settings&)>& edit);

    const std::string& path() const { return path_; }

    /// True once load() rejected the file; writes are suppressed.
    bool read_only() const;

private:
    void save_locked() const;
    void publish(const Settings& snapshot) const;

    std::string        path_;
    EventBus*          bus_;
    mutable std::mutex mu_;
    Settings           settings_;
    bool               read_only_ = false;
};

} // namespace rune
