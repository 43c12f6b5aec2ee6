#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace rune {

class SettingsStore;

/// A global trigger: optional "+"-joined canonical modifiers plus a W3C
/// `KeyboardEvent.code` key name.
struct Hotkey {
    std::optional<std::string> modifier;   // e.g. "CONTROL" or "CONTROL+SHIFT"
    std::string                key;        // e.g. "Space", "KeyR", "F5"

    /// "CONTROL+Space", or just "Space" without a modifier.
    std::string to_string() const;

    bool operator==(const Hotkey& other) const {
        return modifier == other.modifier && key == other.key;
    }
};

/// System-level hotkey listener (X11 grab, portal, IOHIDManager...).
/// Lives outside the core; the daemon supplies one.
class HotkeyRegistrar {
public:
    using Handler = std::function<void(bool pressed)>;

    virtual ~HotkeyRegistrar() = default;

    /// @throws RuneError if the OS refuses the binding.
    virtual void register_hotkey(const Hotkey& hotkey, Handler handler) = 0;
    virtual void unregister_all() = 0;
};

/// Keeps the persisted shortcut and the registered system hotkey in step.
class ShortcutManager {
public:
    ShortcutManager(SettingsStore& settings, HotkeyRegistrar& registrar,
                    HotkeyRegistrar::Handler handler);

    /// Register whatever the settings currently hold.  An invalid stored
    /// binding is logged and left unregistered.
    void register_from_settings();

    /// Validate, persist and re-register.  Both empty clears the binding;
    /// a key without modifier binds the bare key.
    /// @throws RuneError(invalid_argument) for unknown names or a modifier
    ///         without a key.
    void update_shortcuts(const std::string& key, const std::string& modifier);

    std::optional<Hotkey> current() const;

    /// Parse user input.  Returns nullopt when both are empty.
    /// @throws RuneError(invalid_argument)
    static std::optional<Hotkey> parse(const std::string& key, const std::string& modifier);

    /// Canonical spelling of a key code, or nullopt if unknown.
    static std::optional<std::string> canonical_key(const std::string& key);

    /// Canonical "+"-joined modifier set, or nullopt if any part is unknown.
    static std::optional<std::string> canonical_modifier(const std::string& modifier);

private:
    void apply(const std::optional<Hotkey>& hotkey);

    SettingsStore&           settings_;
    HotkeyRegistrar&         registrar_;
    HotkeyRegistrar::Handler handler_;
    mutable std::mutex       mu_;
    std::optional<Hotkey>    current_;
};

} // namespace rune
