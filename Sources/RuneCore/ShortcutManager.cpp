#include "ShortcutManager.hpp"

#include "Errors.hpp"
#include "Log.hpp"
#include "SettingsStore.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>
#include <vector>

namespace rune {

namespace {

constexpr const char* kTag = "shortcuts";

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

const std::vector<std::string>& known_keys() {
    static const std::vector<std::string> keys = [] {
        std::vector<std::string> k;
        for (char c = 'A'; c <= 'Z'; ++c) k.push_back(std::string("Key") + c);
        for (char c = '0'; c <= '9'; ++c) k.push_back(std::string("Digit") + c);
        for (char c = '0'; c <= '9'; ++c) k.push_back(std::string("Numpad") + c);
        for (int i = 1; i <= 24; ++i) k.push_back("F" + std::to_string(i));
        for (const char* name : {
                 "Space", "Enter", "Tab", "Escape", "Backspace", "Delete", "Insert",
                 "Home", "End", "PageUp", "PageDown",
                 "ArrowUp", "ArrowDown", "ArrowLeft", "ArrowRight",
                 "Minus", "Equal", "BracketLeft", "BracketRight", "Backslash",
                 "Semicolon", "Quote", "Backquote", "Comma", "Period", "Slash",
                 "CapsLock", "PrintScreen", "ScrollLock", "Pause", "ContextMenu",
                 "NumpadAdd", "NumpadSubtract", "NumpadMultiply", "NumpadDivide",
                 "NumpadDecimal", "NumpadEnter", "NumpadEqual",
                 "AudioVolumeMute", "AudioVolumeUp", "AudioVolumeDown",
                 "MediaPlayPause", "MediaStop", "MediaTrackNext", "MediaTrackPrevious"}) {
            k.emplace_back(name);
        }
        return k;
    }();
    return keys;
}

// Canonical modifier names in display order, with their aliases.
struct ModifierAlias {
    const char* canonical;
    std::array<const char*, 4> aliases;
};

constexpr std::array<ModifierAlias, 4> kModifiers = {{
    {"CONTROL", {"CONTROL", "CTRL", nullptr, nullptr}},
    {"SHIFT",   {"SHIFT", nullptr, nullptr, nullptr}},
    {"ALT",     {"ALT", "OPTION", nullptr, nullptr}},
    {"SUPER",   {"SUPER", "META", "COMMAND", "CMD"}},
}};

} // namespace

std::string Hotkey::to_string() const {
    return modifier ? *modifier + "+" + key : key;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

std::optional<std::string> ShortcutManager::canonical_key(const std::string& key) {
    const std::string wanted = upper(trim(key));
    if (wanted.empty()) return std::nullopt;
    for (const auto& k : known_keys()) {
        if (upper(k) == wanted) return k;
    }
    return std::nullopt;
}

std::optional<std::string> ShortcutManager::canonical_modifier(const std::string& modifier) {
    std::array<bool, kModifiers.size()> present{};

    std::size_t start = 0;
    const std::string input = upper(modifier);
    while (start <= input.size()) {
        std::size_t end = input.find('+', start);
        if (end == std::string::npos) end = input.size();
        const std::string part = trim(input.substr(start, end - start));
        start = end + 1;

        if (part.empty()) return std::nullopt;

        bool matched = false;
        for (std::size_t i = 0; i < kModifiers.size() && !matched; ++i) {
            for (const char* alias : kModifiers[i].aliases) {
                if (alias && part == alias) {
                    present[i] = true;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) return std::nullopt;
    }

    std::string out;
    for (std::size_t i = 0; i < kModifiers.size(); ++i) {
        if (!present[i]) continue;
        if (!out.empty()) out += '+';
        out += kModifiers[i].canonical;
    }
    return out;
}

std::optional<Hotkey> ShortcutManager::parse(const std::string& key, const std::string& modifier) {
    const std::string k = trim(key);
    const std::string m = trim(modifier);

    if (k.empty() && m.empty()) return std::nullopt;
    if (k.empty()) {
        throw RuneError(ErrorCode::invalid_argument, "A modifier needs a key");
    }

    Hotkey hotkey;
    auto canon_key = canonical_key(k);
    if (!canon_key) {
        throw RuneError(ErrorCode::invalid_argument, "Unknown key '" + k + "'");
    }
    hotkey.key = *canon_key;

    if (!m.empty()) {
        auto canon_mod = canonical_modifier(m);
        if (!canon_mod) {
            throw RuneError(ErrorCode::invalid_argument, "Unknown modifier '" + m + "'");
        }
        hotkey.modifier = *canon_mod;
    }
    return hotkey;
}

// ---------------------------------------------------------------------------
// ShortcutManager
// ---------------------------------------------------------------------------

ShortcutManager::ShortcutManager(SettingsStore& settings, HotkeyRegistrar& registrar,
                                 HotkeyRegistrar::Handler handler)
    : settings_(settings), registrar_(registrar), handler_(std::move(handler)) {}

void ShortcutManager::register_from_settings() {
    const Settings s = settings_.get();
    std::optional<Hotkey> hotkey;
    try {
        hotkey = parse(s.shortcuts.record_key.value_or(""),
                       s.shortcuts.record_modifier.value_or(""));
    } catch (const RuneError& e) {
        log::error(kTag, std::string("stored shortcut ignored: ") + e.what());
        std::lock_guard<std::mutex> lock(mu_);
        registrar_.unregister_all();
        current_.reset();
        return;
    }
    apply(hotkey);
}

void ShortcutManager::update_shortcuts(const std::string& key, const std::string& modifier) {
    const std::optional<Hotkey> hotkey = parse(key, modifier);

    if (hotkey) {
        settings_.update_shortcuts(hotkey->key, hotkey->modifier);
    } else {
        settings_.update_shortcuts(std::nullopt, std::nullopt);
    }
    apply(hotkey);
}

void ShortcutManager::apply(const std::optional<Hotkey>& hotkey) {
    std::lock_guard<std::mutex> lock(mu_);

    registrar_.unregister_all();
    current_.reset();

    if (!hotkey) {
        log::info(kTag, "record shortcut cleared");
        return;
    }

    registrar_.register_hotkey(*hotkey, handler_);
    current_ = hotkey;
    log::info(kTag, "record shortcut is " + hotkey->to_string());
}

std::optional<Hotkey> ShortcutManager::current() const {
    std::lock_guard<std::mutex> lock(mu_);
    return current_;
}

} // namespace rune
