#include "PermissionManager.hpp"

#include "AudioCaptureEngine.hpp"
#include "Errors.hpp"
#include "EventBus.hpp"
#include "Log.hpp"

#include <unistd.h>

#include <utility>

namespace rune {

namespace {
constexpr const char* kTag = "permissions";

nlohmann::json tri_state(const std::optional<bool>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}
} // namespace

PermissionManager::PermissionManager(AudioCaptureEngine& capture, EventBus* bus,
                                     std::string uinput_path)
    : capture_(capture), bus_(bus), uinput_path_(std::move(uinput_path)) {}

// ---------------------------------------------------------------------------
// Microphone
// ---------------------------------------------------------------------------

bool PermissionManager::check_microphone() {
    bool granted = true;

    // A running capture already proves access.
    if (!capture_.is_capturing()) {
        try {
            capture_.probe(std::nullopt);
        } catch (const RuneError& e) {
            switch (e.code()) {
                case ErrorCode::permission_denied:
                    granted = false;
                    break;
                case ErrorCode::already_recording:
                    break;
                default:
                    log::debug(kTag, std::string("microphone probe: ") + e.what());
                    break;
            }
        }
    }

    record(microphone_, granted);
    return granted;
}

bool PermissionManager::request_microphone() {
    const bool granted = check_microphone();
    if (!granted) {
        log::warn(kTag, "microphone access denied; add this user to the 'audio' group "
                        "or allow the application in the sound server's privacy settings");
    }
    return granted;
}

// ---------------------------------------------------------------------------
// Accessibility
// ---------------------------------------------------------------------------

bool PermissionManager::check_accessibility() {
    const bool granted = ::access(uinput_path_.c_str(), W_OK) == 0;
    record(accessibility_, granted);
    return granted;
}

bool PermissionManager::request_accessibility() {
    // There is no prompt to show; tell the user what to change.
    const bool granted = check_accessibility();
    if (!granted) {
        log::warn(kTag, "no write access to " + uinput_path_
                            + "; add a udev rule or the 'input' group to allow text injection");
    }
    return granted;
}

bool PermissionManager::check_all() {
    const bool accessibility = check_accessibility();
    const bool microphone    = check_microphone();
    return accessibility && microphone;
}

// ---------------------------------------------------------------------------
// record
// ---------------------------------------------------------------------------

void PermissionManager::record(std::optional<bool>& slot, bool value) {
    nlohmann::json payload;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (slot && *slot == value) return;
        slot = value;
        payload = {
            {"microphone", tri_state(microphone_)},
            {"accessibility", tri_state(accessibility_)},
        };
    }
    log::info(kTag, "permissions now " + payload.dump());
    if (bus_) bus_->publish_permissions(payload);
}

} // namespace rune
