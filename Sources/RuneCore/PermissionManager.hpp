#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace rune {

class AudioCaptureEngine;
class EventBus;

/// Answers "may we use the microphone / inject text?".
///
/// The microphone check opens and closes the configured capture device;
/// only an explicit OS refusal counts as "denied", a missing device does
/// not.  Text injection on Linux goes through uinput, so accessibility is
/// write access to the uinput node.  Whenever an answer differs from the
/// previous one a `permissions-changed` event is published.
class PermissionManager {
public:
    PermissionManager(AudioCaptureEngine& capture, EventBus* bus = nullptr,
                      std::string uinput_path = "/dev/uinput");

    bool check_microphone();
    bool request_microphone();

    bool check_accessibility();
    bool request_accessibility();

    /// Both checks; true only if both pass.
    bool check_all();

private:
    void record(std::optional<bool>& slot, bool value);

    AudioCaptureEngine&  capture_;
    EventBus*            bus_;
    std::string          uinput_path_;
    std::mutex           mu_;
    std::optional<bool>  microphone_;
    std::optional<bool>  accessibility_;
};

} // namespace rune
