#pragma once

#include <stdexcept>
#include <string>

namespace rune {

enum class ErrorCode {
    permission_denied,
    device_unavailable,
    already_recording,
    empty_recording,
    engine_failure,
    storage_unavailable,
    invalid_argument,
    config_error
};

/// Wire name used in bridge responses and `pipeline-error` events.
inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::permission_denied:   return "PermissionDenied";
        case ErrorCode::device_unavailable:  return "DeviceUnavailable";
        case ErrorCode::already_recording:   return "AlreadyRecording";
        case ErrorCode::empty_recording:     return "EmptyRecording";
        case ErrorCode::engine_failure:      return "EngineFailure";
        case ErrorCode::storage_unavailable: return "StorageUnavailable";
        case ErrorCode::invalid_argument:    return "InvalidArgument";
        case ErrorCode::config_error:        return "ConfigError";
    }
    return "Unknown";
}

/// Every failure the core reports carries one of the codes above, so
/// callers can route permission problems differently from I/O problems.
class RuneError : public std::runtime_error {
public:
    RuneError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace rune
