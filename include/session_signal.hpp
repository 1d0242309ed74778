#pragma once

#include <chrono>

namespace holdtalk {

using Clock = std::chrono::steady_clock;

enum class AbortReason {
    None,
    ModifierReleasedEarly,
    TooShort,
    DeviceDisconnected,
    CaptureFailed,
    TranscriptionFailed,
    Shutdown
};

inline const char* abort_reason_name(AbortReason reason) {
    switch (reason) {
        case AbortReason::None: return "none";
        case AbortReason::ModifierReleasedEarly: return "modifier released early";
        case AbortReason::TooShort: return "too short";
        case AbortReason::DeviceDisconnected: return "device disconnected";
        case AbortReason::CaptureFailed: return "capture failed";
        case AbortReason::TranscriptionFailed: return "transcription failed";
        case AbortReason::Shutdown: return "shutdown";
    }
    return "unknown";
}

enum class SignalType {
    SessionStart,
    SessionAbort,
    SessionCommit
};

struct HotkeySignal {
    SignalType type;
    AbortReason reason = AbortReason::None;   // set for SessionAbort
    Clock::time_point time;
};

} // namespace holdtalk
