#pragma once

#include "capture_backend.hpp"
#include "device_filter.hpp"
#include "errors.hpp"
#include "hotkey_state_machine.hpp"
#include "transcription_engine.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace holdtalk {

// Messages consumed by the orchestrator thread. Reader threads and workers
// never touch orchestrator state directly; they post one of these instead.

struct DeviceAdded {
    InputDevice device;
};

struct DeviceRemoved {
    std::string device_id;
    Clock::time_point time;
    std::string error;      // set when a read failed rather than a clean unplug
};

struct CaptureStarted {
    uint64_t session_id = 0;
    CaptureStartResult result;
    bool discarded = false;   // session ended first; the job already stopped it
};

struct CaptureDiscarded {
    uint64_t session_id = 0;
    bool success = false;
    std::string error;
};

struct TranscriptionFinished {
    uint64_t session_id = 0;
    TranscriptionResult result;
    ErrorKind error_kind = ErrorKind::None;   // Capture when stop() failed
};

struct DeliveryFinished {
    uint64_t session_id = 0;
    bool success = false;
    bool skipped = false;     // post-processing left nothing to inject
    size_t text_length = 0;
    std::string error;
};

struct StopRequest {};

using DaemonEvent = std::variant<KeyEvent,
                                 DeviceAdded,
                                 DeviceRemoved,
                                 CaptureStarted,
                                 CaptureDiscarded,
                                 TranscriptionFinished,
                                 DeliveryFinished,
                                 StopRequest>;

} // namespace holdtalk
