#pragma once

namespace holdtalk {

// Failure categories. Everything except Config is local to one session
// (or one device) and never stops the daemon.
enum class ErrorKind {
    None,
    Device,
    Capture,
    Transcription,
    Injection,
    Config
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Device: return "device";
        case ErrorKind::Capture: return "capture";
        case ErrorKind::Transcription: return "transcription";
        case ErrorKind::Injection: return "injection";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

} // namespace holdtalk
