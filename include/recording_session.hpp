#pragma once

#include "capture_backend.hpp"
#include "session_signal.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace holdtalk {

enum class SessionState {
    Capturing,
    Transcribing,
    Committed,
    Aborted
};

const char* session_state_name(SessionState state);

// One press-hold-release cycle. Pure state: the orchestrator performs the
// backend calls (through its session worker) and records the outcome here.
//
//   Capturing --commit--> Transcribing --result--> Committed
//       |                      |
//       +------abort------> Aborted <--failure-----+
class RecordingSession {
public:
    RecordingSession(uint64_t id, Clock::time_point started_at);

    uint64_t id() const { return id_; }
    SessionState state() const { return state_; }

    // Capturing or Transcribing
    bool is_active() const;
    bool is_finished() const { return !is_active(); }

    // Capture backend acknowledged start(). Returns false if no capture is
    // expected any more (the session already ended); the caller then has to
    // discard the handle itself.
    bool attach_capture(CaptureHandle handle);
    bool capture_pending() const { return !capture_acknowledged_; }
    bool has_capture() const { return capture_.has_value(); }

    // Hands the capture handle to a stop request; the session no longer owns it
    std::optional<CaptureHandle> release_capture();

    // Capturing -> Transcribing
    bool begin_transcribing(Clock::time_point now);

    // Transcribing -> Committed
    bool commit(Clock::time_point now);

    // Capturing -> Aborted for any reason. From Transcribing only backend
    // failures (capture, transcription) or shutdown are accepted: the hold
    // itself can not be cancelled once released.
    bool abort(AbortReason reason, Clock::time_point now);

    AbortReason abort_reason() const { return abort_reason_; }
    Clock::time_point started_at() const { return started_at_; }
    std::optional<Clock::time_point> ended_at() const { return ended_at_; }
    std::optional<Clock::time_point> released_at() const { return released_at_; }

    std::chrono::milliseconds capture_duration(Clock::time_point now) const;

private:
    uint64_t id_;
    SessionState state_ = SessionState::Capturing;
    Clock::time_point started_at_;
    std::optional<Clock::time_point> released_at_;
    std::optional<Clock::time_point> ended_at_;
    std::optional<CaptureHandle> capture_;
    bool capture_acknowledged_ = false;
    AbortReason abort_reason_ = AbortReason::None;
};

} // namespace holdtalk
