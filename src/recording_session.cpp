#include "recording_session.hpp"
#include "log.hpp"

namespace holdtalk {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Capturing: return "capturing";
        case SessionState::Transcribing: return "transcribing";
        case SessionState::Committed: return "committed";
        case SessionState::Aborted: return "aborted";
    }
    return "unknown";
}

RecordingSession::RecordingSession(uint64_t id, Clock::time_point started_at)
    : id_(id)
    , started_at_(started_at) {
}

bool RecordingSession::is_active() const {
    return state_ == SessionState::Capturing || state_ == SessionState::Transcribing;
}

bool RecordingSession::attach_capture(CaptureHandle handle) {
    capture_acknowledged_ = true;
    if (state_ == SessionState::Aborted || state_ == SessionState::Committed) {
        return false;
    }
    capture_ = handle;
    return true;
}

std::optional<CaptureHandle> RecordingSession::release_capture() {
    std::optional<CaptureHandle> handle = capture_;
    capture_.reset();
    return handle;
}

bool RecordingSession::begin_transcribing(Clock::time_point now) {
    if (state_ != SessionState::Capturing) return false;
    state_ = SessionState::Transcribing;
    released_at_ = now;
    return true;
}

bool RecordingSession::commit(Clock::time_point now) {
    if (state_ != SessionState::Transcribing) return false;
    state_ = SessionState::Committed;
    ended_at_ = now;
    return true;
}

bool RecordingSession::abort(AbortReason reason, Clock::time_point now) {
    if (state_ == SessionState::Transcribing) {
        if (reason != AbortReason::CaptureFailed &&
            reason != AbortReason::TranscriptionFailed &&
            reason != AbortReason::Shutdown) {
            log_debug("session") << "Session " << id_ << " is transcribing, ignoring abort ("
                                 << abort_reason_name(reason) << ")";
            return false;
        }
    } else if (state_ != SessionState::Capturing) {
        return false;
    }

    state_ = SessionState::Aborted;
    abort_reason_ = reason;
    ended_at_ = now;
    return true;
}

std::chrono::milliseconds RecordingSession::capture_duration(Clock::time_point now) const {
    Clock::time_point end = released_at_ ? *released_at_ : (ended_at_ ? *ended_at_ : now);
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - started_at_);
}

} // namespace holdtalk
