#pragma once

#include "capture_backend.hpp"
#include "config.hpp"
#include "daemon_event.hpp"
#include "device_filter.hpp"
#include "device_source.hpp"
#include "hotkey_state_machine.hpp"
#include "notifier.hpp"
#include "post_processor.hpp"
#include "recording_session.hpp"
#include "text_injector.hpp"
#include "transcription_engine.hpp"
#include "worker.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace holdtalk {

struct OrchestratorStats {
    uint64_t sessions_started = 0;
    uint64_t sessions_refused = 0;      // hotkey pressed while a session was outstanding
    uint64_t sessions_committed = 0;    // transcribed successfully
    uint64_t sessions_aborted = 0;
    uint64_t transcriptions = 0;        // dispatched to the session worker
    uint64_t injections = 0;            // delivered successfully
    uint64_t noops = 0;                 // nothing left after post-processing
    uint64_t errors = 0;
    uint64_t ignored_events = 0;        // key events from unmonitored devices
};

// Top-level control loop. One thread (the one calling run() or pump()) owns
// the device filter, the hotkey state machine and the current session; device
// readers and the two workers only post DaemonEvents to its inbox.
//
// Session worker:  capture start/stop, transcription (bounded by a timeout)
// Delivery worker: post-processing, injection (bounded by a timeout)
class Orchestrator {
public:
    struct Backends {
        std::shared_ptr<DeviceSource> devices;
        std::shared_ptr<CaptureBackend> capture;
        std::shared_ptr<TranscriptionEngine> engine;
        std::shared_ptr<TextInjector> injector;
        std::shared_ptr<Notifier> notifier;
    };

    Orchestrator(const Config& config, const HotkeyBinding& binding, Backends backends);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Starts the workers and device discovery
    bool start();

    // Processes events until request_stop(), then shuts down (blocking)
    int run();

    // Only sets a flag; safe to call from a signal handler
    void request_stop() { should_quit_.store(true); }

    // Cancels the in-flight session (capture discarded), drains the workers,
    // then releases the devices
    void shutdown();

    // Thread-safe
    bool post(DaemonEvent event);

    // Handles at most one queued event; returns false if none arrived in time
    bool pump(std::chrono::milliseconds timeout);

    // Pumps until done() holds; returns false on timeout
    bool pump_until(const std::function<bool()>& done, std::chrono::milliseconds timeout);

    bool has_active_session() const;
    std::optional<SessionState> session_state() const;
    std::optional<AbortReason> last_abort_reason() const;
    HotkeyState hotkey_state() const { return hotkey_.state(); }
    const DeviceFilter& device_filter() const { return filter_; }
    const OrchestratorStats& stats() const { return stats_; }

    // Jobs queued or running in the workers
    size_t pending_work() const;

private:
    void handle_event(DaemonEvent& event);
    void on_key_event(const KeyEvent& event);
    void on_device_added(const DeviceAdded& added);
    void on_device_removed(const DeviceRemoved& removed);
    void on_signal(const HotkeySignal& signal);
    void on_capture_started(const CaptureStarted& started);
    void on_capture_discarded(const CaptureDiscarded& discarded);
    void on_transcription_finished(const TranscriptionFinished& finished);
    void on_delivery_finished(const DeliveryFinished& finished);

    void start_session(Clock::time_point time);
    void commit_session(Clock::time_point time);
    void abort_session(AbortReason reason, Clock::time_point time,
                       ErrorKind error = ErrorKind::None, const std::string& detail = "");
    void check_recording_limit(Clock::time_point now);

    // Shared between the orchestrator and the capture-start job of one session.
    // The job parks the handle here until the orchestrator claims it; an abort
    // that finds no handle sets `cancelled` and the job stops the capture itself.
    struct CaptureTicket {
        std::mutex mutex;
        bool cancelled = false;
        std::optional<CaptureHandle> handle;
    };

    void dispatch_capture_start(uint64_t session_id, std::shared_ptr<CaptureTicket> ticket);
    void dispatch_discard(uint64_t session_id, CaptureHandle handle);
    void dispatch_transcription(uint64_t session_id, CaptureHandle handle);
    void dispatch_delivery(uint64_t session_id, const std::string& raw_text);

    void notify(const UiEvent& event);

    Config config_;
    Backends backends_;
    std::shared_ptr<const PostProcessor> processor_;

    DeviceFilter filter_;
    HotkeyStateMachine hotkey_;

    EventQueue inbox_;
    Worker session_worker_{"session"};
    Worker delivery_worker_{"delivery"};

    // Single current session; replaced when the next one starts
    std::unique_ptr<RecordingSession> session_;
    std::shared_ptr<CaptureTicket> capture_ticket_;
    uint64_t next_session_id_ = 1;

    // True while the key hold that started session_ has not been released yet.
    // A refused hold must not commit or abort someone else's session.
    bool hold_owns_session_ = false;

    OrchestratorStats stats_;

    std::shared_ptr<std::atomic<bool>> cancel_;
    std::atomic<bool> should_quit_{false};
    bool started_ = false;
    bool shut_down_ = false;
};

} // namespace holdtalk
