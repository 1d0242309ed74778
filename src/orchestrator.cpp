#include "orchestrator.hpp"
#include "log.hpp"
#include <exception>
#include <thread>
#include <utility>

namespace holdtalk {

// Inbox poll interval; bounds how late the recording limit and quit flag are seen
static constexpr std::chrono::milliseconds kLoopTick{50};

Orchestrator::Orchestrator(const Config& config, const HotkeyBinding& binding, Backends backends)
    : config_(config)
    , backends_(std::move(backends))
    , processor_(std::make_shared<const PostProcessor>(config.processing))
    , filter_(config.synthetic_patterns)
    , hotkey_(binding, std::chrono::milliseconds(config.min_hold_ms))
    , cancel_(std::make_shared<std::atomic<bool>>(false)) {
}

Orchestrator::~Orchestrator() {
    shutdown();
}

bool Orchestrator::start() {
    if (started_) return true;

    session_worker_.start();
    delivery_worker_.start();

    if (!backends_.devices->start(inbox_)) {
        log_error("holdtalk") << "Failed to start input device discovery";
        return false;
    }

    started_ = true;
    notify(UiEvent::idle("ready"));
    return true;
}

int Orchestrator::run() {
    if (!start()) {
        return 1;
    }

    while (!should_quit_.load()) {
        DaemonEvent event;
        if (inbox_.pop(event, kLoopTick)) {
            handle_event(event);
        }
        check_recording_limit(Clock::now());
    }

    log_info("holdtalk") << "Shutting down...";
    shutdown();
    return 0;
}

void Orchestrator::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;
    should_quit_.store(true);

    // Abort first so the discard is queued, or the pending start cancelled,
    // before the worker drains
    if (session_ && session_->is_active()) {
        abort_session(AbortReason::Shutdown, Clock::now());
    }
    cancel_->store(true);

    session_worker_.stop();
    delivery_worker_.stop();

    if (started_) {
        backends_.devices->stop();
    }
    inbox_.close();
}

bool Orchestrator::post(DaemonEvent event) {
    return inbox_.push(std::move(event));
}

bool Orchestrator::pump(std::chrono::milliseconds timeout) {
    DaemonEvent event;
    bool handled = inbox_.pop(event, timeout);
    if (handled) {
        handle_event(event);
    }
    check_recording_limit(Clock::now());
    return handled;
}

bool Orchestrator::pump_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (!done()) {
        if (Clock::now() >= deadline) return false;
        pump(std::chrono::milliseconds(10));
    }
    return true;
}

bool Orchestrator::has_active_session() const {
    return session_ && session_->is_active();
}

std::optional<SessionState> Orchestrator::session_state() const {
    if (!session_) return std::nullopt;
    return session_->state();
}

std::optional<AbortReason> Orchestrator::last_abort_reason() const {
    if (!session_ || session_->state() != SessionState::Aborted) return std::nullopt;
    return session_->abort_reason();
}

size_t Orchestrator::pending_work() const {
    return session_worker_.pending() + delivery_worker_.pending();
}

void Orchestrator::handle_event(DaemonEvent& event) {
    if (auto* key = std::get_if<KeyEvent>(&event)) {
        on_key_event(*key);
    } else if (auto* added = std::get_if<DeviceAdded>(&event)) {
        on_device_added(*added);
    } else if (auto* removed = std::get_if<DeviceRemoved>(&event)) {
        on_device_removed(*removed);
    } else if (auto* started = std::get_if<CaptureStarted>(&event)) {
        on_capture_started(*started);
    } else if (auto* discarded = std::get_if<CaptureDiscarded>(&event)) {
        on_capture_discarded(*discarded);
    } else if (auto* transcribed = std::get_if<TranscriptionFinished>(&event)) {
        on_transcription_finished(*transcribed);
    } else if (auto* delivered = std::get_if<DeliveryFinished>(&event)) {
        on_delivery_finished(*delivered);
    } else if (std::holds_alternative<StopRequest>(event)) {
        should_quit_.store(true);
    }
}

void Orchestrator::on_key_event(const KeyEvent& event) {
    // Readers only run for monitored devices; this also drops anything that
    // raced with a removal or came from a synthetic device
    if (!filter_.is_monitored(event.device)) {
        ++stats_.ignored_events;
        return;
    }

    if (event.action != KeyAction::Repeat) {
        log_debug("hotkey") << "Key " << (event.action == KeyAction::Press ? "DOWN" : "UP")
                            << ": " << event.code << " on " << event.device
                            << " (state: " << hotkey_state_name(hotkey_.state()) << ")";
    }

    if (auto signal = hotkey_.on_key_event(event)) {
        on_signal(*signal);
    }
}

void Orchestrator::on_device_added(const DeviceAdded& added) {
    if (filter_.is_known(added.device.id)) return;

    if (!filter_.add_device(added.device)) {
        if (filter_.classification(added.device.id) == DeviceClass::Synthetic) {
            log_info("devices") << "Skipping " << added.device.name << " (" << added.device.id
                                << "): synthetic input device";
        } else {
            log_debug("devices") << "Skipping " << added.device.name << " (" << added.device.id
                                 << "): not a keyboard";
        }
        return;
    }

    log_info("devices") << "Monitoring " << added.device.name << " (" << added.device.id << ")";
    if (!backends_.devices->watch(added.device.id)) {
        log_warning("devices") << "Cannot read " << added.device.name << " at " << added.device.id
                               << ", dropping it";
        filter_.remove_device(added.device.id);
    }
}

void Orchestrator::on_device_removed(const DeviceRemoved& removed) {
    if (!removed.error.empty()) {
        log_warning("devices") << removed.device_id << ": " << removed.error;
    }

    auto signal = hotkey_.on_device_removed(removed.device_id, removed.time);

    const bool was_monitored = filter_.is_monitored(removed.device_id);
    if (was_monitored) {
        backends_.devices->unwatch(removed.device_id);
    }
    filter_.remove_device(removed.device_id);

    if (was_monitored && filter_.monitored_devices().empty()) {
        log_warning("devices") << "No keyboard left to monitor, waiting for one to be plugged in";
    }

    if (signal) {
        on_signal(*signal);
    }
}

void Orchestrator::on_signal(const HotkeySignal& signal) {
    switch (signal.type) {
        case SignalType::SessionStart:
            start_session(signal.time);
            break;

        case SignalType::SessionAbort:
            if (!hold_owns_session_) return;
            hold_owns_session_ = false;
            abort_session(signal.reason, signal.time);
            break;

        case SignalType::SessionCommit:
            if (!hold_owns_session_) return;
            hold_owns_session_ = false;
            commit_session(signal.time);
            break;
    }
}

void Orchestrator::start_session(Clock::time_point time) {
    if (session_ && session_->is_active()) {
        ++stats_.sessions_refused;
        log_warning("session") << "Session " << session_->id() << " is still "
                               << session_state_name(session_->state()) << ", ignoring hotkey";
        return;
    }

    session_ = std::make_unique<RecordingSession>(next_session_id_++, time);
    capture_ticket_ = std::make_shared<CaptureTicket>();
    hold_owns_session_ = true;
    ++stats_.sessions_started;

    log_info("session") << "Session " << session_->id() << ": recording...";
    notify(UiEvent::recording());
    dispatch_capture_start(session_->id(), capture_ticket_);
}

void Orchestrator::commit_session(Clock::time_point time) {
    if (!session_ || !session_->begin_transcribing(time)) return;

    log_info("session") << "Session " << session_->id() << ": transcribing "
                        << session_->capture_duration(time).count() << "ms of audio...";
    notify(UiEvent::transcribing());

    if (auto handle = session_->release_capture()) {
        dispatch_transcription(session_->id(), *handle);
    }
    // Otherwise the capture has not been acknowledged yet; on_capture_started
    // dispatches the transcription when it is
}

void Orchestrator::abort_session(AbortReason reason, Clock::time_point time,
                                 ErrorKind error, const std::string& detail) {
    if (!session_ || !session_->abort(reason, time)) return;

    ++stats_.sessions_aborted;
    log_info("session") << "Session " << session_->id() << " aborted: " << abort_reason_name(reason);

    std::optional<CaptureHandle> handle = session_->release_capture();
    if (!handle && capture_ticket_) {
        // Not acknowledged yet: take the parked handle, or have the start
        // job stop the capture before the session worker runs anything else
        std::lock_guard<std::mutex> lock(capture_ticket_->mutex);
        capture_ticket_->cancelled = true;
        handle.swap(capture_ticket_->handle);
    }
    if (handle) {
        dispatch_discard(session_->id(), *handle);
    }

    if (error != ErrorKind::None) {
        ++stats_.errors;
        notify(UiEvent::failure(error, detail));
    } else {
        notify(UiEvent::idle(abort_reason_name(reason)));
    }
}

void Orchestrator::check_recording_limit(Clock::time_point now) {
    if (!session_ || session_->state() != SessionState::Capturing) return;
    if (session_->capture_duration(now) < std::chrono::milliseconds(config_.max_recording_ms)) return;

    log_warning("session") << "Maximum recording length (" << config_.max_recording_ms
                           << "ms) reached, transcribing";
    hold_owns_session_ = false;
    commit_session(now);
}

void Orchestrator::on_capture_started(const CaptureStarted& started) {
    const bool current = session_ && session_->id() == started.session_id;

    if (!started.result.success) {
        log_error("session") << "Failed to start audio capture: " << started.result.error;
        if (current) {
            hold_owns_session_ = false;
            abort_session(AbortReason::CaptureFailed, Clock::now(),
                          ErrorKind::Capture, started.result.error);
        }
        return;
    }

    if (started.discarded || !current) {
        // The session ended first; its abort or the start job stopped the capture
        log_debug("session") << "Session " << started.session_id
                             << ": capture started after the session ended";
        return;
    }

    std::optional<CaptureHandle> handle;
    {
        std::lock_guard<std::mutex> lock(capture_ticket_->mutex);
        handle.swap(capture_ticket_->handle);
    }
    if (!handle) return;

    if (!session_->attach_capture(*handle)) {
        dispatch_discard(started.session_id, *handle);
        return;
    }

    if (session_->state() == SessionState::Transcribing) {
        if (auto handle = session_->release_capture()) {
            dispatch_transcription(session_->id(), *handle);
        }
    }
}

void Orchestrator::on_capture_discarded(const CaptureDiscarded& discarded) {
    if (!discarded.success) {
        log_warning("session") << "Session " << discarded.session_id
                               << ": failed to stop discarded capture: " << discarded.error;
    }
}

void Orchestrator::on_transcription_finished(const TranscriptionFinished& finished) {
    if (!session_ || session_->id() != finished.session_id ||
        session_->state() != SessionState::Transcribing) {
        log_debug("session") << "Dropping result of session " << finished.session_id;
        return;
    }

    if (finished.error_kind != ErrorKind::None || !finished.result.success) {
        ErrorKind kind = finished.error_kind == ErrorKind::None ? ErrorKind::Transcription
                                                                : finished.error_kind;
        AbortReason reason = kind == ErrorKind::Capture ? AbortReason::CaptureFailed
                                                        : AbortReason::TranscriptionFailed;
        log_error("session") << "Session " << session_->id() << ": "
                             << error_kind_name(kind) << " failed: " << finished.result.error;
        abort_session(reason, Clock::now(), kind, finished.result.error);
        return;
    }

    session_->commit(Clock::now());
    ++stats_.sessions_committed;

    log_info("session") << "Session " << session_->id() << " transcribed in "
                        << finished.result.duration_ms << "ms [" << finished.result.language << "]: \""
                        << finished.result.text << "\"";

    dispatch_delivery(session_->id(), finished.result.text);
}

void Orchestrator::on_delivery_finished(const DeliveryFinished& finished) {
    if (finished.skipped) {
        ++stats_.noops;
        log_info("session") << "Session " << finished.session_id << ": no speech detected";
        notify(UiEvent::noop());
    } else if (finished.success) {
        ++stats_.injections;
        log_info("session") << "Session " << finished.session_id << ": injected "
                            << finished.text_length << " characters";
        notify(UiEvent::done(finished.text_length));
    } else {
        ++stats_.errors;
        log_error("session") << "Session " << finished.session_id << ": injection failed: "
                             << finished.error;
        notify(UiEvent::failure(ErrorKind::Injection, finished.error));
    }
}

void Orchestrator::dispatch_capture_start(uint64_t session_id, std::shared_ptr<CaptureTicket> ticket) {
    auto capture = backends_.capture;
    EventQueue* inbox = &inbox_;

    session_worker_.post([capture, inbox, session_id, ticket]() {
        CaptureStarted started;
        started.session_id = session_id;
        try {
            started.result = capture->start();
        } catch (const std::exception& e) {
            started.result.success = false;
            started.result.error = e.what();
        }

        if (started.result.success) {
            std::lock_guard<std::mutex> lock(ticket->mutex);
            if (ticket->cancelled) {
                started.discarded = true;
            } else {
                ticket->handle = started.result.handle;
            }
        }

        // Stopped here so the next session's start finds the device free
        if (started.discarded) {
            try {
                CaptureStopResult stopped = capture->stop(started.result.handle, false);
                if (!stopped.success) {
                    log_warning("session") << "Session " << session_id
                                           << ": failed to stop discarded capture: " << stopped.error;
                }
            } catch (const std::exception& e) {
                log_warning("session") << "Session " << session_id
                                       << ": failed to stop discarded capture: " << e.what();
            }
        }
        inbox->push(std::move(started));
    });
}

void Orchestrator::dispatch_discard(uint64_t session_id, CaptureHandle handle) {
    auto capture = backends_.capture;
    EventQueue* inbox = &inbox_;

    session_worker_.post([capture, inbox, session_id, handle]() {
        CaptureDiscarded discarded;
        discarded.session_id = session_id;
        try {
            CaptureStopResult stopped = capture->stop(handle, false);
            discarded.success = stopped.success;
            discarded.error = stopped.error;
        } catch (const std::exception& e) {
            discarded.error = e.what();
        }
        inbox->push(std::move(discarded));
    });
}

void Orchestrator::dispatch_transcription(uint64_t session_id, CaptureHandle handle) {
    ++stats_.transcriptions;

    auto capture = backends_.capture;
    auto engine = backends_.engine;
    auto cancel = cancel_;
    const std::string language = config_.language;
    const std::chrono::milliseconds timeout(config_.transcription_timeout_ms);
    EventQueue* inbox = &inbox_;

    session_worker_.post([=]() {
        TranscriptionFinished finished;
        finished.session_id = session_id;

        CaptureStopResult stopped;
        try {
            stopped = capture->stop(handle, true);
        } catch (const std::exception& e) {
            stopped.success = false;
            stopped.error = e.what();
        }
        if (!stopped.success) {
            finished.error_kind = ErrorKind::Capture;
            finished.result.error = "failed to stop capture: " + stopped.error;
            inbox->push(std::move(finished));
            return;
        }
        if (stopped.audio.empty()) {
            finished.error_kind = ErrorKind::Transcription;
            finished.result.error = "no audio captured";
            inbox->push(std::move(finished));
            return;
        }

        auto audio = std::make_shared<const AudioBuffer>(std::move(stopped.audio));
        TranscriptionResult result;
        bool completed = false;
        try {
            completed = run_with_timeout<TranscriptionResult>(
                [engine, audio, language]() { return engine->transcribe(*audio, language); },
                timeout, result, cancel.get());
        } catch (const std::exception& e) {
            completed = true;
            result.success = false;
            result.error = e.what();
        }

        if (!completed) {
            finished.error_kind = ErrorKind::Transcription;
            finished.result.error = cancel->load()
                ? "cancelled"
                : "timed out after " + std::to_string(timeout.count()) + "ms";
        } else {
            finished.result = result;
            if (!result.success) {
                finished.error_kind = ErrorKind::Transcription;
            }
        }
        inbox->push(std::move(finished));
    });
}

void Orchestrator::dispatch_delivery(uint64_t session_id, const std::string& raw_text) {
    auto processor = processor_;
    auto injector = backends_.injector;
    auto cancel = cancel_;
    const std::chrono::milliseconds delay(config_.injection_delay_ms);
    const std::chrono::milliseconds timeout(config_.injection_timeout_ms);
    EventQueue* inbox = &inbox_;

    delivery_worker_.post([=]() {
        DeliveryFinished finished;
        finished.session_id = session_id;

        const std::string text = processor->process(raw_text);
        if (text.empty()) {
            finished.success = true;
            finished.skipped = true;
            inbox->push(std::move(finished));
            return;
        }
        finished.text_length = text.size();

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        InjectionResult result;
        bool completed = false;
        try {
            completed = run_with_timeout<InjectionResult>(
                [injector, text]() { return injector->inject(text); },
                timeout, result, cancel.get());
        } catch (const std::exception& e) {
            completed = true;
            result.success = false;
            result.error = e.what();
        }

        if (!completed) {
            finished.error = cancel->load()
                ? "cancelled"
                : "timed out after " + std::to_string(timeout.count()) + "ms";
        } else if (!result.success) {
            finished.error = result.error;
        } else {
            finished.success = true;
        }
        inbox->push(std::move(finished));
    });
}

void Orchestrator::notify(const UiEvent& event) {
    if (backends_.notifier) {
        backends_.notifier->notify(event);
    }
}

} // namespace holdtalk
