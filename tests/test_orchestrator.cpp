// Automated tests for Orchestrator, with in-process fakes for every backend

#include "orchestrator.hpp"
#include "log.hpp"
#include <linux/input-event-codes.h>
#include <algorithm>
#include <atomic>
#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace holdtalk;
using std::chrono::milliseconds;

static const milliseconds kWait(3000);

class FakeDevices : public DeviceSource {
public:
    bool start(EventQueue&) override { return true; }
    bool watch(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unreadable.count(id)) return false;
        watched.insert(id);
        return true;
    }
    void unwatch(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        watched.erase(id);
        unwatched.push_back(id);
    }
    void stop() override { stopped = true; }
    std::vector<InputDevice> enumerate() override { return {}; }

    bool is_watched(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return watched.count(id) > 0;
    }

    std::set<std::string> unreadable;
    std::set<std::string> watched;
    std::vector<std::string> unwatched;
    std::atomic<bool> stopped{false};

private:
    std::mutex mutex_;
};

class FakeCapture : public CaptureBackend {
public:
    CaptureStartResult start() override {
        CaptureStartResult result;
        if (start_delay_ms.load() > 0) {
            std::this_thread::sleep_for(milliseconds(start_delay_ms.load()));
        }
        if (fail_start) {
            result.error = "no microphone";
            return result;
        }
        // One stream at a time, like the PortAudio backend
        if (running.exchange(true)) {
            refused.fetch_add(1);
            result.error = "a capture is already running";
            return result;
        }
        result.success = true;
        result.handle = ++last_handle;
        started.fetch_add(1);
        return result;
    }

    CaptureStopResult stop(CaptureHandle handle, bool keep) override {
        CaptureStopResult result;
        (void)handle;
        running = false;
        if (keep) {
            kept.fetch_add(1);
            result.audio = AudioBuffer(samples.load(), 0.1f);
        } else {
            discarded.fetch_add(1);
        }
        result.success = true;
        return result;
    }

    std::atomic<bool> fail_start{false};
    std::atomic<int> start_delay_ms{0};
    std::atomic<bool> running{false};
    std::atomic<int> refused{0};
    std::atomic<size_t> samples{16000};
    std::atomic<CaptureHandle> last_handle{0};
    std::atomic<int> started{0};
    std::atomic<int> kept{0};
    std::atomic<int> discarded{0};
};

class FakeEngine : public TranscriptionEngine {
public:
    TranscriptionResult transcribe(const AudioBuffer& audio, const std::string& language_hint) override {
        calls.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hints.push_back(language_hint);
            last_size = audio.size();
        }
        if (delay_ms.load() > 0) {
            std::this_thread::sleep_for(milliseconds(delay_ms.load()));
        }

        TranscriptionResult result;
        if (fail) {
            result.error = "model exploded";
            return result;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        result.text = text;
        result.language = language_hint;
        result.success = true;
        return result;
    }

    void set_text(const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        text = value;
    }

    std::vector<std::string> get_hints() {
        std::lock_guard<std::mutex> lock(mutex_);
        return hints;
    }

    std::atomic<int> calls{0};
    std::atomic<int> delay_ms{0};
    std::atomic<bool> fail{false};
    size_t last_size = 0;

private:
    std::mutex mutex_;
    std::string text = "hello world";
    std::vector<std::string> hints;
};

class FakeInjector : public TextInjector {
public:
    InjectionResult inject(const std::string& text) override {
        if (delay_ms.load() > 0) {
            std::this_thread::sleep_for(milliseconds(delay_ms.load()));
        }
        InjectionResult result;
        if (fail) {
            result.error = "window rejected input";
            return result;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        texts.push_back(text);
        result.success = true;
        return result;
    }
    const char* name() const override { return "fake"; }

    std::vector<std::string> get_texts() {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts;
    }

    std::atomic<int> delay_ms{0};
    std::atomic<bool> fail{false};

private:
    std::mutex mutex_;
    std::vector<std::string> texts;
};

class RecordingNotifier : public Notifier {
public:
    void notify(const UiEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(event);
    }

    int count(UiEvent::Type type) {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count_if(events.begin(), events.end(),
                                              [&](const UiEvent& e) { return e.type == type; }));
    }

    UiEvent last() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events.back();
    }

    bool has_error(ErrorKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(events.begin(), events.end(), [&](const UiEvent& e) {
            return e.type == UiEvent::Type::Error && e.error == kind;
        });
    }

private:
    std::mutex mutex_;
    std::vector<UiEvent> events;
};

static InputDevice keyboard(const std::string& id, const std::string& name) {
    InputDevice device;
    device.id = id;
    device.name = name;
    device.has_key_events = true;
    device.has_letter_keys = true;
    device.has_modifier_keys = true;
    return device;
}

static Config test_config() {
    Config config;
    config.processing.filler_words = {"um", "basically"};
    config.injection_delay_ms = 0;
    config.transcription_timeout_ms = 2000;
    config.injection_timeout_ms = 2000;
    return config;
}

// One orchestrator wired to fakes, with a physical keyboard "kbd0" attached
struct Harness {
    explicit Harness(const Config& cfg = test_config())
        : config(cfg)
        , devices(std::make_shared<FakeDevices>())
        , capture(std::make_shared<FakeCapture>())
        , engine(std::make_shared<FakeEngine>())
        , injector(std::make_shared<FakeInjector>())
        , notifier(std::make_shared<RecordingNotifier>()) {
        HotkeyBinding binding;
        std::string error;
        bool resolved = ConfigLoader::resolve_hotkey(config.hotkey, binding, error);
        assert(resolved);

        Orchestrator::Backends backends;
        backends.devices = devices;
        backends.capture = capture;
        backends.engine = engine;
        backends.injector = injector;
        backends.notifier = notifier;
        orchestrator = std::make_unique<Orchestrator>(config, binding, backends);

        bool started = orchestrator->start();
        assert(started);
        add_device(keyboard("kbd0", "AT Translated Set 2 keyboard"));
        t0 = Clock::now();
    }

    void add_device(const InputDevice& device) {
        orchestrator->post(DeviceAdded{device});
        orchestrator->pump(milliseconds(100));
    }

    void key(KeyCode code, KeyAction action, int at_ms, const char* device = "kbd0") {
        KeyEvent event;
        event.device = device;
        event.code = code;
        event.action = action;
        event.time = t0 + milliseconds(at_ms);
        orchestrator->post(event);
    }

    void press(KeyCode code, int at_ms, const char* device = "kbd0") {
        key(code, KeyAction::Press, at_ms, device);
    }

    void release(KeyCode code, int at_ms, const char* device = "kbd0") {
        key(code, KeyAction::Release, at_ms, device);
    }

    // Super+Period held for hold_ms
    void hold(int start_ms, int hold_ms, const char* device = "kbd0") {
        press(KEY_LEFTMETA, start_ms, device);
        press(KEY_DOT, start_ms + 5, device);
        release(KEY_DOT, start_ms + 5 + hold_ms, device);
        release(KEY_LEFTMETA, start_ms + 10 + hold_ms, device);
    }

    bool wait(const std::function<bool()>& done) {
        return orchestrator->pump_until(done, kWait);
    }

    // Lets anything still in flight land, then checks nothing else happened
    void settle() {
        wait([this] { return orchestrator->pending_work() == 0; });
        for (int i = 0; i < 10; ++i) {
            orchestrator->pump(milliseconds(10));
        }
    }

    Config config;
    std::shared_ptr<FakeDevices> devices;
    std::shared_ptr<FakeCapture> capture;
    std::shared_ptr<FakeEngine> engine;
    std::shared_ptr<FakeInjector> injector;
    std::shared_ptr<RecordingNotifier> notifier;
    std::unique_ptr<Orchestrator> orchestrator;
    Clock::time_point t0;
};

void test_full_session() {
    std::cout << "Testing press, hold 200ms, release..." << std::endl;

    Harness h;
    assert(h.devices->is_watched("kbd0"));

    h.hold(0, 200);
    assert(h.wait([&] { return h.orchestrator->stats().injections == 1; }));
    h.settle();

    assert(h.capture->started == 1);
    assert(h.capture->kept == 1);
    assert(h.capture->discarded == 0);
    assert(h.engine->calls == 1);
    assert(h.engine->last_size == 16000);
    assert(h.engine->get_hints() == std::vector<std::string>{"en"});
    assert(h.injector->get_texts() == std::vector<std::string>{"Hello world"});

    assert(h.orchestrator->session_state() == SessionState::Committed);
    assert(!h.orchestrator->has_active_session());
    assert(h.orchestrator->stats().sessions_committed == 1);
    assert(h.notifier->count(UiEvent::Type::Recording) == 1);
    assert(h.notifier->count(UiEvent::Type::Transcribing) == 1);
    assert(h.notifier->count(UiEvent::Type::Done) == 1);
    assert(h.notifier->last().text_length == 11);
    assert(h.orchestrator->hotkey_state() == HotkeyState::Idle);

    std::cout << "  PASS" << std::endl;
}

void test_post_processing_applied() {
    std::cout << "Testing transcription goes through post-processing..." << std::endl;

    Harness h;
    h.engine->set_text("um so basically hello");

    h.hold(0, 200);
    assert(h.wait([&] { return h.orchestrator->stats().injections == 1; }));
    assert(h.injector->get_texts() == std::vector<std::string>{"So hello"});

    std::cout << "  PASS" << std::endl;
}

void test_modifier_released_early() {
    std::cout << "Testing modifier released before the key..." << std::endl;

    Harness h;
    h.press(KEY_LEFTMETA, 0);
    h.press(KEY_DOT, 5);
    h.release(KEY_LEFTMETA, 10);
    h.release(KEY_DOT, 300);

    assert(h.wait([&] { return h.capture->discarded == 1; }));
    h.settle();

    assert(h.orchestrator->last_abort_reason() == AbortReason::ModifierReleasedEarly);
    assert(h.capture->kept == 0);
    assert(h.engine->calls == 0);
    assert(h.injector->get_texts().empty());
    assert(h.notifier->count(UiEvent::Type::Transcribing) == 0);
    assert(h.notifier->last().type == UiEvent::Type::Idle);

    std::cout << "  PASS" << std::endl;
}

void test_too_short() {
    std::cout << "Testing a tap below the dwell threshold..." << std::endl;

    Harness h;
    h.hold(0, 20);

    assert(h.wait([&] { return h.capture->discarded == 1; }));
    h.settle();

    assert(h.orchestrator->last_abort_reason() == AbortReason::TooShort);
    assert(h.engine->calls == 0);
    assert(h.injector->get_texts().empty());

    std::cout << "  PASS" << std::endl;
}

void test_tap_then_hold_with_slow_capture() {
    std::cout << "Testing a tap ending before the capture came up..." << std::endl;

    Harness h;
    h.capture->start_delay_ms = 80;

    // Too short, aborted while start() is still running; then a real hold
    h.press(KEY_LEFTMETA, 0);
    h.press(KEY_DOT, 5);
    h.release(KEY_DOT, 20);
    h.press(KEY_DOT, 30);
    h.release(KEY_DOT, 400);
    h.release(KEY_LEFTMETA, 410);

    assert(h.wait([&] { return h.orchestrator->stats().injections == 1; }));
    h.settle();

    assert(h.orchestrator->stats().sessions_started == 2);
    assert(h.orchestrator->stats().sessions_aborted == 1);
    assert(h.orchestrator->stats().errors == 0);
    assert(h.capture->refused == 0);
    assert(h.capture->started == 2);
    assert(h.capture->discarded == 1);
    assert(h.capture->kept == 1);
    assert(!h.notifier->has_error(ErrorKind::Capture));
    assert(h.injector->get_texts() == std::vector<std::string>{"Hello world"});

    std::cout << "  PASS" << std::endl;
}

void test_abort_with_capture_acknowledged_late() {
    std::cout << "Testing an abort while the capture ack is queued..." << std::endl;

    Harness h;
    h.capture->start_delay_ms = 50;

    h.press(KEY_LEFTMETA, 0);
    h.press(KEY_DOT, 5);
    assert(h.wait([&] { return h.orchestrator->hotkey_state() == HotkeyState::Armed; }));

    // Queued ahead of the ack; handled only after start() has returned
    h.release(KEY_LEFTMETA, 10);
    h.release(KEY_DOT, 300);
    while (h.capture->started == 0) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    std::this_thread::sleep_for(milliseconds(20));

    h.hold(500, 200);
    assert(h.wait([&] { return h.orchestrator->stats().injections == 1; }));
    h.settle();

    assert(h.capture->refused == 0);
    assert(h.capture->discarded == 1);
    assert(h.capture->kept == 1);
    assert(h.orchestrator->stats().sessions_aborted == 1);
    assert(h.orchestrator->stats().errors == 0);

    std::cout << "  PASS" << std::endl;
}

void test_synthetic_device_ignored() {
    std::cout << "Testing injected keystrokes never start a session..." << std::endl;

    Harness h;
    h.add_device(keyboard("event20", "ydotoold virtual device"));
    assert(!h.devices->is_watched("event20"));
    assert(h.orchestrator->device_filter().classification("event20") == DeviceClass::Synthetic);

    // Even if a reader delivered them, they are dropped
    h.hold(0, 200, "event20");
    h.settle();

    assert(h.orchestrator->stats().sessions_started == 0);
    assert(h.orchestrator->stats().ignored_events == 4);
    assert(h.capture->started == 0);
    assert(h.orchestrator->hotkey_state() == HotkeyState::Idle);

    std::cout << "  PASS" << std::endl;
}

void test_refused_while_transcribing() {
    std::cout << "Testing a second hold while the first is transcribing..." << std::endl;

    Harness h;
    h.engine->delay_ms = 300;

    h.hold(0, 200);
    assert(h.wait([&] { return h.engine->calls == 1; }));
    assert(h.orchestrator->session_state() == SessionState::Transcribing);

    // Second hold during transcription: refused, and its release is not a commit
    h.hold(400, 200);
    assert(h.wait([&] { return h.orchestrator->stats().injections == 1; }));
    h.settle();

    assert(h.orchestrator->stats().sessions_refused == 1);
    assert(h.orchestrator->stats().sessions_started == 1);
    assert(h.capture->started == 1);
    assert(h.engine->calls == 1);

    // Once idle, the next hold works
    h.engine->delay_ms = 0;
    h.hold(1000, 200);
    assert(h.wait([&] { return h.orchestrator->stats().injections == 2; }));
    assert(h.orchestrator->stats().sessions_started == 2);

    std::cout << "  PASS" << std::endl;
}

void test_key_events_during_transcription() {
    std::cout << "Testing key events are handled while transcribing..." << std::endl;

    Harness h;
    h.engine->delay_ms = 500;

    h.hold(0, 200);
    assert(h.wait([&] { return h.engine->calls == 1; }));

    // The loop keeps consuming keys while the engine is busy
    h.press(KEY_LEFTMETA, 300);
    assert(h.wait([&] { return h.orchestrator->hotkey_state() == HotkeyState::ModifiersHeld; }));
    assert(h.orchestrator->session_state() == SessionState::Transcribing);
    h.release(KEY_LEFTMETA, 310);

    assert(h.wait([&] { return h.orchestrator->stats().injections == 1; }));

    std::cout << "  PASS" << std::endl;
}

void test_empty_transcription_is_noop() {
    std::cout << "Testing filler-only transcription skips injection..." << std::endl;

    Harness h;
    h.engine->set_text("Um.");

    h.hold(0, 200);
    assert(h.wait([&] { return h.orchestrator->stats().noops == 1; }));
    h.settle();

    assert(h.injector->get_texts().empty());
    assert(h.notifier->count(UiEvent::Type::NoOp) == 1);
    assert(h.notifier->count(UiEvent::Type::Error) == 0);
    assert(h.orchestrator->session_state() == SessionState::Committed);

    std::cout << "  PASS" << std::endl;
}

void test_transcription_failure() {
    std::cout << "Testing transcription failure..." << std::endl;

    Harness h;
    h.engine->fail = true;

    h.hold(0, 200);
    assert(h.wait([&] { return h.notifier->has_error(ErrorKind::Transcription); }));
    h.settle();

    assert(h.orchestrator->last_abort_reason() == AbortReason::TranscriptionFailed);
    assert(h.engine->calls == 1);   // not retried
    assert(h.injector->get_texts().empty());

    // Daemon stays usable
    h.engine->fail = false;
    h.hold(1000, 200);
    assert(h.wait([&] { return h.orchestrator->stats().injections == 1; }));

    std::cout << "  PASS" << std::endl;
}

void test_transcription_timeout() {
    std::cout << "Testing transcription timeout..." << std::endl;

    Config config = test_config();
    config.transcription_timeout_ms = 100;
    Harness h(config);
    h.engine->delay_ms = 600;

    h.hold(0, 200);
    assert(h.wait([&] { return h.notifier->has_error(ErrorKind::Transcription); }));

    assert(h.orchestrator->last_abort_reason() == AbortReason::TranscriptionFailed);
    assert(!h.orchestrator->has_active_session());
    assert(h.injector->get_texts().empty());

    // Ready for the next hold without waiting for the stuck call
    h.engine->delay_ms = 0;
    h.hold(1000, 200);
    assert(h.wait([&] { return h.orchestrator->stats().injections == 1; }));

    std::cout << "  PASS" << std::endl;
}

void test_injection_failure_and_timeout() {
    std::cout << "Testing injection failure and timeout..." << std::endl;

    Config config = test_config();
    config.injection_timeout_ms = 100;
    Harness h(config);

    h.injector->fail = true;
    h.hold(0, 200);
    assert(h.wait([&] { return h.notifier->has_error(ErrorKind::Injection); }));
    assert(h.orchestrator->stats().injections == 0);
    assert(h.orchestrator->stats().errors == 1);

    h.injector->fail = false;
    h.injector->delay_ms = 600;
    h.hold(1000, 200);
    assert(h.wait([&] { return h.orchestrator->stats().errors == 2; }));
    assert(h.orchestrator->stats().injections == 0);
    assert(h.engine->calls == 2);

    std::cout << "  PASS" << std::endl;
}

void test_capture_failure() {
    std::cout << "Testing capture start failure..." << std::endl;

    Harness h;
    h.capture->fail_start = true;

    h.hold(0, 200);
    assert(h.wait([&] { return h.notifier->has_error(ErrorKind::Capture); }));
    h.settle();

    assert(h.orchestrator->last_abort_reason() == AbortReason::CaptureFailed);
    assert(h.engine->calls == 0);
    assert(!h.orchestrator->has_active_session());

    std::cout << "  PASS" << std::endl;
}

void test_empty_audio() {
    std::cout << "Testing empty capture buffer..." << std::endl;

    Harness h;
    h.capture->samples = 0;

    h.hold(0, 200);
    assert(h.wait([&] { return h.notifier->has_error(ErrorKind::Transcription); }));
    assert(h.engine->calls == 0);

    std::cout << "  PASS" << std::endl;
}

void test_device_disconnect_during_hold() {
    std::cout << "Testing keyboard unplugged during a hold..." << std::endl;

    Harness h;
    h.press(KEY_LEFTMETA, 0);
    h.press(KEY_DOT, 5);
    assert(h.wait([&] { return h.capture->started == 1; }));

    h.orchestrator->post(DeviceRemoved{"kbd0", h.t0 + milliseconds(100), "No such device"});
    assert(h.wait([&] { return h.capture->discarded == 1; }));

    assert(h.orchestrator->last_abort_reason() == AbortReason::DeviceDisconnected);
    assert(!h.devices->is_watched("kbd0"));
    assert(!h.orchestrator->device_filter().is_known("kbd0"));
    assert(h.engine->calls == 0);

    // Replugged under a new node, it works again
    h.add_device(keyboard("kbd1", "AT Translated Set 2 keyboard"));
    h.hold(500, 200, "kbd1");
    assert(h.wait([&] { return h.orchestrator->stats().injections == 1; }));

    std::cout << "  PASS" << std::endl;
}

void test_unreadable_device() {
    std::cout << "Testing a keyboard that can not be opened..." << std::endl;

    Harness h;
    h.devices->unreadable.insert("kbd2");
    h.add_device(keyboard("kbd2", "USB Keyboard"));

    assert(!h.orchestrator->device_filter().is_known("kbd2"));
    assert(h.orchestrator->device_filter().is_monitored("kbd0"));

    std::cout << "  PASS" << std::endl;
}

void test_max_recording_length() {
    std::cout << "Testing maximum recording length..." << std::endl;

    Config config = test_config();
    config.max_recording_ms = 150;
    Harness h(config);

    h.press(KEY_LEFTMETA, 0);
    h.press(KEY_DOT, 5);
    assert(h.wait([&] { return h.engine->calls == 1; }));

    // The late release belongs to a session that already ended
    h.release(KEY_DOT, 5000);
    h.release(KEY_LEFTMETA, 5010);
    assert(h.wait([&] { return h.orchestrator->stats().injections == 1; }));
    h.settle();

    assert(h.capture->started == 1);
    assert(h.engine->calls == 1);
    assert(h.orchestrator->stats().sessions_aborted == 0);

    std::cout << "  PASS" << std::endl;
}

void test_shutdown_discards_capture() {
    std::cout << "Testing shutdown during capture..." << std::endl;

    Harness h;
    h.press(KEY_LEFTMETA, 0);
    h.press(KEY_DOT, 5);
    assert(h.wait([&] { return h.capture->started == 1; }));

    h.orchestrator->shutdown();

    assert(h.capture->discarded == 1);
    assert(h.capture->kept == 0);
    assert(h.engine->calls == 0);
    assert(h.devices->stopped);
    assert(h.orchestrator->last_abort_reason() == AbortReason::Shutdown);

    std::cout << "  PASS" << std::endl;
}

void test_stop_request() {
    std::cout << "Testing run() returns on a stop request..." << std::endl;

    Harness h;
    std::thread stopper([&]() {
        std::this_thread::sleep_for(milliseconds(100));
        h.orchestrator->post(StopRequest{});
    });
    int rc = h.orchestrator->run();
    stopper.join();

    assert(rc == 0);
    assert(h.devices->stopped);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Orchestrator Tests ===\n" << std::endl;

    set_log_level(LogLevel::Error);

    test_full_session();
    test_post_processing_applied();
    test_modifier_released_early();
    test_too_short();
    test_tap_then_hold_with_slow_capture();
    test_abort_with_capture_acknowledged_late();
    test_synthetic_device_ignored();
    test_refused_while_transcribing();
    test_key_events_during_transcription();
    test_empty_transcription_is_noop();
    test_transcription_failure();
    test_transcription_timeout();
    test_injection_failure_and_timeout();
    test_capture_failure();
    test_empty_audio();
    test_device_disconnect_during_hold();
    test_unreadable_device();
    test_max_recording_length();
    test_shutdown_discards_capture();
    test_stop_request();

    std::cout << "\n=== All tests passed! ===\n" << std::endl;
    return 0;
}
