#include "app.hpp"
#include "injectors.hpp"
#include "log.hpp"
#include "notifiers.hpp"

namespace holdtalk {

App::App() = default;

App::~App() {
    shutdown();
}

bool App::fail(ErrorKind kind, const std::string& message) {
    error_kind_ = kind;
    error_ = message;
    return false;
}

bool App::initialize(const Config& config) {
    config_ = config;

    std::string error;
    if (!ConfigLoader::validate(config_, error)) {
        return fail(ErrorKind::Config, error);
    }
    if (!ConfigLoader::resolve_hotkey(config_.hotkey, binding_, error)) {
        return fail(ErrorKind::Config, error);
    }

    auto injector = make_injector(config_.injector);
    if (!injector) {
        return fail(ErrorKind::Config, "unknown injector \"" + config_.injector + "\"");
    }
    if (config_.injector == "ydotool") {
        YdotoolInjector::check_daemon();
    }

    // Initialize audio capture
    audio_ = std::make_shared<AudioCapture>(
        config_.sample_rate,
        config_.channels,
        config_.frames_per_buffer
    );
    if (!audio_->initialize()) {
        return fail(ErrorKind::Capture, "failed to initialize audio capture");
    }
    log_info("holdtalk") << "Audio capture initialized";

    // Initialize transcriber
    transcriber_ = std::make_shared<Transcriber>();
    const std::string model_path = config_.get_model_path();
    if (!transcriber_->initialize(model_path, config_.n_threads)) {
        return fail(ErrorKind::Transcription, "failed to load whisper model " + model_path);
    }

    devices_ = std::make_shared<EvdevDeviceSource>(
        std::chrono::milliseconds(config_.device_rescan_ms));

    auto notifiers = std::make_shared<NotifierGroup>();
    notifiers->add(std::make_shared<ConsoleNotifier>());
    if (config_.notifications) {
        desktop_ = std::make_shared<AsyncNotifier>(std::make_shared<DesktopNotifier>(binding_.display()));
        notifiers->add(desktop_);
    }

    Orchestrator::Backends backends;
    backends.devices = devices_;
    backends.capture = audio_;
    backends.engine = transcriber_;
    backends.injector = injector;
    backends.notifier = notifiers;

    orchestrator_ = std::make_unique<Orchestrator>(config_, binding_, backends);
    return true;
}

void App::shutdown() {
    running_.store(nullptr);

    // Orchestrator first: it drains the workers that still use the backends
    if (orchestrator_) {
        orchestrator_->shutdown();
        orchestrator_.reset();
    }

    if (desktop_) {
        desktop_->close();
        desktop_.reset();
    }

    if (audio_) {
        audio_->shutdown();
        audio_.reset();
    }

    // A transcription that timed out may still hold a reference; the model is
    // freed when it finishes
    transcriber_.reset();
    devices_.reset();
}

int App::run() {
    if (!orchestrator_) return 1;

    running_.store(orchestrator_.get());
    if (!orchestrator_->start()) {
        running_.store(nullptr);
        return 1;
    }

    if (orchestrator_->device_filter().monitored_devices().empty() &&
        devices_->permission_denied() > 0) {
        log_warning("holdtalk") << "No keyboard can be read yet; waiting for access or hot-plug";
    }

    console_write("\n=== holdtalk ready ===\n"
                  "Hold " + binding_.display() + " to record, release to transcribe and type.\n"
                  "Press Ctrl+C to quit.\n\n");

    int result = orchestrator_->run();
    running_.store(nullptr);
    return result;
}

void App::quit() {
    Orchestrator* orchestrator = running_.load();
    if (orchestrator) {
        orchestrator->request_stop();
    }
}

} // namespace holdtalk
