#pragma once

#include "config.hpp"
#include "audio_capture.hpp"
#include "evdev_source.hpp"
#include "notifier.hpp"
#include "orchestrator.hpp"
#include "transcriber.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace holdtalk {

// Builds the Linux backends from a Config and hands them to the Orchestrator
class App {
public:
    App();
    ~App();

    // Initialize all components. Returns false with the reason in error();
    // error_kind() is Config for a bad configuration.
    bool initialize(const Config& config);
    void shutdown();

    // Run the application (blocking)
    int run();

    // Stop the application; safe from a signal handler
    void quit();

    const std::string& error() const { return error_; }
    ErrorKind error_kind() const { return error_kind_; }

private:
    bool fail(ErrorKind kind, const std::string& message);

    Config config_;
    HotkeyBinding binding_;

    std::shared_ptr<AudioCapture> audio_;
    std::shared_ptr<Transcriber> transcriber_;
    std::shared_ptr<EvdevDeviceSource> devices_;
    std::shared_ptr<AsyncNotifier> desktop_;
    std::unique_ptr<Orchestrator> orchestrator_;

    std::atomic<Orchestrator*> running_{nullptr};
    std::string error_;
    ErrorKind error_kind_ = ErrorKind::None;
};

} // namespace holdtalk
