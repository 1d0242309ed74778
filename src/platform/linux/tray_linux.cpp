#include "notifiers.hpp"
#include "log.hpp"
#include "process.hpp"
#include <utility>

namespace holdtalk {

static constexpr const char* kIcon = "audio-input-microphone";

void ConsoleNotifier::notify(const UiEvent& event) {
    std::string line;
    switch (event.type) {
        case UiEvent::Type::Idle:
            line = event.detail.empty() ? "Ready" : "Ready (" + event.detail + ")";
            break;
        case UiEvent::Type::Recording:
            line = "Recording...";
            break;
        case UiEvent::Type::Transcribing:
            line = "Transcribing...";
            break;
        case UiEvent::Type::Done:
            line = "Typed " + std::to_string(event.text_length) + " characters";
            break;
        case UiEvent::Type::NoOp:
            line = "No speech detected";
            break;
        case UiEvent::Type::Error:
            line = std::string("Error (") + error_kind_name(event.error) + ")";
            if (!event.detail.empty()) line += ": " + event.detail;
            break;
    }
    log_write(LogLevel::Info, "holdtalk", line);
}

DesktopNotifier::DesktopNotifier(std::string hotkey_display)
    : hotkey_display_(std::move(hotkey_display)) {
}

void DesktopNotifier::notify(const UiEvent& event) {
    std::string title = "Dictation";
    std::string body;
    std::string urgency = "normal";

    switch (event.type) {
        case UiEvent::Type::Idle:
        case UiEvent::Type::Done:
            // Nothing to show; the text appearing is the feedback
            return;
        case UiEvent::Type::Recording:
            body = "Recording... (release " + hotkey_display_ + " to stop)";
            break;
        case UiEvent::Type::Transcribing:
            body = "Transcribing...";
            break;
        case UiEvent::Type::NoOp:
            body = "No speech detected";
            break;
        case UiEvent::Type::Error:
            title = "Dictation Error";
            body = std::string(error_kind_name(event.error)) + " failed";
            if (!event.detail.empty()) body += ": " + event.detail;
            urgency = "critical";
            break;
    }

    CommandResult result = run_command({"notify-send", "-i", kIcon, "-u", urgency,
                                        "-t", "3000", title, body});
    if (!result.success) {
        log_debug("notify") << "notify-send failed: " << result.error;
    }
}

} // namespace holdtalk
