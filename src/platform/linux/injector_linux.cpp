#include "injectors.hpp"
#include "clipboard.hpp"
#include "log.hpp"
#include "process.hpp"
#include <chrono>
#include <thread>

namespace holdtalk {

InjectionResult YdotoolInjector::inject(const std::string& text) {
    InjectionResult result;

    // "--" so text starting with a dash is not read as an option
    CommandResult typed = run_command({"ydotool", "type", "--", text});
    if (!typed.success) {
        result.error = typed.error;
        if (!typed.output.empty()) {
            result.error += ": " + typed.output;
        }
        if (!process_running("ydotoold")) {
            result.error += " (ydotoold is not running)";
        }
        return result;
    }

    result.success = true;
    return result;
}

bool YdotoolInjector::check_daemon() {
    if (process_running("ydotoold")) return true;
    log_warning("inject") << "ydotool daemon not running. Start with: systemctl --user start ydotool";
    return false;
}

InjectionResult ClipboardInjector::inject(const std::string& text) {
    InjectionResult result;

    if (!Clipboard::set_text(text, result.error)) {
        return result;
    }

    // Delay to ensure clipboard is fully set before pasting
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    if (!Clipboard::paste(result.error)) {
        return result;
    }

    result.success = true;
    return result;
}

std::shared_ptr<TextInjector> make_injector(const std::string& name) {
    if (name == "ydotool") {
        return std::make_shared<YdotoolInjector>();
    }
    if (name == "clipboard") {
        return std::make_shared<ClipboardInjector>();
    }
    return nullptr;
}

} // namespace holdtalk
