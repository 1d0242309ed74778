#pragma once

#include "text_injector.hpp"

#include <memory>
#include <string>

namespace holdtalk {

// Types the text through ydotool's uinput device (works on Wayland and X11).
// Needs ydotoold running; the virtual device it creates is named "ydotoold
// virtual device", which the default synthetic patterns match.
class YdotoolInjector : public TextInjector {
public:
    InjectionResult inject(const std::string& text) override;
    const char* name() const override { return "ydotool"; }

    // Warns once at startup if the daemon is not running
    static bool check_daemon();
};

// Copies the text to the X11 clipboard and pastes it with Ctrl+V
class ClipboardInjector : public TextInjector {
public:
    InjectionResult inject(const std::string& text) override;
    const char* name() const override { return "clipboard"; }
};

// "ydotool" or "clipboard"; nullptr for anything else
std::shared_ptr<TextInjector> make_injector(const std::string& name);

} // namespace holdtalk
