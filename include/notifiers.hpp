#pragma once

#include "notifier.hpp"

#include <string>

namespace holdtalk {

// One status line per state change on stdout
class ConsoleNotifier : public Notifier {
public:
    void notify(const UiEvent& event) override;
};

// Desktop notifications through notify-send. Slow (spawns a process), so
// wrap it in an AsyncNotifier.
class DesktopNotifier : public Notifier {
public:
    explicit DesktopNotifier(std::string hotkey_display);
    void notify(const UiEvent& event) override;

private:
    std::string hotkey_display_;
};

} // namespace holdtalk
