#include "clipboard.hpp"
#include "process.hpp"

#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace holdtalk {

bool Clipboard::set_text(const std::string& text, std::string& error) {
    // Both fork a process that owns the selection and keeps our stdout open,
    // so their output is not read

    // First try xclip
    CommandResult result = run_command({"xclip", "-selection", "clipboard"}, text,
                                       OutputMode::Discard);
    if (result.success) return true;

    // Try xsel
    result = run_command({"xsel", "--clipboard", "--input"}, text, OutputMode::Discard);
    if (result.success) return true;

    error = "failed to set clipboard, install xclip or xsel";
    return false;
}

bool Clipboard::paste(std::string& error) {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        error = "failed to open X display";
        return false;
    }

    int event_base = 0, error_base = 0, major = 0, minor = 0;
    if (!XTestQueryExtension(display, &event_base, &error_base, &major, &minor)) {
        error = "X server has no XTest extension";
        XCloseDisplay(display);
        return false;
    }

    ::KeyCode ctrl_keycode = XKeysymToKeycode(display, XK_Control_L);
    ::KeyCode v_keycode = XKeysymToKeycode(display, XK_v);

    if (ctrl_keycode == 0 || v_keycode == 0) {
        error = "failed to get keycodes for Ctrl+V";
        XCloseDisplay(display);
        return false;
    }

    XTestFakeKeyEvent(display, ctrl_keycode, True, 0);
    XTestFakeKeyEvent(display, v_keycode, True, 0);
    XTestFakeKeyEvent(display, v_keycode, False, 0);
    XTestFakeKeyEvent(display, ctrl_keycode, False, 0);
    XFlush(display);

    XCloseDisplay(display);
    return true;
}

} // namespace holdtalk
