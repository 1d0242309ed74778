#pragma once

#include <string>

namespace holdtalk {

// X11 clipboard helpers (xclip or xsel for the selection, XTest for the paste)
class Clipboard {
public:
    // Set text to clipboard
    static bool set_text(const std::string& text, std::string& error);

    // Simulates Ctrl+V in the focused window
    static bool paste(std::string& error);
};

} // namespace holdtalk
