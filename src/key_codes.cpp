#include "key_codes.hpp"
#include <linux/input-event-codes.h>
#include <algorithm>
#include <cctype>

namespace holdtalk {

namespace {

std::string to_lower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string capitalize(const std::string& text) {
    std::string result = text;
    if (!result.empty()) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

struct NamedKey {
    const char* name;
    KeyCode code;
};

const NamedKey kNamedKeys[] = {
    {"period", KEY_DOT},
    {"dot", KEY_DOT},
    {"comma", KEY_COMMA},
    {"space", KEY_SPACE},
    {"slash", KEY_SLASH},
    {"semicolon", KEY_SEMICOLON},
    {"apostrophe", KEY_APOSTROPHE},
    {"minus", KEY_MINUS},
    {"equal", KEY_EQUAL},
    {"grave", KEY_GRAVE},
    {"backslash", KEY_BACKSLASH},
    {"leftbrace", KEY_LEFTBRACE},
    {"rightbrace", KEY_RIGHTBRACE},
    {"tab", KEY_TAB},
    {"enter", KEY_ENTER},
    {"esc", KEY_ESC},
    {"insert", KEY_INSERT},
    {"home", KEY_HOME},
    {"end", KEY_END},
    {"pageup", KEY_PAGEUP},
    {"pagedown", KEY_PAGEDOWN},
    {"pause", KEY_PAUSE},
    {"scrolllock", KEY_SCROLLLOCK},
    {"capslock", KEY_CAPSLOCK},
    {"menu", KEY_COMPOSE},
    {"a", KEY_A}, {"b", KEY_B}, {"c", KEY_C}, {"d", KEY_D}, {"e", KEY_E},
    {"f", KEY_F}, {"g", KEY_G}, {"h", KEY_H}, {"i", KEY_I}, {"j", KEY_J},
    {"k", KEY_K}, {"l", KEY_L}, {"m", KEY_M}, {"n", KEY_N}, {"o", KEY_O},
    {"p", KEY_P}, {"q", KEY_Q}, {"r", KEY_R}, {"s", KEY_S}, {"t", KEY_T},
    {"u", KEY_U}, {"v", KEY_V}, {"w", KEY_W}, {"x", KEY_X}, {"y", KEY_Y},
    {"z", KEY_Z},
    {"0", KEY_0}, {"1", KEY_1}, {"2", KEY_2}, {"3", KEY_3}, {"4", KEY_4},
    {"5", KEY_5}, {"6", KEY_6}, {"7", KEY_7}, {"8", KEY_8}, {"9", KEY_9},
    {"f1", KEY_F1}, {"f2", KEY_F2}, {"f3", KEY_F3}, {"f4", KEY_F4},
    {"f5", KEY_F5}, {"f6", KEY_F6}, {"f7", KEY_F7}, {"f8", KEY_F8},
    {"f9", KEY_F9}, {"f10", KEY_F10}, {"f11", KEY_F11}, {"f12", KEY_F12},
};

} // namespace

std::string HotkeyBinding::display() const {
    std::string result;
    for (const auto& mod : modifiers) {
        result += capitalize(mod.name);
        result += '+';
    }
    result += capitalize(key_name);
    return result;
}

bool lookup_modifier(const std::string& name, ModifierGroup& out) {
    const std::string lower = to_lower(name);

    if (lower == "super" || lower == "meta" || lower == "win") {
        out = {"super", {KEY_LEFTMETA, KEY_RIGHTMETA}};
    } else if (lower == "ctrl" || lower == "control") {
        out = {"ctrl", {KEY_LEFTCTRL, KEY_RIGHTCTRL}};
    } else if (lower == "alt") {
        out = {"alt", {KEY_LEFTALT, KEY_RIGHTALT}};
    } else if (lower == "shift") {
        out = {"shift", {KEY_LEFTSHIFT, KEY_RIGHTSHIFT}};
    } else {
        return false;
    }
    return true;
}

bool lookup_key(const std::string& name, KeyCode& out) {
    const std::string lower = to_lower(name);
    for (const auto& entry : kNamedKeys) {
        if (lower == entry.name) {
            out = entry.code;
            return true;
        }
    }
    return false;
}

bool is_modifier_code(KeyCode code) {
    switch (code) {
        case KEY_LEFTMETA:
        case KEY_RIGHTMETA:
        case KEY_LEFTCTRL:
        case KEY_RIGHTCTRL:
        case KEY_LEFTALT:
        case KEY_RIGHTALT:
        case KEY_LEFTSHIFT:
        case KEY_RIGHTSHIFT:
            return true;
        default:
            return false;
    }
}

} // namespace holdtalk
