#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace holdtalk {

// Linux input event key code (see linux/input-event-codes.h)
using KeyCode = uint16_t;

// A logical modifier: held when any of its physical codes is down
struct ModifierGroup {
    std::string name;             // canonical name, e.g. "super"
    std::vector<KeyCode> codes;   // left and right variants
};

// Resolved hotkey: every modifier group held + target key
struct HotkeyBinding {
    std::vector<ModifierGroup> modifiers;
    KeyCode key = 0;
    std::string key_name;

    // e.g. "Super+Period"
    std::string display() const;
};

// Lookups accept aliases ("meta", "win", "control") and are case-insensitive.
bool lookup_modifier(const std::string& name, ModifierGroup& out);
bool lookup_key(const std::string& name, KeyCode& out);

// True for any left/right ctrl, alt, shift or meta code
bool is_modifier_code(KeyCode code);

} // namespace holdtalk
