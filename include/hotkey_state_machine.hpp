#pragma once

#include "key_codes.hpp"
#include "session_signal.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace holdtalk {

enum class KeyAction {
    Release = 0,
    Press = 1,
    Repeat = 2
};

struct KeyEvent {
    std::string device;
    KeyCode code = 0;
    KeyAction action = KeyAction::Press;
    Clock::time_point time;
};

enum class HotkeyState {
    Idle,
    ModifiersHeld,
    Armed,
    Committing
};

const char* hotkey_state_name(HotkeyState state);

// Turns the merged key stream of all monitored devices into session signals.
//
// Held keys are tracked per device; a key counts as held while any device
// reports it down. Removing a device releases everything it reported.
class HotkeyStateMachine {
public:
    HotkeyStateMachine(HotkeyBinding binding, std::chrono::milliseconds min_hold);

    std::optional<HotkeySignal> on_key_event(const KeyEvent& event);
    std::optional<HotkeySignal> on_device_removed(const std::string& device, Clock::time_point time);

    HotkeyState state() const { return state_; }
    const HotkeyBinding& binding() const { return binding_; }

    bool modifiers_satisfied() const;
    bool is_held(KeyCode code) const;

    // Names of the configured modifiers currently held (global union)
    std::set<std::string> held_modifiers() const;

    void reset();

private:
    std::optional<HotkeySignal> on_press(const KeyEvent& event);
    std::optional<HotkeySignal> on_release(const KeyEvent& event);
    void settle();

    HotkeyBinding binding_;
    std::chrono::milliseconds min_hold_;

    std::map<std::string, std::set<KeyCode>> held_;
    HotkeyState state_ = HotkeyState::Idle;
    Clock::time_point armed_at_;
};

} // namespace holdtalk
