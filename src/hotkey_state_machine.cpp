#include "hotkey_state_machine.hpp"
#include "log.hpp"
#include <utility>

namespace holdtalk {

const char* hotkey_state_name(HotkeyState state) {
    switch (state) {
        case HotkeyState::Idle: return "idle";
        case HotkeyState::ModifiersHeld: return "modifiers-held";
        case HotkeyState::Armed: return "armed";
        case HotkeyState::Committing: return "committing";
    }
    return "unknown";
}

HotkeyStateMachine::HotkeyStateMachine(HotkeyBinding binding, std::chrono::milliseconds min_hold)
    : binding_(std::move(binding))
    , min_hold_(min_hold) {
}

bool HotkeyStateMachine::is_held(KeyCode code) const {
    for (const auto& device : held_) {
        if (device.second.count(code)) return true;
    }
    return false;
}

bool HotkeyStateMachine::modifiers_satisfied() const {
    for (const auto& group : binding_.modifiers) {
        bool any = false;
        for (KeyCode code : group.codes) {
            if (is_held(code)) {
                any = true;
                break;
            }
        }
        if (!any) return false;
    }
    return true;
}

std::set<std::string> HotkeyStateMachine::held_modifiers() const {
    std::set<std::string> names;
    for (const auto& group : binding_.modifiers) {
        for (KeyCode code : group.codes) {
            if (is_held(code)) {
                names.insert(group.name);
                break;
            }
        }
    }
    return names;
}

void HotkeyStateMachine::reset() {
    held_.clear();
    state_ = HotkeyState::Idle;
}

// Re-derives the state from the held set when no hold is armed
void HotkeyStateMachine::settle() {
    if (!modifiers_satisfied()) {
        state_ = HotkeyState::Idle;
    } else if (state_ == HotkeyState::Idle) {
        state_ = HotkeyState::ModifiersHeld;
    }
}

std::optional<HotkeySignal> HotkeyStateMachine::on_key_event(const KeyEvent& event) {
    switch (event.action) {
        case KeyAction::Press:
            return on_press(event);
        case KeyAction::Release:
            return on_release(event);
        case KeyAction::Repeat:
            break;
    }
    return std::nullopt;
}

std::optional<HotkeySignal> HotkeyStateMachine::on_press(const KeyEvent& event) {
    const bool target_was_held = is_held(binding_.key);

    // A second key-down for a key this device already holds is repeat noise
    if (!held_[event.device].insert(event.code).second) {
        return std::nullopt;
    }

    if (event.code == binding_.key) {
        if (state_ != HotkeyState::Armed && !target_was_held && modifiers_satisfied()) {
            state_ = HotkeyState::Armed;
            armed_at_ = event.time;
            log_debug("hotkey") << binding_.display() << " armed by " << event.device;
            return HotkeySignal{SignalType::SessionStart, AbortReason::None, event.time};
        }
        return std::nullopt;
    }

    if (state_ != HotkeyState::Armed) {
        settle();
    }
    return std::nullopt;
}

std::optional<HotkeySignal> HotkeyStateMachine::on_release(const KeyEvent& event) {
    auto it = held_.find(event.device);
    if (it == held_.end() || it->second.erase(event.code) == 0) {
        log_debug("hotkey") << "Ignoring key-up without key-down: code=" << event.code
                            << " device=" << event.device;
        return std::nullopt;
    }
    if (it->second.empty()) {
        held_.erase(it);
    }

    if (state_ != HotkeyState::Armed) {
        settle();
        return std::nullopt;
    }

    if (event.code == binding_.key && !is_held(binding_.key)) {
        state_ = HotkeyState::Committing;
        if (event.time - armed_at_ < min_hold_) {
            log_debug("hotkey") << "Hold shorter than " << min_hold_.count() << "ms";
            return HotkeySignal{SignalType::SessionAbort, AbortReason::TooShort, event.time};
        }
        return HotkeySignal{SignalType::SessionCommit, AbortReason::None, event.time};
    }

    if (!modifiers_satisfied()) {
        state_ = HotkeyState::Idle;
        return HotkeySignal{SignalType::SessionAbort, AbortReason::ModifierReleasedEarly, event.time};
    }
    return std::nullopt;
}

std::optional<HotkeySignal> HotkeyStateMachine::on_device_removed(const std::string& device,
                                                                  Clock::time_point time) {
    auto it = held_.find(device);
    if (it == held_.end()) {
        return std::nullopt;
    }
    held_.erase(it);

    if (state_ == HotkeyState::Armed) {
        if (is_held(binding_.key) && modifiers_satisfied()) {
            return std::nullopt;
        }
        state_ = HotkeyState::Idle;
        settle();
        return HotkeySignal{SignalType::SessionAbort, AbortReason::DeviceDisconnected, time};
    }

    settle();
    return std::nullopt;
}

} // namespace holdtalk
