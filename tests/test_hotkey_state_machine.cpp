// Automated tests for HotkeyStateMachine

#include "hotkey_state_machine.hpp"
#include <linux/input-event-codes.h>
#include <iostream>
#include <cassert>

using namespace holdtalk;
using std::chrono::milliseconds;

static const Clock::time_point t0 = Clock::now();

static HotkeyBinding make_binding(const std::vector<std::string>& modifiers, const std::string& key) {
    HotkeyBinding binding;
    for (const auto& name : modifiers) {
        ModifierGroup group;
        bool found = lookup_modifier(name, group);
        assert(found);
        binding.modifiers.push_back(group);
    }
    bool found = lookup_key(key, binding.key);
    assert(found);
    binding.key_name = key;
    return binding;
}

static KeyEvent key(const char* device, KeyCode code, KeyAction action, int at_ms) {
    KeyEvent event;
    event.device = device;
    event.code = code;
    event.action = action;
    event.time = t0 + milliseconds(at_ms);
    return event;
}

static KeyEvent press(KeyCode code, int at_ms, const char* device = "kbd0") {
    return key(device, code, KeyAction::Press, at_ms);
}

static KeyEvent release(KeyCode code, int at_ms, const char* device = "kbd0") {
    return key(device, code, KeyAction::Release, at_ms);
}

static HotkeyStateMachine make_machine() {
    return HotkeyStateMachine(make_binding({"super"}, "period"), milliseconds(50));
}

void test_full_hold() {
    std::cout << "Testing press, hold, release..." << std::endl;

    auto sm = make_machine();
    assert(sm.state() == HotkeyState::Idle);

    assert(!sm.on_key_event(press(KEY_LEFTMETA, 0)));
    assert(sm.state() == HotkeyState::ModifiersHeld);

    auto start = sm.on_key_event(press(KEY_DOT, 10));
    assert(start && start->type == SignalType::SessionStart);
    assert(sm.state() == HotkeyState::Armed);

    auto commit = sm.on_key_event(release(KEY_DOT, 210));
    assert(commit && commit->type == SignalType::SessionCommit);
    assert(commit->time == t0 + milliseconds(210));
    assert(sm.state() == HotkeyState::Committing);

    assert(!sm.on_key_event(release(KEY_LEFTMETA, 230)));
    assert(sm.state() == HotkeyState::Idle);

    std::cout << "  PASS" << std::endl;
}

void test_modifier_released_early() {
    std::cout << "Testing modifier released before the key..." << std::endl;

    auto sm = make_machine();
    sm.on_key_event(press(KEY_LEFTMETA, 0));
    assert(sm.on_key_event(press(KEY_DOT, 5))->type == SignalType::SessionStart);

    auto abort = sm.on_key_event(release(KEY_LEFTMETA, 10));
    assert(abort && abort->type == SignalType::SessionAbort);
    assert(abort->reason == AbortReason::ModifierReleasedEarly);
    assert(sm.state() == HotkeyState::Idle);

    // Releasing the key afterwards is not a commit
    assert(!sm.on_key_event(release(KEY_DOT, 200)));
    assert(sm.state() == HotkeyState::Idle);

    std::cout << "  PASS" << std::endl;
}

void test_too_short() {
    std::cout << "Testing hold below the dwell threshold..." << std::endl;

    auto sm = make_machine();
    sm.on_key_event(press(KEY_LEFTMETA, 0));
    sm.on_key_event(press(KEY_DOT, 100));

    auto abort = sm.on_key_event(release(KEY_DOT, 130));
    assert(abort && abort->type == SignalType::SessionAbort);
    assert(abort->reason == AbortReason::TooShort);

    // Exactly the threshold is long enough
    sm.on_key_event(press(KEY_DOT, 200));
    auto commit = sm.on_key_event(release(KEY_DOT, 250));
    assert(commit && commit->type == SignalType::SessionCommit);

    std::cout << "  PASS" << std::endl;
}

void test_key_without_modifier() {
    std::cout << "Testing key pressed without modifiers..." << std::endl;

    auto sm = make_machine();
    assert(!sm.on_key_event(press(KEY_DOT, 0)));
    assert(sm.state() == HotkeyState::Idle);

    // Modifier pressed while the key is already down does not arm
    assert(!sm.on_key_event(press(KEY_LEFTMETA, 10)));
    assert(sm.state() == HotkeyState::ModifiersHeld);
    assert(!sm.on_key_event(release(KEY_DOT, 100)));

    // Pressing it again does
    auto start = sm.on_key_event(press(KEY_DOT, 150));
    assert(start && start->type == SignalType::SessionStart);

    std::cout << "  PASS" << std::endl;
}

void test_repeat_ignored() {
    std::cout << "Testing key repeat..." << std::endl;

    auto sm = make_machine();
    sm.on_key_event(press(KEY_LEFTMETA, 0));
    assert(sm.on_key_event(press(KEY_DOT, 10)));

    for (int i = 0; i < 20; ++i) {
        assert(!sm.on_key_event(key("kbd0", KEY_DOT, KeyAction::Repeat, 300 + i * 30)));
        assert(!sm.on_key_event(key("kbd0", KEY_LEFTMETA, KeyAction::Repeat, 300 + i * 30)));
    }
    // Duplicate key-down without key-up (bounce)
    assert(!sm.on_key_event(press(KEY_DOT, 900)));
    assert(sm.state() == HotkeyState::Armed);

    auto commit = sm.on_key_event(release(KEY_DOT, 1000));
    assert(commit && commit->type == SignalType::SessionCommit);

    std::cout << "  PASS" << std::endl;
}

void test_stray_release() {
    std::cout << "Testing key-up without key-down..." << std::endl;

    auto sm = make_machine();
    assert(!sm.on_key_event(release(KEY_DOT, 0)));
    assert(!sm.on_key_event(release(KEY_LEFTMETA, 1)));
    assert(sm.state() == HotkeyState::Idle);

    sm.on_key_event(press(KEY_LEFTMETA, 10));
    sm.on_key_event(press(KEY_DOT, 20));
    // The key was pressed on kbd0; a release from another device is stray
    assert(!sm.on_key_event(release(KEY_DOT, 300, "kbd1")));
    assert(sm.state() == HotkeyState::Armed);

    std::cout << "  PASS" << std::endl;
}

void test_left_and_right_modifiers() {
    std::cout << "Testing left and right modifier variants..." << std::endl;

    auto sm = make_machine();
    sm.on_key_event(press(KEY_LEFTMETA, 0));
    sm.on_key_event(press(KEY_RIGHTMETA, 5));
    assert(sm.on_key_event(press(KEY_DOT, 10)));

    // Still one super held
    assert(!sm.on_key_event(release(KEY_LEFTMETA, 50)));
    assert(sm.state() == HotkeyState::Armed);
    assert(sm.held_modifiers().count("super") == 1);

    auto commit = sm.on_key_event(release(KEY_DOT, 200));
    assert(commit && commit->type == SignalType::SessionCommit);

    std::cout << "  PASS" << std::endl;
}

void test_multiple_modifiers() {
    std::cout << "Testing a binding with two modifiers..." << std::endl;

    HotkeyStateMachine sm(make_binding({"ctrl", "alt"}, "space"), milliseconds(50));

    sm.on_key_event(press(KEY_LEFTCTRL, 0));
    assert(sm.state() == HotkeyState::Idle);
    assert(!sm.on_key_event(press(KEY_SPACE, 5)));
    sm.on_key_event(release(KEY_SPACE, 8));

    sm.on_key_event(press(KEY_RIGHTALT, 10));
    assert(sm.state() == HotkeyState::ModifiersHeld);
    assert(sm.on_key_event(press(KEY_SPACE, 20))->type == SignalType::SessionStart);

    auto abort = sm.on_key_event(release(KEY_LEFTCTRL, 30));
    assert(abort && abort->reason == AbortReason::ModifierReleasedEarly);

    // Other keys pressed during the hold change nothing
    sm.on_key_event(press(KEY_LEFTCTRL, 100));
    sm.on_key_event(release(KEY_SPACE, 105));
    sm.on_key_event(press(KEY_SPACE, 110));
    assert(sm.state() == HotkeyState::Armed);
    assert(!sm.on_key_event(press(KEY_A, 120)));
    assert(!sm.on_key_event(release(KEY_A, 130)));
    assert(sm.state() == HotkeyState::Armed);

    std::cout << "  PASS" << std::endl;
}

void test_cross_device_hold() {
    std::cout << "Testing modifier and key on different devices..." << std::endl;

    auto sm = make_machine();
    sm.on_key_event(press(KEY_LEFTMETA, 0, "kbd0"));
    auto start = sm.on_key_event(press(KEY_DOT, 10, "kbd1"));
    assert(start && start->type == SignalType::SessionStart);

    // Same modifier held on both; releasing one keeps it held globally
    sm.on_key_event(press(KEY_LEFTMETA, 20, "kbd1"));
    assert(!sm.on_key_event(release(KEY_LEFTMETA, 30, "kbd0")));
    assert(sm.modifiers_satisfied());

    auto commit = sm.on_key_event(release(KEY_DOT, 300, "kbd1"));
    assert(commit && commit->type == SignalType::SessionCommit);

    std::cout << "  PASS" << std::endl;
}

void test_target_held_on_two_devices() {
    std::cout << "Testing the key held on two devices..." << std::endl;

    auto sm = make_machine();
    sm.on_key_event(press(KEY_LEFTMETA, 0, "kbd0"));
    assert(sm.on_key_event(press(KEY_DOT, 10, "kbd0")));
    // Second device pressing the key is not a new start
    assert(!sm.on_key_event(press(KEY_DOT, 20, "kbd1")));

    // Released on one, still down on the other
    assert(!sm.on_key_event(release(KEY_DOT, 100, "kbd0")));
    assert(sm.state() == HotkeyState::Armed);

    auto commit = sm.on_key_event(release(KEY_DOT, 200, "kbd1"));
    assert(commit && commit->type == SignalType::SessionCommit);

    std::cout << "  PASS" << std::endl;
}

void test_device_removed_while_armed() {
    std::cout << "Testing device disconnect during a hold..." << std::endl;

    auto sm = make_machine();
    sm.on_key_event(press(KEY_LEFTMETA, 0, "kbd0"));
    sm.on_key_event(press(KEY_DOT, 10, "kbd0"));

    auto abort = sm.on_device_removed("kbd0", t0 + milliseconds(100));
    assert(abort && abort->type == SignalType::SessionAbort);
    assert(abort->reason == AbortReason::DeviceDisconnected);
    assert(sm.state() == HotkeyState::Idle);
    assert(!sm.is_held(KEY_LEFTMETA));

    // Key-ups that never arrive do not matter; a new hold works
    sm.on_key_event(press(KEY_LEFTMETA, 200, "kbd1"));
    assert(sm.on_key_event(press(KEY_DOT, 210, "kbd1"))->type == SignalType::SessionStart);

    std::cout << "  PASS" << std::endl;
}

void test_unrelated_device_removed() {
    std::cout << "Testing removal of a device that holds nothing relevant..." << std::endl;

    auto sm = make_machine();
    sm.on_key_event(press(KEY_A, 0, "kbd1"));
    sm.on_key_event(press(KEY_LEFTMETA, 0, "kbd0"));
    sm.on_key_event(press(KEY_DOT, 10, "kbd0"));

    assert(!sm.on_device_removed("kbd1", t0 + milliseconds(50)));
    assert(!sm.on_device_removed("kbd9", t0 + milliseconds(50)));
    assert(sm.state() == HotkeyState::Armed);

    // Modifier on the removed device while the key and another super stay down
    sm.on_key_event(press(KEY_RIGHTMETA, 60, "kbd2"));
    sm.on_key_event(release(KEY_LEFTMETA, 70, "kbd0"));
    assert(sm.state() == HotkeyState::Armed);
    assert(!sm.on_device_removed("kbd3", t0 + milliseconds(80)));

    std::cout << "  PASS" << std::endl;
}

void test_rearm_while_committing() {
    std::cout << "Testing a second hold without releasing the modifier..." << std::endl;

    auto sm = make_machine();
    sm.on_key_event(press(KEY_LEFTMETA, 0));
    sm.on_key_event(press(KEY_DOT, 10));
    assert(sm.on_key_event(release(KEY_DOT, 200))->type == SignalType::SessionCommit);
    assert(sm.state() == HotkeyState::Committing);

    auto start = sm.on_key_event(press(KEY_DOT, 300));
    assert(start && start->type == SignalType::SessionStart);
    assert(sm.state() == HotkeyState::Armed);

    std::cout << "  PASS" << std::endl;
}

void test_reset() {
    std::cout << "Testing reset..." << std::endl;

    auto sm = make_machine();
    sm.on_key_event(press(KEY_LEFTMETA, 0));
    sm.on_key_event(press(KEY_DOT, 10));
    sm.reset();
    assert(sm.state() == HotkeyState::Idle);
    assert(!sm.is_held(KEY_LEFTMETA));
    assert(!sm.on_key_event(release(KEY_DOT, 300)));

    std::cout << "  PASS" << std::endl;
}

void test_binding_display() {
    std::cout << "Testing binding display..." << std::endl;

    assert(make_binding({"super"}, "period").display() == "Super+Period");
    assert(make_binding({"ctrl", "shift"}, "f9").display() == "Ctrl+Shift+F9");
    assert(make_binding({"win"}, "space").display() == "Super+Space");

    KeyCode code = 0;
    assert(lookup_key("PERIOD", code) && code == KEY_DOT);
    assert(!lookup_key("hyper", code));
    ModifierGroup group;
    assert(lookup_modifier("Control", group) && group.name == "ctrl");
    assert(!lookup_modifier("period", group));
    assert(is_modifier_code(KEY_RIGHTALT));
    assert(!is_modifier_code(KEY_DOT));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== HotkeyStateMachine Tests ===\n" << std::endl;

    test_full_hold();
    test_modifier_released_early();
    test_too_short();
    test_key_without_modifier();
    test_repeat_ignored();
    test_stray_release();
    test_left_and_right_modifiers();
    test_multiple_modifiers();
    test_cross_device_hold();
    test_target_held_on_two_devices();
    test_device_removed_while_armed();
    test_unrelated_device_removed();
    test_rearm_while_committing();
    test_reset();
    test_binding_display();

    std::cout << "\n=== All tests passed! ===\n" << std::endl;
    return 0;
}
