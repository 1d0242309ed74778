#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace holdtalk {

enum class DeviceClass {
    Unknown,    // not classified yet
    Physical,
    Synthetic   // created by an injection tool or other virtual-input software
};

const char* device_class_name(DeviceClass cls);

struct InputDevice {
    std::string id;             // event node, e.g. /dev/input/event3
    std::string name;
    uint16_t vendor = 0;
    uint16_t product = 0;

    // Capabilities
    bool has_key_events = false;
    bool has_letter_keys = false;
    bool has_modifier_keys = false;

    DeviceClass classification = DeviceClass::Unknown;
};

// Decides which input devices feed the hotkey state machine. A device
// classified Synthetic is never monitored, so keystrokes typed by the
// injection backend can not re-trigger the hotkey.
class DeviceFilter {
public:
    // Patterns are matched case-insensitively as substrings of the device
    // name. A pattern of the form "vvvv:pppp" (hex) matches vendor:product.
    explicit DeviceFilter(const std::vector<std::string>& synthetic_patterns);

    // Pure classification, no caching
    DeviceClass classify(const InputDevice& device) const;

    // Registers a newly seen device. The classification is computed once and
    // kept until remove_device(); re-adding a known id returns the cached
    // result. Returns true if the device should be monitored.
    bool add_device(const InputDevice& device);
    void remove_device(const std::string& id);

    bool is_known(const std::string& id) const;
    bool is_monitored(const std::string& id) const;
    DeviceClass classification(const std::string& id) const;
    const InputDevice* find(const std::string& id) const;

    std::vector<std::string> monitored_devices() const;
    size_t device_count() const { return devices_.size(); }

    // Keyboard-like devices rank higher; used to order startup logging
    static int keyboard_score(const InputDevice& device);

private:
    bool matches_pattern(const InputDevice& device, std::string* matched) const;
    bool eligible(const InputDevice& device) const;

    std::vector<std::string> patterns_;   // lowercased
    std::map<std::string, InputDevice> devices_;
};

} // namespace holdtalk
