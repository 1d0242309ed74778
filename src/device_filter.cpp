#include "device_filter.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace holdtalk {

namespace {

std::string to_lower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool is_id_pattern(const std::string& pattern) {
    if (pattern.size() != 9 || pattern[4] != ':') return false;
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (i == 4) continue;
        if (!std::isxdigit(static_cast<unsigned char>(pattern[i]))) return false;
    }
    return true;
}

std::string format_id(uint16_t vendor, uint16_t product) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04x:%04x", vendor, product);
    return buf;
}

} // namespace

const char* device_class_name(DeviceClass cls) {
    switch (cls) {
        case DeviceClass::Unknown: return "unknown";
        case DeviceClass::Physical: return "physical";
        case DeviceClass::Synthetic: return "synthetic";
    }
    return "unknown";
}

DeviceFilter::DeviceFilter(const std::vector<std::string>& synthetic_patterns) {
    for (const auto& pattern : synthetic_patterns) {
        if (!pattern.empty()) {
            patterns_.push_back(to_lower(pattern));
        }
    }
}

bool DeviceFilter::matches_pattern(const InputDevice& device, std::string* matched) const {
    const std::string name = to_lower(device.name);
    const std::string ids = format_id(device.vendor, device.product);

    for (const auto& pattern : patterns_) {
        bool hit = is_id_pattern(pattern) ? (ids == pattern)
                                          : (name.find(pattern) != std::string::npos);
        if (hit) {
            if (matched) *matched = pattern;
            return true;
        }
    }
    return false;
}

DeviceClass DeviceFilter::classify(const InputDevice& device) const {
    return matches_pattern(device, nullptr) ? DeviceClass::Synthetic : DeviceClass::Physical;
}

bool DeviceFilter::eligible(const InputDevice& device) const {
    return device.classification == DeviceClass::Physical &&
           device.has_key_events &&
           device.has_letter_keys &&
           device.has_modifier_keys;
}

bool DeviceFilter::add_device(const InputDevice& device) {
    auto it = devices_.find(device.id);
    if (it != devices_.end()) {
        return eligible(it->second);
    }

    InputDevice entry = device;
    std::string matched;
    if (matches_pattern(entry, &matched)) {
        entry.classification = DeviceClass::Synthetic;
        log_info("devices") << "Skip synthetic device: " << entry.name << " at " << entry.id
                            << " (matches \"" << matched << "\")";
    } else {
        entry.classification = DeviceClass::Physical;
        if (!entry.has_key_events || !entry.has_letter_keys) {
            log_debug("devices") << "Skip " << entry.name << ": no letter keys";
        } else if (!entry.has_modifier_keys) {
            log_debug("devices") << "Skip " << entry.name << ": no modifier keys";
        }
    }

    bool monitored = eligible(entry);
    if (monitored) {
        log_info("devices") << "Monitoring keyboard: " << entry.name << " at " << entry.id;
    }
    devices_.emplace(entry.id, entry);
    return monitored;
}

void DeviceFilter::remove_device(const std::string& id) {
    auto it = devices_.find(id);
    if (it == devices_.end()) return;
    log_info("devices") << "Device removed: " << it->second.name << " at " << id;
    devices_.erase(it);
}

bool DeviceFilter::is_known(const std::string& id) const {
    return devices_.count(id) > 0;
}

bool DeviceFilter::is_monitored(const std::string& id) const {
    auto it = devices_.find(id);
    return it != devices_.end() && eligible(it->second);
}

DeviceClass DeviceFilter::classification(const std::string& id) const {
    auto it = devices_.find(id);
    return it == devices_.end() ? DeviceClass::Unknown : it->second.classification;
}

const InputDevice* DeviceFilter::find(const std::string& id) const {
    auto it = devices_.find(id);
    return it == devices_.end() ? nullptr : &it->second;
}

std::vector<std::string> DeviceFilter::monitored_devices() const {
    std::vector<std::string> result;
    for (const auto& entry : devices_) {
        if (eligible(entry.second)) {
            result.push_back(entry.first);
        }
    }
    return result;
}

int DeviceFilter::keyboard_score(const InputDevice& device) {
    int score = 0;
    if (device.has_letter_keys) score += 2;
    if (device.has_modifier_keys) score += 1;
    if (to_lower(device.name).find("keyboard") != std::string::npos) score += 4;
    return score;
}

} // namespace holdtalk
