#pragma once

#include "daemon_event.hpp"
#include "channel.hpp"

#include <string>
#include <vector>

namespace holdtalk {

using EventQueue = Channel<DaemonEvent>;

// Enumerates input devices and reads the ones the orchestrator asks for.
// Every notification (DeviceAdded, DeviceRemoved, KeyEvent) is posted to the
// queue given to start(); reading happens on the source's own threads.
class DeviceSource {
public:
    virtual ~DeviceSource() = default;

    // Posts DeviceAdded for every present device, then keeps watching for
    // hot-plug until stop()
    virtual bool start(EventQueue& queue) = 0;

    // Begins reading key events from a device. Returns false if the device
    // could not be opened.
    virtual bool watch(const std::string& device_id) = 0;
    virtual void unwatch(const std::string& device_id) = 0;

    // Stops all threads and releases every device handle
    virtual void stop() = 0;

    // One-shot enumeration without reading (used by --list-devices)
    virtual std::vector<InputDevice> enumerate() = 0;
};

} // namespace holdtalk
