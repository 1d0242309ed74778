#pragma once

#include "device_source.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct libevdev;

namespace holdtalk {

// Reads /dev/input/event* through libevdev. A rescan thread posts
// DeviceAdded/DeviceRemoved as nodes appear and disappear; each watched
// device gets its own reader thread that posts KeyEvents.
class EvdevDeviceSource : public DeviceSource {
public:
    explicit EvdevDeviceSource(std::chrono::milliseconds rescan_interval,
                               std::string input_dir = "/dev/input");
    ~EvdevDeviceSource() override;

    bool start(EventQueue& queue) override;
    bool watch(const std::string& device_id) override;
    void unwatch(const std::string& device_id) override;
    void stop() override;
    std::vector<InputDevice> enumerate() override;

    // Number of nodes that could not be opened during the last scan
    size_t permission_denied() const { return permission_denied_.load(); }

private:
    struct Reader {
        std::string id;
        int fd = -1;
        struct libevdev* dev = nullptr;
        std::atomic<bool> running{true};
        std::thread thread;
    };

    std::vector<std::string> list_nodes() const;
    bool probe(const std::string& path, InputDevice& out, std::string& error);
    void scan();
    void rescan_loop();
    void read_loop(Reader* reader);
    void close_reader(std::unique_ptr<Reader> reader);
    void post(DaemonEvent event);

    std::chrono::milliseconds rescan_interval_;
    std::string input_dir_;

    EventQueue* queue_ = nullptr;
    std::atomic<bool> running_{false};
    std::atomic<size_t> permission_denied_{0};

    std::mutex mutex_;
    std::condition_variable wake_;
    std::set<std::string> known_;     // nodes announced with DeviceAdded
    std::map<std::string, std::unique_ptr<Reader>> readers_;
    std::thread rescan_thread_;
};

} // namespace holdtalk
