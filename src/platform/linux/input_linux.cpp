#include "evdev_source.hpp"
#include "log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <linux/input.h>
#include <sys/select.h>
#include <unistd.h>
#include <utility>

#include <libevdev/libevdev.h>

namespace holdtalk {

namespace {

// Number in "eventN", used to keep node order stable
int node_number(const std::string& name) {
    return std::atoi(name.c_str() + 5);
}

Clock::time_point event_time(const struct input_event& ev) {
    // libevdev is switched to CLOCK_MONOTONIC, the clock steady_clock reads
    auto since_boot = std::chrono::seconds(ev.input_event_sec) +
                      std::chrono::microseconds(ev.input_event_usec);
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(since_boot));
}

} // namespace

EvdevDeviceSource::EvdevDeviceSource(std::chrono::milliseconds rescan_interval, std::string input_dir)
    : rescan_interval_(rescan_interval)
    , input_dir_(std::move(input_dir)) {
}

EvdevDeviceSource::~EvdevDeviceSource() {
    stop();
}

std::vector<std::string> EvdevDeviceSource::list_nodes() const {
    std::vector<std::string> names;

    DIR* dir = opendir(input_dir_.c_str());
    if (!dir) {
        log_error("devices") << "Cannot list " << input_dir_ << ": " << std::strerror(errno);
        return names;
    }
    while (struct dirent* entry = readdir(dir)) {
        if (std::strncmp(entry->d_name, "event", 5) == 0) {
            names.push_back(entry->d_name);
        }
    }
    closedir(dir);

    std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
        return node_number(a) < node_number(b);
    });

    std::vector<std::string> paths;
    paths.reserve(names.size());
    for (const auto& name : names) {
        paths.push_back(input_dir_ + "/" + name);
    }
    return paths;
}

bool EvdevDeviceSource::probe(const std::string& path, InputDevice& out, std::string& error) {
    int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        if (errno == EACCES) {
            permission_denied_.fetch_add(1);
        }
        error = std::strerror(errno);
        return false;
    }

    struct libevdev* dev = nullptr;
    int rc = libevdev_new_from_fd(fd, &dev);
    if (rc < 0) {
        error = std::strerror(-rc);
        close(fd);
        return false;
    }

    out = InputDevice();
    out.id = path;
    const char* name = libevdev_get_name(dev);
    out.name = name ? name : "";
    out.vendor = static_cast<uint16_t>(libevdev_get_id_vendor(dev));
    out.product = static_cast<uint16_t>(libevdev_get_id_product(dev));

    out.has_key_events = libevdev_has_event_type(dev, EV_KEY);
    out.has_letter_keys = out.has_key_events &&
                          libevdev_has_event_code(dev, EV_KEY, KEY_A) &&
                          libevdev_has_event_code(dev, EV_KEY, KEY_Z);
    out.has_modifier_keys = out.has_key_events &&
                            (libevdev_has_event_code(dev, EV_KEY, KEY_LEFTCTRL) ||
                             libevdev_has_event_code(dev, EV_KEY, KEY_LEFTSHIFT) ||
                             libevdev_has_event_code(dev, EV_KEY, KEY_LEFTALT) ||
                             libevdev_has_event_code(dev, EV_KEY, KEY_LEFTMETA));

    libevdev_free(dev);
    close(fd);
    return true;
}

std::vector<InputDevice> EvdevDeviceSource::enumerate() {
    std::vector<InputDevice> devices;
    permission_denied_.store(0);

    for (const auto& path : list_nodes()) {
        InputDevice device;
        std::string error;
        if (probe(path, device, error)) {
            devices.push_back(device);
        } else {
            log_debug("devices") << "Cannot open " << path << ": " << error;
        }
    }
    return devices;
}

void EvdevDeviceSource::post(DaemonEvent event) {
    if (queue_ && !queue_->push(std::move(event))) {
        log_debug("devices") << "Event queue closed, dropping device event";
    }
}

void EvdevDeviceSource::scan() {
    std::vector<std::string> nodes = list_nodes();
    std::set<std::string> present(nodes.begin(), nodes.end());

    std::vector<std::string> removed;
    std::vector<std::string> fresh;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = known_.begin(); it != known_.end();) {
            if (present.count(*it) == 0) {
                removed.push_back(*it);
                it = known_.erase(it);
            } else {
                ++it;
            }
        }
        for (const auto& node : nodes) {
            if (known_.count(node) == 0) {
                fresh.push_back(node);
            }
        }
    }

    for (const auto& id : removed) {
        post(DeviceRemoved{id, Clock::now(), ""});
    }

    permission_denied_.store(0);
    std::vector<InputDevice> added;
    for (const auto& path : fresh) {
        InputDevice device;
        std::string error;
        if (!probe(path, device, error)) {
            log_debug("devices") << "Cannot open " << path << ": " << error;
            continue;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        known_.insert(path);
        added.push_back(device);
    }

    // Keyboards first, so the startup log leads with the devices that matter
    std::stable_sort(added.begin(), added.end(), [](const InputDevice& a, const InputDevice& b) {
        return DeviceFilter::keyboard_score(a) > DeviceFilter::keyboard_score(b);
    });
    for (auto& device : added) {
        post(DeviceAdded{std::move(device)});
    }
}

bool EvdevDeviceSource::start(EventQueue& queue) {
    if (running_.load()) return true;

    queue_ = &queue;
    running_.store(true);

    scan();
    if (permission_denied_.load() > 0) {
        log_warning("devices") << permission_denied_.load() << " input device(s) could not be opened. "
                               "Add your user to the 'input' group (sudo usermod -aG input $USER) and log in again.";
    }

    rescan_thread_ = std::thread([this]() {
        rescan_loop();
    });
    return true;
}

void EvdevDeviceSource::rescan_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait_for(lock, rescan_interval_, [this] { return !running_.load(); });
            if (!running_.load()) break;
        }
        scan();
    }
}

bool EvdevDeviceSource::watch(const std::string& device_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (readers_.count(device_id) > 0) return true;
    }

    int fd = open(device_id.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        log_warning("devices") << "Failed to open " << device_id << ": " << std::strerror(errno);
        return false;
    }

    struct libevdev* dev = nullptr;
    int rc = libevdev_new_from_fd(fd, &dev);
    if (rc < 0) {
        log_warning("devices") << "libevdev failed on " << device_id << ": " << std::strerror(-rc);
        close(fd);
        return false;
    }
    libevdev_set_clock_id(dev, CLOCK_MONOTONIC);

    auto reader = std::make_unique<Reader>();
    reader->id = device_id;
    reader->fd = fd;
    reader->dev = dev;

    Reader* raw = reader.get();
    reader->thread = std::thread([this, raw]() {
        read_loop(raw);
    });

    std::lock_guard<std::mutex> lock(mutex_);
    readers_.emplace(device_id, std::move(reader));
    return true;
}

void EvdevDeviceSource::read_loop(Reader* reader) {
    struct input_event ev;
    unsigned int flag = LIBEVDEV_READ_FLAG_NORMAL;
    std::string error;
    bool failed = false;

    auto forward = [&](const struct input_event& event) {
        if (event.type != EV_KEY || event.value < 0 || event.value > 2) return;
        KeyEvent key;
        key.device = reader->id;
        key.code = event.code;
        key.action = static_cast<KeyAction>(event.value);
        key.time = event_time(event);
        post(std::move(key));
    };

    while (reader->running.load() && !failed) {
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(reader->fd, &fds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 100000; // 100ms timeout

        int ret = select(reader->fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret < 0) {
            if (errno == EINTR) continue;
            error = std::string("select: ") + std::strerror(errno);
            failed = true;
            break;
        }
        if (ret == 0) continue;

        while (true) {
            int rc = libevdev_next_event(reader->dev, flag, &ev);
            if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
                forward(ev);
            } else if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                if (flag == LIBEVDEV_READ_FLAG_NORMAL) {
                    // SYN_DROPPED: replay the state deltas libevdev computed
                    log_warning("devices") << "Events dropped on " << reader->id << ", resyncing";
                    flag = LIBEVDEV_READ_FLAG_SYNC;
                } else {
                    forward(ev);
                }
            } else if (rc == -EAGAIN) {
                if (flag == LIBEVDEV_READ_FLAG_SYNC) {
                    flag = LIBEVDEV_READ_FLAG_NORMAL;
                    continue;
                }
                break;
            } else if (rc == -EINTR) {
                continue;
            } else {
                // -ENODEV is a plain unplug
                if (rc != -ENODEV) {
                    error = std::strerror(-rc);
                }
                failed = true;
                break;
            }
        }
    }

    if (failed && reader->running.load()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            known_.erase(reader->id);
        }
        post(DeviceRemoved{reader->id, Clock::now(), error});
    }
}

void EvdevDeviceSource::close_reader(std::unique_ptr<Reader> reader) {
    reader->running.store(false);
    if (reader->thread.joinable()) {
        reader->thread.join();
    }
    if (reader->dev) {
        libevdev_free(reader->dev);
    }
    if (reader->fd >= 0) {
        close(reader->fd);
    }
}

void EvdevDeviceSource::unwatch(const std::string& device_id) {
    std::unique_ptr<Reader> reader;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = readers_.find(device_id);
        if (it == readers_.end()) return;
        reader = std::move(it->second);
        readers_.erase(it);
    }
    close_reader(std::move(reader));
}

void EvdevDeviceSource::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    wake_.notify_all();
    if (rescan_thread_.joinable()) {
        rescan_thread_.join();
    }

    std::map<std::string, std::unique_ptr<Reader>> readers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        readers.swap(readers_);
        known_.clear();
    }
    for (auto& entry : readers) {
        close_reader(std::move(entry.second));
    }
    queue_ = nullptr;
}

} // namespace holdtalk
