#include "app.hpp"
#include "config.hpp"
#include "device_filter.hpp"
#include "evdev_source.hpp"
#include "log.hpp"
#include <algorithm>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

static holdtalk::App* g_app = nullptr;

void signal_handler(int signum) {
    (void)signum;
    if (g_app) {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config FILE    Config file (default: ~/.config/holdtalk/config.ini)\n"
              << "  -m, --model NAME     Whisper model name or path to a ggml .bin (default: base.en)\n"
              << "  -t, --threads N      Number of CPU threads (default: 4)\n"
              << "  -l, --language LANG  Language code, or auto to detect (default: en)\n"
              << "  -i, --injector NAME  ydotool or clipboard (default: ydotool)\n"
              << "  --no-notify          Don't show desktop notifications\n"
              << "  --list-devices       List input devices and how they are classified, then exit\n"
              << "  -v, --verbose        Log session progress\n"
              << "  -d, --debug          Log every key event\n"
              << "  -h, --help           Show this help\n"
              << "\nHotkey:\n"
              << "  Hold the configured combination (default Super+Period) to record,\n"
              << "  release the key to transcribe and type the text.\n"
              << "\nFirst run:\n"
              << "  Download a model into ~/.local/share/whisper/models, e.g.\n"
              << "    curl -L -o ~/.local/share/whisper/models/ggml-base.en.bin \\\n"
              << "      https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.en.bin\n"
              << "  Reading keyboards requires membership in the 'input' group.\n"
              << std::endl;
}

static int list_devices(const holdtalk::Config& config) {
    holdtalk::EvdevDeviceSource source(std::chrono::milliseconds(config.device_rescan_ms));
    std::vector<holdtalk::InputDevice> devices = source.enumerate();

    std::stable_sort(devices.begin(), devices.end(),
                     [](const holdtalk::InputDevice& a, const holdtalk::InputDevice& b) {
                         return holdtalk::DeviceFilter::keyboard_score(a) >
                                holdtalk::DeviceFilter::keyboard_score(b);
                     });

    holdtalk::DeviceFilter filter(config.synthetic_patterns);
    for (const auto& device : devices) {
        bool monitored = filter.add_device(device);
        char ids[16];
        std::snprintf(ids, sizeof(ids), "%04x:%04x", device.vendor, device.product);
        std::cout << (monitored ? "* " : "  ") << device.id << "  " << ids << "  "
                  << holdtalk::device_class_name(filter.classification(device.id)) << "  "
                  << device.name << std::endl;
    }

    if (source.permission_denied() > 0) {
        std::cout << "\n" << source.permission_denied()
                  << " device(s) could not be opened; add your user to the 'input' group." << std::endl;
    }
    std::cout << "\n* = monitored for the hotkey" << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    std::string config_path = holdtalk::ConfigLoader::get_default_config_path();
    bool list_only = false;
    holdtalk::LogLevel level = holdtalk::LogLevel::Warning;

    // Command line values are applied on top of the config file
    const char* model = nullptr;
    const char* threads = nullptr;
    const char* language = nullptr;
    const char* injector = nullptr;
    bool no_notify = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model") == 0) && i + 1 < argc) {
            model = argv[++i];
        }
        else if ((strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--threads") == 0) && i + 1 < argc) {
            threads = argv[++i];
        }
        else if ((strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) && i + 1 < argc) {
            language = argv[++i];
        }
        else if ((strcmp(argv[i], "-i") == 0 || strcmp(argv[i], "--injector") == 0) && i + 1 < argc) {
            injector = argv[++i];
        }
        else if (strcmp(argv[i], "--no-notify") == 0) {
            no_notify = true;
        }
        else if (strcmp(argv[i], "--list-devices") == 0) {
            list_only = true;
        }
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            if (level != holdtalk::LogLevel::Debug) level = holdtalk::LogLevel::Info;
        }
        else if (strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--debug") == 0) {
            level = holdtalk::LogLevel::Debug;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    holdtalk::set_log_level(level);

    holdtalk::ConfigResult loaded = holdtalk::ConfigLoader::load_from_file(config_path);
    for (const auto& warning : loaded.warnings) {
        log_warning("config") << config_path << ": " << warning;
    }
    if (!loaded.success) {
        std::cerr << "error: " << config_path << ": " << loaded.error << std::endl;
        return 1;
    }
    holdtalk::Config config = loaded.config;

    if (model) config.model = model;
    if (threads) {
        char* end = nullptr;
        long n = std::strtol(threads, &end, 10);
        if (end == threads || *end != '\0') {
            std::cerr << "error: invalid thread count: " << threads << std::endl;
            return 1;
        }
        config.n_threads = static_cast<int>(n);
    }
    if (language) config.language = language;
    if (injector) config.injector = injector;
    if (no_notify) config.notifications = false;

    if (list_only) {
        return list_devices(config);
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    holdtalk::App app;

    std::cout << "holdtalk - push-to-talk dictation\n" << std::endl;
    std::cout << "Config: " << config_path << std::endl;
    std::cout << "Model: " << config.get_model_path() << std::endl;
    std::cout << "Threads: " << config.n_threads << std::endl;
    std::cout << "Language: " << config.language << std::endl;
    std::cout << "Injector: " << config.injector << std::endl;
    std::cout << std::endl;

    if (!app.initialize(config)) {
        std::cerr << "error: " << (app.error_kind() == holdtalk::ErrorKind::Config ? "config: " : "")
                  << app.error() << std::endl;
        return 1;
    }

    g_app = &app;
    int result = app.run();
    g_app = nullptr;

    app.shutdown();
    return result;
}
