#pragma once

#include "key_codes.hpp"
#include "post_processor.hpp"

#include <string>
#include <vector>

namespace holdtalk {

struct HotkeyConfig {
    std::vector<std::string> modifiers = {"super"};   // super, ctrl, alt, shift
    std::string key = "period";
};

struct Config {
    // Hotkey (default: Super+Period)
    HotkeyConfig hotkey;

    // Whisper model
    std::string model = "base.en";  // ggml-<model>.bin, or a path to a .bin file
    std::string model_dir;          // empty: ~/.local/share/whisper/models
    int n_threads = 4;              // CPU threads for inference
    std::string language = "en";    // language code, or "auto" to detect

    // Get full model path
    std::string get_model_path() const;

    // Text post-processing
    PostProcessorConfig processing;

    // Session timing
    int min_hold_ms = 50;                   // shorter holds are treated as accidental taps
    int max_recording_ms = 30000;           // capture is committed automatically after this
    int transcription_timeout_ms = 60000;
    int injection_timeout_ms = 10000;
    int injection_delay_ms = 300;           // lets focus settle after the hotkey release

    // Devices whose name contains one of these are synthetic and never
    // monitored. "vvvv:pppp" matches a vendor:product id instead.
    std::vector<std::string> synthetic_patterns = {
        "virtual", "ydotoold", "xdotool", "uinput", "xtest"
    };
    int device_rescan_ms = 2000;

    // Output
    std::string injector = "ydotool";   // ydotool, clipboard
    bool notifications = true;          // desktop notifications via notify-send

    // Audio settings
    int sample_rate = 16000;        // Whisper expects 16kHz
    int channels = 1;               // Mono
    int frames_per_buffer = 512;    // Low latency buffer
};

struct ConfigResult {
    bool success = false;
    Config config;
    std::string error;
    std::vector<std::string> warnings;
};

class ConfigLoader {
public:
    // $XDG_CONFIG_HOME/holdtalk/config.ini or ~/.config/holdtalk/config.ini
    static std::string get_default_config_path();

    // Loads the file on top of `defaults`. A missing file is not an error:
    // the defaults are written there for the user to edit.
    static ConfigResult load_from_file(const std::string& path, const Config& defaults = Config());

    // INI text:
    //   [section]
    //   key = value          ; comment
    //   list = a, b, c       # comment
    static ConfigResult load_from_string(const std::string& text, const Config& defaults = Config());

    static std::string to_string(const Config& config);
    static bool write_default_file(const std::string& path);

    // Checks everything that would make the daemon misbehave at runtime
    static bool validate(const Config& config, std::string& error);

    // Maps names to key codes. Fails on unknown names, an empty modifier
    // set or a modifier used as the target key.
    static bool resolve_hotkey(const HotkeyConfig& hotkey, HotkeyBinding& binding, std::string& error);
};

} // namespace holdtalk
