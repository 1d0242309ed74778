#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace holdtalk {

namespace fs = std::filesystem;

namespace {

std::string trim_copy(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string home_dir() {
    const char* home = std::getenv("HOME");
    return home ? home : "";
}

std::string expand_home(const std::string& path) {
    if (path.size() >= 1 && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        return home_dir() + path.substr(1);
    }
    return path;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim_copy(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

std::string join_list(const std::vector<std::string>& items) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) result += ", ";
        result += items[i];
    }
    return result;
}

bool parse_bool(const std::string& value, bool& out) {
    const std::string lower = to_lower(value);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        out = false;
        return true;
    }
    return false;
}

bool parse_int(const std::string& value, int& out) {
    if (value.empty()) return false;
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (*end != '\0') return false;
    out = static_cast<int>(parsed);
    return true;
}

// Strips a trailing "# ..." or "; ..." comment
std::string strip_comment(const std::string& line) {
    size_t pos = line.find_first_of("#;");
    return pos == std::string::npos ? line : line.substr(0, pos);
}

} // namespace

std::string Config::get_model_path() const {
    if (model.find('/') != std::string::npos ||
        (model.size() > 4 && model.compare(model.size() - 4, 4, ".bin") == 0)) {
        return expand_home(model);
    }

    const std::string filename = "ggml-" + model + ".bin";
    if (!model_dir.empty()) {
        return expand_home(model_dir) + "/" + filename;
    }

    const std::string primary = home_dir() + "/.local/share/whisper/models/" + filename;
    const std::string fallback = home_dir() + "/.local/share/whisper-models/" + filename;

    std::error_code ec;
    if (!fs::exists(primary, ec) && fs::exists(fallback, ec)) {
        return fallback;
    }
    return primary;
}

std::string ConfigLoader::get_default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/holdtalk/config.ini";
    }
    const std::string home = home_dir();
    if (home.empty()) return "";
    return home + "/.config/holdtalk/config.ini";
}

ConfigResult ConfigLoader::load_from_file(const std::string& path, const Config& defaults) {
    ConfigResult result;

    std::ifstream file(path);
    if (!file.is_open()) {
        // First run: leave a commented default file behind
        if (write_default_file(path)) {
            log_info("config") << "Created default config at " << path;
        }
        result.success = true;
        result.config = defaults;
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    result = load_from_string(buffer.str(), defaults);
    if (!result.success) {
        result.error = path + ": " + result.error;
    }
    return result;
}

ConfigResult ConfigLoader::load_from_string(const std::string& text, const Config& defaults) {
    ConfigResult result;
    result.config = defaults;
    Config& config = result.config;

    std::stringstream input(text);
    std::string section;
    std::string line;
    int line_no = 0;

    auto fail = [&](const std::string& message) {
        result.success = false;
        result.error = "line " + std::to_string(line_no) + ": " + message;
        return result;
    };

    while (std::getline(input, line)) {
        ++line_no;
        line = trim_copy(strip_comment(line));
        if (line.empty()) continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                return fail("unterminated section header");
            }
            section = to_lower(trim_copy(line.substr(1, line.size() - 2)));
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return fail("expected key = value");
        }
        const std::string key = to_lower(trim_copy(line.substr(0, eq)));
        const std::string value = trim_copy(line.substr(eq + 1));
        const std::string name = section + "." + key;

        bool known = true;
        bool ok = true;

        if (name == "hotkey.modifiers") {
            config.hotkey.modifiers = split_list(value);
        } else if (name == "hotkey.key") {
            config.hotkey.key = value;
        } else if (name == "whisper.model") {
            config.model = value;
        } else if (name == "whisper.model_dir") {
            config.model_dir = value;
        } else if (name == "whisper.language") {
            config.language = value;
        } else if (name == "whisper.threads") {
            ok = parse_int(value, config.n_threads);
        } else if (name == "processing.remove_filler_words") {
            ok = parse_bool(value, config.processing.remove_fillers);
        } else if (name == "processing.filler_words") {
            config.processing.filler_words = split_list(value);
        } else if (name == "processing.fix_spacing") {
            ok = parse_bool(value, config.processing.fix_spacing);
        } else if (name == "processing.auto_capitalize") {
            ok = parse_bool(value, config.processing.auto_capitalize);
        } else if (name == "processing.capitalize_sentences") {
            ok = parse_bool(value, config.processing.capitalize_sentences);
        } else if (name == "processing.auto_punctuate") {
            ok = parse_bool(value, config.processing.auto_punctuate);
        } else if (name == "session.min_hold_ms") {
            ok = parse_int(value, config.min_hold_ms);
        } else if (name == "session.max_recording_ms") {
            ok = parse_int(value, config.max_recording_ms);
        } else if (name == "session.transcription_timeout_ms") {
            ok = parse_int(value, config.transcription_timeout_ms);
        } else if (name == "session.injection_timeout_ms") {
            ok = parse_int(value, config.injection_timeout_ms);
        } else if (name == "session.injection_delay_ms") {
            ok = parse_int(value, config.injection_delay_ms);
        } else if (name == "devices.synthetic_patterns") {
            config.synthetic_patterns = split_list(value);
        } else if (name == "devices.rescan_ms") {
            ok = parse_int(value, config.device_rescan_ms);
        } else if (name == "output.injector") {
            config.injector = to_lower(value);
        } else if (name == "output.notifications") {
            ok = parse_bool(value, config.notifications);
        } else if (name == "audio.sample_rate") {
            ok = parse_int(value, config.sample_rate);
        } else if (name == "audio.channels") {
            ok = parse_int(value, config.channels);
        } else if (name == "audio.frames_per_buffer") {
            ok = parse_int(value, config.frames_per_buffer);
        } else {
            known = false;
        }

        if (!known) {
            result.warnings.push_back("line " + std::to_string(line_no) + ": unknown key " + name);
            continue;
        }
        if (!ok) {
            return fail("invalid value for " + name + ": \"" + value + "\"");
        }
    }

    result.success = true;
    return result;
}

std::string ConfigLoader::to_string(const Config& config) {
    std::ostringstream out;
    out << "# holdtalk configuration\n"
        << "\n[hotkey]\n"
        << "# super, ctrl, alt, shift\n"
        << "modifiers = " << join_list(config.hotkey.modifiers) << "\n"
        << "key = " << config.hotkey.key << "\n"
        << "\n[whisper]\n"
        << "model = " << config.model << "\n";
    if (!config.model_dir.empty()) {
        out << "model_dir = " << config.model_dir << "\n";
    }
    out << "# language code, or auto\n"
        << "language = " << config.language << "\n"
        << "threads = " << config.n_threads << "\n"
        << "\n[processing]\n"
        << "remove_filler_words = " << (config.processing.remove_fillers ? "true" : "false") << "\n"
        << "filler_words = " << join_list(config.processing.filler_words) << "\n"
        << "fix_spacing = " << (config.processing.fix_spacing ? "true" : "false") << "\n"
        << "auto_capitalize = " << (config.processing.auto_capitalize ? "true" : "false") << "\n"
        << "capitalize_sentences = " << (config.processing.capitalize_sentences ? "true" : "false") << "\n"
        << "auto_punctuate = " << (config.processing.auto_punctuate ? "true" : "false") << "\n"
        << "\n[session]\n"
        << "min_hold_ms = " << config.min_hold_ms << "\n"
        << "max_recording_ms = " << config.max_recording_ms << "\n"
        << "transcription_timeout_ms = " << config.transcription_timeout_ms << "\n"
        << "injection_timeout_ms = " << config.injection_timeout_ms << "\n"
        << "injection_delay_ms = " << config.injection_delay_ms << "\n"
        << "\n[devices]\n"
        << "synthetic_patterns = " << join_list(config.synthetic_patterns) << "\n"
        << "rescan_ms = " << config.device_rescan_ms << "\n"
        << "\n[output]\n"
        << "# ydotool, clipboard\n"
        << "injector = " << config.injector << "\n"
        << "notifications = " << (config.notifications ? "true" : "false") << "\n"
        << "\n[audio]\n"
        << "sample_rate = " << config.sample_rate << "\n"
        << "channels = " << config.channels << "\n"
        << "frames_per_buffer = " << config.frames_per_buffer << "\n";
    return out.str();
}

bool ConfigLoader::write_default_file(const std::string& path) {
    if (path.empty()) return false;

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        log_warning("config") << "Cannot create " << fs::path(path).parent_path().string()
                              << ": " << ec.message();
        return false;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        log_warning("config") << "Cannot write " << path;
        return false;
    }
    file << to_string(Config());
    return file.good();
}

bool ConfigLoader::resolve_hotkey(const HotkeyConfig& hotkey, HotkeyBinding& binding, std::string& error) {
    binding = HotkeyBinding();

    if (hotkey.modifiers.empty()) {
        error = "hotkey needs at least one modifier";
        return false;
    }

    for (const auto& name : hotkey.modifiers) {
        ModifierGroup group;
        if (!lookup_modifier(name, group)) {
            error = "unknown modifier \"" + name + "\" (use super, ctrl, alt or shift)";
            return false;
        }
        bool duplicate = std::any_of(binding.modifiers.begin(), binding.modifiers.end(),
                                     [&](const ModifierGroup& g) { return g.name == group.name; });
        if (!duplicate) {
            binding.modifiers.push_back(group);
        }
    }

    ModifierGroup as_modifier;
    if (lookup_modifier(hotkey.key, as_modifier)) {
        error = "hotkey key \"" + hotkey.key + "\" is a modifier";
        return false;
    }
    if (!lookup_key(hotkey.key, binding.key)) {
        error = "unknown hotkey key \"" + hotkey.key + "\"";
        return false;
    }
    binding.key_name = to_lower(hotkey.key);
    return true;
}

bool ConfigLoader::validate(const Config& config, std::string& error) {
    HotkeyBinding binding;
    if (!resolve_hotkey(config.hotkey, binding, error)) {
        return false;
    }

    if (config.n_threads <= 0) {
        error = "whisper.threads must be positive";
    } else if (config.language.empty()) {
        error = "whisper.language must not be empty";
    } else if (config.model.empty()) {
        error = "whisper.model must not be empty";
    } else if (config.min_hold_ms < 0) {
        error = "session.min_hold_ms must not be negative";
    } else if (config.max_recording_ms <= 0) {
        error = "session.max_recording_ms must be positive";
    } else if (config.transcription_timeout_ms <= 0) {
        error = "session.transcription_timeout_ms must be positive";
    } else if (config.injection_timeout_ms <= 0) {
        error = "session.injection_timeout_ms must be positive";
    } else if (config.injection_delay_ms < 0) {
        error = "session.injection_delay_ms must not be negative";
    } else if (config.device_rescan_ms <= 0) {
        error = "devices.rescan_ms must be positive";
    } else if (config.injector != "ydotool" && config.injector != "clipboard") {
        error = "unknown injector \"" + config.injector + "\" (use ydotool or clipboard)";
    } else if (config.sample_rate <= 0 || config.channels <= 0 || config.frames_per_buffer <= 0) {
        error = "audio settings must be positive";
    } else {
        return true;
    }
    return false;
}

} // namespace holdtalk
