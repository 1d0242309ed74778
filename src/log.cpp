#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace holdtalk {

static std::atomic<LogLevel> g_level{LogLevel::Warning};
static std::mutex g_log_mutex;

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel get_log_level() {
    return g_level.load();
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(g_level.load());
}

void log_write(LogLevel level, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ostream& out = (level == LogLevel::Warning || level == LogLevel::Error) ? std::cerr : std::cout;
    out << "[" << tag << "] ";
    if (level == LogLevel::Warning) {
        out << "warning: ";
    } else if (level == LogLevel::Error) {
        out << "error: ";
    }
    out << message << std::endl;
}

void console_write(const std::string& text) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << text << std::flush;
}

} // namespace holdtalk
