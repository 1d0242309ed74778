#pragma once

#include <sstream>
#include <string>

namespace holdtalk {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

void set_log_level(LogLevel level);
LogLevel get_log_level();
bool log_enabled(LogLevel level);

// Writes one line: "[tag] message". Debug/Info go to stdout, Warning/Error to stderr.
// Never filtered; every writer to the console goes through here so lines from
// different threads do not interleave.
void log_write(LogLevel level, const char* tag, const std::string& message);

// Writes text to stdout as is, under the same lock
void console_write(const std::string& text);

// Collects one line and writes it when destroyed, if the level is enabled:
//
//   log_info("session") << "Session " << id << " aborted";
class LogLine {
public:
    LogLine(LogLevel level, const char* tag)
        : level_(level), tag_(tag), enabled_(log_enabled(level)) {}

    ~LogLine() {
        if (enabled_) log_write(level_, tag_, stream_.str());
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* tag_;
    bool enabled_;
    std::ostringstream stream_;
};

inline LogLine log_debug(const char* tag) { return LogLine(LogLevel::Debug, tag); }
inline LogLine log_info(const char* tag) { return LogLine(LogLevel::Info, tag); }
inline LogLine log_warning(const char* tag) { return LogLine(LogLevel::Warning, tag); }
inline LogLine log_error(const char* tag) { return LogLine(LogLevel::Error, tag); }

} // namespace holdtalk
