#pragma once

#include <string>
#include <vector>

namespace holdtalk {

struct CommandResult {
    bool success = false;     // ran and exited with status 0
    int exit_code = -1;
    std::string output;       // stdout and stderr, merged
    std::string error;        // why it could not be run
};

enum class OutputMode {
    Capture,    // read stdout and stderr until the pipe closes
    Discard     // send them to /dev/null; returns as soon as argv[0] exits
};

// Runs argv[0] (looked up in PATH) without a shell, feeds `input` to its
// stdin and waits for it to exit. The caller must ignore SIGPIPE, otherwise
// a child that exits without reading its input kills the process.
//
// Use Discard for tools that leave a background process behind holding the
// inherited stdout (xclip, xsel): Capture would wait for that process too.
CommandResult run_command(const std::vector<std::string>& argv, const std::string& input = "",
                          OutputMode mode = OutputMode::Capture);

// True if a process with exactly this name is running (pgrep -x)
bool process_running(const std::string& name);

} // namespace holdtalk
