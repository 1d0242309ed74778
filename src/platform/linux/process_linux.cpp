#include "process.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace holdtalk {

namespace {

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

CommandResult run_command(const std::vector<std::string>& argv, const std::string& input,
                          OutputMode mode) {
    CommandResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    const bool capture = mode == OutputMode::Capture;
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || (capture && pipe2(out_pipe, O_CLOEXEC) != 0)) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        close_pipe(in_pipe);
        close_pipe(out_pipe);
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
    if (capture) {
        posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDERR_FILENO);
    } else {
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_adddup2(&actions, STDOUT_FILENO, STDERR_FILENO);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    close(in_pipe[0]);
    in_pipe[0] = -1;
    if (out_pipe[1] >= 0) {
        close(out_pipe[1]);
        out_pipe[1] = -1;
    }

    if (rc != 0) {
        result.error = argv[0] + ": " + std::strerror(rc);
        close_pipe(in_pipe);
        close_pipe(out_pipe);
        return result;
    }

    bool fed = input.empty() || write_all(in_pipe[1], input);
    close_pipe(in_pipe);

    char buffer[256];
    while (capture) {
        ssize_t n = read(out_pipe[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close_pipe(out_pipe);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error = std::string("waitpid: ") + std::strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.error = argv[0] + " killed by signal " + std::to_string(WTERMSIG(status));
        return result;
    }

    if (!fed) {
        result.error = argv[0] + " did not read its input";
        return result;
    }

    result.success = result.exit_code == 0;
    if (!result.success) {
        result.error = argv[0] + " exited with status " + std::to_string(result.exit_code);
    }
    return result;
}

bool process_running(const std::string& name) {
    return run_command({"pgrep", "-x", name}).success;
}

} // namespace holdtalk
