#include "bash.hpp"
#include "tool_util.hpp"
#include "../util.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace linkagent {

namespace {

struct CommandOutput {
    std::string out;
    std::string err;
    int exit_code = -1;
    bool timed_out = false;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Runs `bash -c command` in its own process group with stdin on /dev/null.
// Returns an error message when the process could not be started.
std::optional<std::string> run_command(const std::string& command, const std::string& cwd,
                                       uint64_t timeout_ms, CommandOutput& result) {
    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        return std::string("Failed to create pipes: ") + std::strerror(errno);
    }
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return std::string("Failed to create pipes: ") + std::strerror(errno);
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return std::string("Failed to fork process: ") + std::strerror(errno);
    }

    if (pid == 0) {
        // Child: new session so a timeout can kill the whole group
        setsid();
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        execl("/bin/bash", "bash", "-c", command.c_str(), nullptr);
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::array<char, 4096> buffer;

    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_fd >= 0) fds[count++] = pollfd{out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = pollfd{err_fd, POLLIN, 0};

        int ret = poll(fds.data(), count, static_cast<int>(std::min<long long>(remaining, 1000)));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n < 0 && errno == EINTR) continue;
            int& fd = (fds[i].fd == out_fd) ? out_fd : err_fd;
            std::string& sink = (fds[i].fd == out_fd) ? result.out : result.err;
            if (n > 0) {
                sink.append(buffer.data(), static_cast<size_t>(n));
            } else {
                close_fd(fd);
            }
        }
    }

    close_fd(out_fd);
    close_fd(err_fd);

    // Pipes may close while the command keeps running; the deadline still applies
    int status = 0;
    bool reaped = false;
    while (!result.timed_out) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            reaped = true;
            break;
        }
        if (ret < 0 && errno != EINTR) break;
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (result.timed_out) {
        kill(-pid, SIGKILL);
    }
    if (!reaped) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return std::nullopt;
}

} // namespace

BashTool::BashTool(uint64_t default_timeout_ms)
    : default_timeout_ms_(std::min(default_timeout_ms, kMaxTimeoutMs)) {}

Result<ToolResult> BashTool::execute(const nlohmann::json& params, const ToolContext& ctx) {
    if (auto err = validate_params(id(), parameters_schema(), params)) return *err;

    const auto command = params["command"].get<std::string>();

    std::optional<AgentError> err;
    uint64_t timeout_ms = optional_count(id(), params, "timeout", err).value_or(default_timeout_ms_);
    if (err) return *err;
    timeout_ms = std::min(timeout_ms, kMaxTimeoutMs);

    std::string title;
    if (auto desc = optional_string(params, "description")) {
        title = *desc;
    } else {
        auto words = split(collapse_whitespace(command), ' ');
        for (size_t i = 0; i < words.size() && i < 3; ++i) {
            if (i > 0) title += ' ';
            title += words[i];
        }
    }

    CommandOutput run;
    if (auto failure = run_command(command, ctx.working_directory.string(), timeout_ms, run)) {
        return AgentError::tool_execution(id(), *failure);
    }
    if (run.timed_out) {
        return AgentError::tool_execution(
            id(), "Command timed out after " + std::to_string(timeout_ms) + "ms");
    }

    std::string output = run.out;
    if (!run.err.empty()) {
        if (!output.empty()) output += "\n--- stderr ---\n";
        output += run.err;
    }
    if (output.size() > kMaxOutputLength) {
        output = utf8_truncate(output, kMaxOutputLength) + "\n... (output truncated)";
    }
    if (run.exit_code != 0) {
        output += "\n(exit code: " + std::to_string(run.exit_code) + ")";
    }

    ToolResult result;
    result.title = title;
    result.output = std::move(output);
    result.metadata = {
        {"exitCode", run.exit_code},
        {"command", command}
    };
    return result;
}

std::string BashTool::description() const {
    return "Executes a given bash command in the working directory.\n\n"
           "Usage:\n"
           "- Use for terminal operations like git, npm, docker, etc.\n"
           "- Commands have a default timeout of 2 minutes (max 10 minutes)\n"
           "- Output exceeding 30000 characters will be truncated\n"
           "- Always quote file paths containing spaces";
}

nlohmann::json BashTool::parameters_schema() const {
    return nlohmann::json::parse(R"json({
        "type": "object",
        "properties": {
            "command": {"type": "string", "description": "The command to execute"},
            "timeout": {"type": "number", "description": "Optional timeout in milliseconds (max 600000)"},
            "description": {"type": "string", "description": "Description of what this command does"}
        },
        "required": ["command"]
    })json");
}

} // namespace linkagent
