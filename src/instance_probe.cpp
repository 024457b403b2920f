#include "instance_probe.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Upper bound of one wait, so cancellation is noticed even without a deadline.
constexpr std::chrono::milliseconds kPollSlice{100};

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

void replaceAll(std::string& text, const std::string& placeholder, const std::string& value) {
    std::string::size_type pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.length(), value);
        pos += value.length();
    }
}

Error systemError(const std::string& what) {
    return Error{ErrorCode::IoFailed, what + ": " + std::strerror(errno)};
}

/**
 * @brief A shell running the probe command, with its stdout connected to a pipe.
 *
 * The shell leads its own process group so that everything it started can be killed.
 */
struct ShellProcess {
    pid_t pid = -1;
    int output = -1;
};

std::expected<ShellProcess, Error> spawnShell(const std::string& command) {
    int fds[2];
    if (pipe(fds) != 0) {
        return std::unexpected(systemError("cannot create pipe"));
    }

    pid_t pid = fork();
    if (pid < 0) {
        Error error = systemError("cannot fork");
        close(fds[0]);
        close(fds[1]);
        return std::unexpected(error);
    }
    if (pid == 0) {
        setpgid(0, 0);
        dup2(fds[1], STDOUT_FILENO);
        close(fds[0]);
        close(fds[1]);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    // Also done here: the parent may signal the group before the child ran setpgid.
    setpgid(pid, pid);
    close(fds[1]);
    return ShellProcess{pid, fds[0]};
}

void killShell(ShellProcess& shell) {
    if (kill(-shell.pid, SIGKILL) != 0) {
        kill(shell.pid, SIGKILL);
    }
    if (shell.output >= 0) {
        close(shell.output);
        shell.output = -1;
    }
    while (waitpid(shell.pid, nullptr, 0) < 0 && errno == EINTR) {
    }
}

int pollTimeoutMs(const OperationContext& ctx) {
    std::chrono::milliseconds wait = kPollSlice;
    if (auto left = ctx.remaining()) {
        wait = std::min(wait, std::max(*left, std::chrono::milliseconds(1)));
    }
    return static_cast<int>(wait.count());
}

} // namespace

CommandControlDataProbe::CommandControlDataProbe(const OperatorConfig& config) : config(config) {}

std::string CommandControlDataProbe::buildCommand(const Pod& pod) const {
    std::string command = config.controlDataCommand;
    replaceAll(command, "{namespace}", shellQuote(pod.metadata.namespace_));
    replaceAll(command, "{pod}", shellQuote(pod.metadata.name));
    return command;
}

std::expected<std::string, Error> CommandControlDataProbe::getControlData(const OperationContext& ctx, const Pod& pod) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    if (config.controlDataCommand.empty()) {
        return makeError(ErrorCode::InvalidConfiguration, "no control_data.command configured");
    }

    std::string command = buildCommand(pod);
    config.logDebug("Executing " + command);
    auto spawned = spawnShell(command);
    if (!spawned) {
        return makeError(spawned.error().code, "Failed to execute pg_controldata command: " + spawned.error().message);
    }
    ShellProcess shell = *spawned;

    auto abandon = [&](const Error& error) -> std::expected<std::string, Error> {
        killShell(shell);
        return makeError(error.code, "pg_controldata command for pod " + pod.metadata.name + " stopped: " +
                                         error.message);
    };

    std::string output;
    std::array<char, 4096> buf{};
    for (;;) {
        if (auto ok = ctx.check(); !ok) {
            return abandon(ok.error());
        }
        pollfd pfd{shell.output, POLLIN, 0};
        int ready = poll(&pfd, 1, pollTimeoutMs(ctx));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return abandon(systemError("cannot poll command output"));
        }
        if (ready == 0) {
            continue;
        }
        ssize_t n = read(shell.output, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return abandon(systemError("cannot read command output"));
        }
        if (n == 0) {
            break;
        }
        output.append(buf.data(), static_cast<std::size_t>(n));
    }
    close(shell.output);
    shell.output = -1;

    // The output is closed; the shell may still be exiting.
    int status = 0;
    for (;;) {
        pid_t done = waitpid(shell.pid, &status, WNOHANG);
        if (done == shell.pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            return makeError(ErrorCode::IoFailed, "cannot wait for pg_controldata command: " +
                                                      std::string(std::strerror(errno)));
        }
        if (auto ok = ctx.check(); !ok) {
            return abandon(ok.error());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return makeError(ErrorCode::Unavailable,
                         "pg_controldata command failed for pod " + pod.metadata.name);
    }
    return output;
}
