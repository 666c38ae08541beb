#include "process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace srvkeeper {

namespace {
constexpr std::size_t kMaxCapturedBytes = 1024 * 1024;
constexpr auto kKillGrace = std::chrono::seconds(2);

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Drains whatever the pipe holds. Returns false once the write end is closed.
bool drain(int fd, std::string &output) {
    std::array<char, 4096> buffer{};
    while (true) {
        ssize_t bytes = ::read(fd, buffer.data(), buffer.size());
        if (bytes > 0) {
            if (output.size() < kMaxCapturedBytes) {
                output.append(buffer.data(), static_cast<std::size_t>(bytes));
            }
            continue;
        }
        if (bytes == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

}  // namespace

CommandResult RunProcess(const std::vector<std::string> &argv, std::chrono::seconds timeout) {
    CommandResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        return result;
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork: ") + std::strerror(errno);
        ::close(fds[0]);
        ::close(fds[1]);
        return result;
    }
    if (pid == 0) {
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execv(args[0], args.data());
        _exit(127);
    }

    ::close(fds[1]);
    ::fcntl(fds[0], F_SETFL, ::fcntl(fds[0], F_GETFL) | O_NONBLOCK);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::chrono::steady_clock::time_point kill_at{};
    bool open = true;
    int status = 0;
    bool reaped = false;
    while (!reaped) {
        auto now = std::chrono::steady_clock::now();
        if (!result.timed_out && now >= deadline) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            kill_at = now + kKillGrace;
        } else if (result.timed_out && kill_at != std::chrono::steady_clock::time_point{} && now >= kill_at) {
            ::kill(pid, SIGKILL);
            kill_at = {};
        }

        if (open) {
            pollfd pfd{};
            pfd.fd = fds[0];
            pfd.events = POLLIN;
            int ready = ::poll(&pfd, 1, 100);
            if (ready > 0) {
                open = drain(fds[0], result.output);
            }
        } else {
            ::usleep(50 * 1000);
        }

        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
        } else if (waited < 0 && errno != EINTR) {
            result.error = std::string("waitpid: ") + std::strerror(errno);
            break;
        }
    }
    if (open) {
        drain(fds[0], result.output);
    }
    ::close(fds[0]);

    if (reaped) {
        result.exit_code = decode_status(status);
        if (result.exit_code == 127 && result.output.empty()) {
            result.error = "cannot execute " + argv.front();
        }
    }
    return result;
}

CommandResult RunShellCommand(const std::string &command, std::chrono::seconds timeout,
                              const std::vector<std::string> &positional) {
    std::vector<std::string> argv = {"/bin/sh", "-c", command, "srvkeeper"};
    argv.insert(argv.end(), positional.begin(), positional.end());
    return RunProcess(argv, timeout);
}

}  // namespace srvkeeper
