#include "infrastructure/process/ProcessRunner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace channelscout::infra {

namespace {

constexpr int kPollSliceMs = 100;
constexpr useconds_t kReapSliceUs = 20000;

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Reads whatever is available; returns false once the pipe reached EOF.
bool drain(int fd, std::string& sink) {
    std::array<char, 4096> buffer{};
    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
        sink.append(buffer.data(), static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

} // namespace

ProcessResult ProcessRunner::run(const std::string& executable,
                                 const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout, std::stop_token stopToken) {
    ProcessResult result;

    int outPipe[2];
    int errPipe[2];
    if (pipe2(outPipe, O_CLOEXEC) == -1) {
        result.stderrText = std::string("pipe() failed: ") + strerror(errno);
        spdlog::error("Cannot start {}: {}", executable, result.stderrText);
        return result;
    }
    if (pipe2(errPipe, O_CLOEXEC) == -1) {
        result.stderrText = std::string("pipe() failed: ") + strerror(errno);
        spdlog::error("Cannot start {}: {}", executable, result.stderrText);
        close(outPipe[0]);
        close(outPipe[1]);
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.stderrText = std::string("fork() failed: ") + strerror(errno);
        spdlog::error("Cannot start {}: {}", executable, result.stderrText);
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) {
            close(fd);
        }
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);

        execvp(executable.c_str(), argv.data());

        const char* reason = strerror(errno);
        const char prefix[] = "execvp() failed: ";
        (void)!write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
        (void)!write(STDERR_FILENO, reason, strlen(reason));
        _exit(127);
    }

    result.launched = true;
    close(outPipe[1]);
    close(errPipe[1]);
    int outFd = outPipe[0];
    int errFd = errPipe[0];

    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (outFd >= 0 || errFd >= 0) {
        if (stopToken.stop_requested()) {
            result.cancelled = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (outFd >= 0) {
            fds[count++] = pollfd{outFd, POLLIN, 0};
        }
        if (errFd >= 0) {
            fds[count++] = pollfd{errFd, POLLIN, 0};
        }

        int ready = poll(fds.data(), count, kPollSliceMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("poll() failed while running {}: {}", executable, strerror(errno));
            result.timedOut = true;
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == outFd && !drain(outFd, result.stdoutText)) {
                closeFd(outFd);
            } else if (fds[i].fd == errFd && !drain(errFd, result.stderrText)) {
                closeFd(errFd);
            }
        }
    }

    closeFd(outFd);
    closeFd(errFd);

    // Both pipes can close before the child exits, so reaping also honours the deadline.
    int status = 0;
    bool killed = false;
    while (true) {
        if ((result.timedOut || result.cancelled) && !killed) {
            kill(pid, SIGKILL);
            killed = true;
        }
        pid_t reaped = waitpid(pid, &status, killed ? 0 : WNOHANG);
        if (reaped == pid) {
            break;
        }
        if (reaped < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("waitpid() failed for {}: {}", executable, strerror(errno));
            break;
        }
        if (stopToken.stop_requested()) {
            result.cancelled = true;
        } else if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
        } else {
            usleep(kReapSliceUs);
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    if (result.exitCode == 127 && result.stderrText.rfind("execvp() failed", 0) == 0) {
        result.launched = false;
    }

    spdlog::trace("{} exited with code {} (timed out: {}, cancelled: {})", executable,
                  result.exitCode, result.timedOut, result.cancelled);
    return result;
}

std::optional<std::filesystem::path> ProcessRunner::findExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    auto isExecutable = [](const std::filesystem::path& candidate) {
        std::error_code ec;
        return std::filesystem::is_regular_file(candidate, ec) &&
               access(candidate.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        std::filesystem::path candidate(name);
        if (isExecutable(candidate)) {
            return std::filesystem::absolute(candidate);
        }
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) {
        return std::nullopt;
    }

    std::string paths(pathEnv);
    size_t start = 0;
    while (start <= paths.size()) {
        auto end = paths.find(':', start);
        auto dir = paths.substr(start, end == std::string::npos ? std::string::npos : end - start);
        auto candidate = std::filesystem::path(dir.empty() ? "." : dir) / name;
        if (isExecutable(candidate)) {
            return std::filesystem::absolute(candidate);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return std::nullopt;
}

} // namespace channelscout::infra
