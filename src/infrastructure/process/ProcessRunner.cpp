#include "infrastructure/process/ProcessRunner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lanwatch::infra {

namespace {

constexpr int EXIT_SPAWN_FAILED = 127;

class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) != 0) {
            fds_[0] = fds_[1] = -1;
        }
    }

    ~Pipe() {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] bool valid() const { return fds_[0] >= 0 && fds_[1] >= 0; }
    int readEnd() const { return fds_[0]; }
    int writeEnd() const { return fds_[1]; }

    void closeRead() {
        if (fds_[0] >= 0) {
            close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void closeWrite() {
        if (fds_[1] >= 0) {
            close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2]{-1, -1};
};

std::string joinCommand(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << argv[i];
    }
    return oss.str();
}

/// Reads whatever is available; returns false once the pipe reached EOF.
bool drain(int fd, std::string& out) {
    std::array<char, 4096> buffer{};
    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
        out.append(buffer.data(), static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

} // namespace

core::ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                       std::chrono::milliseconds timeout) {
    core::ProcessResult result;

    if (argv.empty()) {
        result.spawnFailed = true;
        result.exitCode = EXIT_SPAWN_FAILED;
        result.stderrText = "empty command line";
        return result;
    }

    Pipe outPipe;
    Pipe errPipe;
    Pipe execPipe;
    if (!outPipe.valid() || !errPipe.valid() || !execPipe.valid()) {
        result.spawnFailed = true;
        result.exitCode = EXIT_SPAWN_FAILED;
        result.stderrText = std::string("pipe: ") + std::strerror(errno);
        return result;
    }

    spdlog::debug("Running: {}", joinCommand(argv));

    // Built before fork: the child may only make async-signal-safe calls.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.spawnFailed = true;
        result.exitCode = EXIT_SPAWN_FAILED;
        result.stderrText = std::string("fork: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        dup2(outPipe.writeEnd(), STDOUT_FILENO);
        dup2(errPipe.writeEnd(), STDERR_FILENO);

        execvp(args[0], args.data());

        int error = errno;
        ssize_t ignored = write(execPipe.writeEnd(), &error, sizeof(error));
        (void)ignored;
        _exit(EXIT_SPAWN_FAILED);
    }

    outPipe.closeWrite();
    errPipe.closeWrite();
    execPipe.closeWrite();

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool outOpen = true;
    bool errOpen = true;

    while (outOpen || errOpen) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        fds[0] = {outOpen ? outPipe.readEnd() : -1, POLLIN, 0};
        fds[1] = {errOpen ? errPipe.readEnd() : -1, POLLIN, 0};

        int ready = poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed while running {}: {}", argv[0], std::strerror(errno));
            result.timedOut = true;
            break;
        }

        if (outOpen && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            outOpen = drain(outPipe.readEnd(), result.stdoutText);
        }
        if (errOpen && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            errOpen = drain(errPipe.readEnd(), result.stderrText);
        }
    }

    // Both pipes may close before the child exits
    int status = 0;
    while (!result.timedOut) {
        pid_t reaped = waitpid(pid, &status, WNOHANG);
        if (reaped == pid || (reaped < 0 && errno != EINTR)) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            break;
        }
        usleep(10'000);
    }

    if (result.timedOut) {
        spdlog::warn("{} exceeded {}ms, killing pid {}", argv[0], timeout.count(), pid);
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    int execError = 0;
    if (read(execPipe.readEnd(), &execError, sizeof(execError)) ==
        static_cast<ssize_t>(sizeof(execError))) {
        result.spawnFailed = true;
        result.exitCode = EXIT_SPAWN_FAILED;
        result.stderrText = argv[0] + ": " + std::strerror(execError);
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    spdlog::debug("{} exited with {}", argv[0], result.exitCode);
    return result;
}

bool ProcessRunner::isAvailable(const std::string& program) const {
    if (program.empty()) {
        return false;
    }
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* path = std::getenv("PATH");
    if (path == nullptr) {
        return false;
    }

    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace lanwatch::infra
