#include <keyrescue/process/process_runner.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace keyrescue::process {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void killAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

Result<ProcessOutput> runProcess(const ProcessSpec& spec) {
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe(outPipe) < 0) {
        return Error{ErrorCode::ProcessFailed,
                     "Failed to create pipe: " + std::string(std::strerror(errno))};
    }
    if (::pipe(errPipe) < 0) {
        int saved = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return Error{ErrorCode::ProcessFailed,
                     "Failed to create pipe: " + std::string(std::strerror(saved))};
    }

    // Build argv before fork; the child must not allocate.
    std::string exe = spec.executable.string();
    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(exe.data());
    std::vector<std::string> args = spec.args;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    std::string workdir = spec.workdir ? spec.workdir->string() : std::string{};

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return Error{ErrorCode::ProcessFailed, "fork() failed: " + std::string(std::strerror(saved))};
    }

    if (pid == 0) {
        // Child process
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        ::close(errPipe[0]);
        ::close(errPipe[1]);

        if (!workdir.empty() && ::chdir(workdir.c_str()) < 0) {
            _exit(127);
        }
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    // Parent process
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    ProcessOutput output;
    std::array<char, 8192> buffer{};
    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    int fds[2] = {outPipe[0], errPipe[0]};

    while (fds[0] >= 0 || fds[1] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            closeFd(fds[0]);
            closeFd(fds[1]);
            killAndReap(pid);
            spdlog::debug("[Process] {} timed out after {}ms", exe, spec.timeout.count());
            return Error{ErrorCode::Timeout, exe + " timed out"};
        }

        std::array<pollfd, 2> pfds{};
        nfds_t count = 0;
        for (int fd : fds) {
            if (fd >= 0) {
                pfds[count].fd = fd;
                pfds[count].events = POLLIN;
                ++count;
            }
        }

        int rc = ::poll(pfds.data(), count, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved = errno;
            closeFd(fds[0]);
            closeFd(fds[1]);
            killAndReap(pid);
            return Error{ErrorCode::ProcessFailed,
                         "poll() failed: " + std::string(std::strerror(saved))};
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = ::read(pfds[i].fd, buffer.data(), buffer.size());
            if (n < 0 && errno == EINTR) {
                continue;
            }
            const bool isOut = pfds[i].fd == fds[0];
            if (n <= 0) {
                closeFd(isOut ? fds[0] : fds[1]);
                continue;
            }
            auto& sink = isOut ? output.out : output.err;
            sink.append(buffer.data(), static_cast<std::size_t>(n));
            if (output.out.size() + output.err.size() > spec.maxOutputBytes) {
                closeFd(fds[0]);
                closeFd(fds[1]);
                killAndReap(pid);
                return Error{ErrorCode::ResourceExhausted,
                             exe + " output exceeded " + std::to_string(spec.maxOutputBytes) +
                                 " bytes"};
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error{ErrorCode::ProcessFailed,
                         "waitpid() failed: " + std::string(std::strerror(errno))};
        }
    }
    output.exitCode = decodeStatus(status);
    if (output.exitCode == 127) {
        spdlog::debug("[Process] {} exited with 127 (not found or failed to start)", exe);
    }
    return output;
}

} // namespace keyrescue::process
