#include "exchange/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

static void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

static void closefd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

// Descriptors above stderr open in this process. Listed before fork() since
// the child may only make async-signal-safe calls.
static std::vector<int> inherited_fds() {
    std::vector<int> fds;
    DIR* dir = ::opendir("/proc/self/fd");
    if (!dir) {
        long max = ::sysconf(_SC_OPEN_MAX);
        if (max < 0 || max > 65536) max = 65536;
        for (int fd = STDERR_FILENO + 1; fd < (int)max; ++fd) fds.push_back(fd);
        return fds;
    }
    const int self = ::dirfd(dir);
    while (const dirent* entry = ::readdir(dir)) {
        const int fd = std::atoi(entry->d_name);
        if (fd > STDERR_FILENO && fd != self) fds.push_back(fd);
    }
    ::closedir(dir);
    return fds;
}

std::string shellQuote(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

ProcessResult runProcess(const std::string& command, const std::string& input,
                         const CancellationToken& token, int timeoutMs) {
    ignore_sigpipe();

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    if (::pipe2(inPipe, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe2() failed: ") + std::strerror(errno));
    }
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        const int err = errno;
        closefd(inPipe[0]);
        closefd(inPipe[1]);
        throw std::runtime_error(std::string("pipe2() failed: ") + std::strerror(err));
    }

    const std::vector<int> toClose = inherited_fds();

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        closefd(inPipe[0]); closefd(inPipe[1]);
        closefd(outPipe[0]); closefd(outPipe[1]);
        throw std::runtime_error(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        for (int fd : toClose) ::close(fd);
        ::execl("/bin/sh", "sh", "-c", command.c_str(), (char*)nullptr);
        ::_exit(127);
    }

    // both sides set the group so kill(-pid) never races the child's setpgid
    ::setpgid(pid, pid);

    closefd(inPipe[0]);
    closefd(outPipe[1]);
    int writeFd = inPipe[1];
    int readFd = outPipe[0];
    ::fcntl(writeFd, F_SETFL, ::fcntl(writeFd, F_GETFL) | O_NONBLOCK);

    ProcessResult result;
    std::size_t written = 0;
    if (input.empty()) closefd(writeFd);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    char buff[4096];

    while (readFd >= 0) {
        if (token.cancelled()) {
            result.cancelled = true;
            break;
        }
        if (timeoutMs > 0 && std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            break;
        }

        pollfd fds[2];
        nfds_t n = 0;
        fds[n++] = pollfd{readFd, POLLIN, 0};
        if (writeFd >= 0) fds[n++] = pollfd{writeFd, POLLOUT, 0};

        const int rc = ::poll(fds, n, 50);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        if (writeFd >= 0 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
            const ssize_t w = ::write(writeFd, input.data() + written, input.size() - written);
            if (w > 0) written += (std::size_t)w;
            if (w < 0 && errno != EAGAIN && errno != EINTR) written = input.size();
            if (written >= input.size()) closefd(writeFd);
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            const ssize_t r = ::read(readFd, buff, sizeof(buff));
            if (r > 0) {
                result.output.append(buff, (std::size_t)r);
            } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
                closefd(readFd);
            }
        }
    }

    closefd(writeFd);
    closefd(readFd);

    int status = 0;
    if (result.cancelled || result.timedOut) {
        ::kill(-pid, SIGTERM);

        // grace period before SIGKILL
        const auto killAt = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
        while (::waitpid(pid, &status, WNOHANG) == 0) {
            if (std::chrono::steady_clock::now() >= killAt) {
                ::kill(-pid, SIGKILL);
                break;
            }
            ::usleep(10000);
        }
    }

    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    if (WIFEXITED(status)) result.exitCode = WEXITSTATUS(status);
    return result;
}
