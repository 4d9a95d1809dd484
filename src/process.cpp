// src/process.cpp
// posix_spawn-based child process and poll(2) driven pipe pump.

#include "process.hpp"
#include "huefy/error.hpp"
#include "sigpipe.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace huefy {

namespace {

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decode_status(int status) noexcept {
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

std::string errno_text(const char* what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

// Closes both ends of a pipe pair unless released.
struct PipePair {
    int fd[2] = {-1, -1};
    ~PipePair() {
        close_fd(fd[0]);
        close_fd(fd[1]);
    }
    bool open(bool nonblock_end, int which) {
        if (::pipe2(fd, O_CLOEXEC) < 0) return false;
        if (nonblock_end && ::fcntl(fd[which], F_SETFL, O_NONBLOCK) < 0) return false;
        return true;
    }
    int release(int which) noexcept {
        int r = fd[which];
        fd[which] = -1;
        return r;
    }
};

} // namespace

Process::Process(const std::string& path, const std::vector<std::string>& args) {
    PipePair in, out, err;
    if (!in.open(true, 1) || !out.open(true, 0) || !err.open(true, 0)) {
        throw NetworkError(errno_text("failed to create pipe", errno));
    }

    posix_spawn_file_actions_t actions;
    int rc = posix_spawn_file_actions_init(&actions);
    if (rc != 0) {
        throw NetworkError(errno_text("failed to set up process descriptors", rc));
    }
    struct ActionsGuard {
        posix_spawn_file_actions_t* a;
        ~ActionsGuard() { posix_spawn_file_actions_destroy(a); }
    } guard{&actions};

    if ((rc = posix_spawn_file_actions_adddup2(&actions, in.fd[0], STDIN_FILENO)) != 0 ||
        (rc = posix_spawn_file_actions_adddup2(&actions, out.fd[1], STDOUT_FILENO)) != 0 ||
        (rc = posix_spawn_file_actions_adddup2(&actions, err.fd[1], STDERR_FILENO)) != 0) {
        throw NetworkError(errno_text("failed to set up process descriptors", rc));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(path.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    rc = posix_spawn(&pid_, path.c_str(), &actions, nullptr, argv.data(), environ);
    if (rc != 0) {
        pid_ = -1;
        throw NetworkError(errno_text(("failed to start " + path).c_str(), rc));
    }

    // Child-side ends are closed when the PipePairs go out of scope.
    in_fd_ = in.release(1);
    out_fd_ = out.release(0);
    err_fd_ = err.release(0);
}

Process::~Process() {
    close_pipes();
    terminate();
}

void Process::close_pipes() noexcept {
    close_fd(in_fd_);
    close_fd(out_fd_);
    close_fd(err_fd_);
}

void Process::terminate() noexcept {
    if (!running()) return;
    ::kill(pid_, SIGKILL);
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    reaped_ = true;
    exit_code_ = r == pid_ ? decode_status(status) : -1;
}

ProcessResult Process::communicate(const std::string& input, std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    ProcessResult result;
    size_t written = 0;
    if (input.empty()) close_fd(in_fd_);

    while (in_fd_ >= 0 || out_fd_ >= 0 || err_fd_ >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) {
            close_pipes();
            terminate();
            throw TimeoutError("process did not finish within " + std::to_string(timeout.count()) + "ms");
        }

        struct pollfd pfds[3];
        nfds_t count = 0;
        if (in_fd_ >= 0) pfds[count++] = {in_fd_, POLLOUT, 0};
        if (out_fd_ >= 0) pfds[count++] = {out_fd_, POLLIN, 0};
        if (err_fd_ >= 0) pfds[count++] = {err_fd_, POLLIN, 0};

        int n = ::poll(pfds, count, static_cast<int>(remaining.count()));
        if (n < 0) {
            if (errno == EINTR) continue;
            int e = errno;
            close_pipes();
            terminate();
            throw NetworkError(errno_text("failed to poll process pipes", e));
        }
        if (n == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            const int fd = pfds[i].fd;
            const short rev = pfds[i].revents;
            if (rev == 0) continue;

            if (fd == in_fd_) {
                if (rev & (POLLERR | POLLHUP)) {
                    // Child stopped reading; its output still decides the result.
                    close_fd(in_fd_);
                    continue;
                }
                ssize_t w;
                {
                    ScopedSigpipeBlock block;
                    w = ::write(in_fd_, input.data() + written, input.size() - written);
                }
                if (w > 0) {
                    written += static_cast<size_t>(w);
                    if (written == input.size()) close_fd(in_fd_);
                } else if (w < 0 && (errno == EAGAIN || errno == EINTR)) {
                    continue;
                } else {
                    close_fd(in_fd_);
                }
                continue;
            }

            std::string& sink = fd == out_fd_ ? result.out : result.err;
            int& owned = fd == out_fd_ ? out_fd_ : err_fd_;
            char buf[4096];
            ssize_t r = ::read(fd, buf, sizeof(buf));
            if (r > 0) {
                sink.append(buf, static_cast<size_t>(r));
            } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
                close_fd(owned);
            }
        }
    }

    result.exit_code = wait_until(deadline, timeout);
    return result;
}

int Process::wait_until(std::chrono::steady_clock::time_point deadline,
                        std::chrono::milliseconds timeout) {
    if (reaped_) return exit_code_;
    while (true) {
        int status = 0;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            reaped_ = true;
            exit_code_ = decode_status(status);
            return exit_code_;
        }
        if (r < 0 && errno != EINTR) {
            int e = errno;
            reaped_ = true;
            throw NetworkError(errno_text("failed to wait for process exit", e));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            terminate();
            throw TimeoutError("process did not exit within " + std::to_string(timeout.count()) + "ms");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

} // namespace huefy
