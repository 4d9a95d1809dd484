// src/process.hpp
// Child process with piped stdin/stdout/stderr, reaped on every path.

#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>
#include <vector>

namespace huefy {

struct ProcessResult {
    int exit_code = -1;  // 128 + signal for a signalled child
    std::string out;
    std::string err;
};

class Process {
public:
    // Spawn `path` with `args` (argv[0] is `path`). Throws NetworkError.
    Process(const std::string& path, const std::vector<std::string>& args);

    // Kills and reaps a child that is still running, closes every pipe.
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    pid_t pid() const noexcept { return pid_; }
    bool running() const noexcept { return pid_ > 0 && !reaped_; }

    // Write `input`, close stdin, then collect stdout and stderr until both
    // close and the child exits. On deadline the child is killed and reaped
    // and TimeoutError is thrown.
    ProcessResult communicate(const std::string& input, std::chrono::milliseconds timeout);

    // SIGKILL and reap. No-op once reaped.
    void terminate() noexcept;

private:
    void close_pipes() noexcept;
    int wait_until(std::chrono::steady_clock::time_point deadline, std::chrono::milliseconds timeout);

    pid_t pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
    int in_fd_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
};

} // namespace huefy
