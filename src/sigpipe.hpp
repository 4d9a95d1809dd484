// src/sigpipe.hpp
// Suppress SIGPIPE for the calling thread while writing to a peer that may
// already be gone (a closed socket, a child that stopped reading stdin).

#pragma once

#include <csignal>
#include <ctime>
#include <pthread.h>

namespace huefy {

class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        blocked_ = pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_mask_) == 0;
    }

    ~ScopedSigpipeBlock() {
        if (!blocked_) return;
        if (!was_pending_) {
            // Consume the SIGPIPE our own writes raised so it is never delivered.
            struct timespec zero{0, 0};
            while (sigtimedwait(&pipe_set_, nullptr, &zero) == SIGPIPE) {
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

private:
    sigset_t pipe_set_;
    sigset_t old_mask_;
    bool was_pending_ = false;
    bool blocked_ = false;
};

} // namespace huefy
