#pragma once

#include <atomic>
#include <csignal>
#include <stdexcept>
#include <unistd.h>
#include <rmbench/utils/CancellationToken.h>

namespace rmbench {

/// @brief SIGINT handling for the whole CLI run
/// the first interrupt cancels the watched token, a second one (or one with no token watched)
/// ends the process with status 0
class InterruptGuard {
    public:
        InterruptGuard() {
            watched.store(nullptr);
            previous = std::signal(SIGINT, OnInterrupt);
            if (previous == SIG_ERR) {
                throw std::runtime_error("cannot install SIGINT handler");
            }
        }

        ~InterruptGuard() {
            watched.store(nullptr);
            std::signal(SIGINT, previous);
        }

        InterruptGuard(const InterruptGuard&) = delete;
        InterruptGuard& operator=(const InterruptGuard&) = delete;

        void Watch(CancellationToken* token) { watched.store(token); }
        void Unwatch() { watched.store(nullptr); }

    private:
        static void OnInterrupt(int) {
            auto token = watched.load();
            if (token == nullptr || token->IsCancelled()) {
                // 阻塞在网络读写上的 worker 不会再检查 token
                _exit(0);
            }
            token->Cancel();
        }

        inline static std::atomic<CancellationToken*> watched{nullptr};
        static_assert(std::atomic<CancellationToken*>::is_always_lock_free);

        using Handler = void (*)(int);
        Handler previous;
};

}
