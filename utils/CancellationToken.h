#pragma once

#include <atomic>

namespace rmbench {

/// @brief cooperative stop flag, Cancel() is safe to call from a signal handler
class CancellationToken {
    public:
        CancellationToken() = default;
        CancellationToken(const CancellationToken&) = delete;

        void Cancel() noexcept { cancelled.store(true, std::memory_order_relaxed); }
        bool IsCancelled() const noexcept { return cancelled.load(std::memory_order_relaxed); }
        void Reset() noexcept { cancelled.store(false, std::memory_order_relaxed); }

    private:
        std::atomic<bool> cancelled{false};
        static_assert(std::atomic<bool>::is_always_lock_free);
};

}
