#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace harvest {

/**
 * @brief Cooperative cancellation flag shared by every suspension point
 *
 * request_cancel() only performs a lock-free atomic store and may be called
 * from a signal handler. cancel() additionally wakes threads blocked in
 * sleep_for(). Sleepers poll in short slices so a request issued from a
 * signal handler is still observed promptly.
 */
class CancellationToken {
public:
    static constexpr std::chrono::milliseconds kPollSlice{50};

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void request_cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    void cancel();

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Block for @p duration unless cancellation is requested first
     * @return false when the sleep was cut short by cancellation
     */
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace harvest
