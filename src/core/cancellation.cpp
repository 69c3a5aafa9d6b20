#include "harvest/core/cancellation.hpp"

#include <algorithm>

namespace harvest {

void CancellationToken::cancel() {
    request_cancel();
    std::lock_guard lock(mutex_);
    cv_.notify_all();
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    using clock = std::chrono::steady_clock;
    if (is_cancelled()) {
        return false;
    }
    if (duration.count() <= 0) {
        return true;
    }

    const auto deadline = clock::now() + duration;
    std::unique_lock lock(mutex_);
    while (!is_cancelled()) {
        const auto now = clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto slice = std::min<clock::duration>(deadline - now, kPollSlice);
        cv_.wait_for(lock, slice, [this] { return is_cancelled(); });
    }
    return false;
}

} // namespace harvest
