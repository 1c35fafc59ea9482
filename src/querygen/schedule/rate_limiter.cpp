#include "querygen/schedule/rate_limiter.h"
#include "querygen/core/error.h"
#include <algorithm>
#include <string>

namespace querygen {
namespace schedule {

namespace {

RateLimiter::Clock::duration IntervalFor(double permits_per_second) {
    if (!(permits_per_second > 0.0)) {
        throw core::InvalidArgumentError(
            "Rate limiter requires a positive rate, got: " + std::to_string(permits_per_second));
    }
    return std::chrono::duration_cast<RateLimiter::Clock::duration>(
        std::chrono::duration<double>(1.0 / permits_per_second));
}

} // namespace

RateLimiter::RateLimiter(double permits_per_second, size_t burst)
    : rate_(permits_per_second),
      burst_(burst),
      interval_(IntervalFor(permits_per_second)),
      tolerance_(interval_ * static_cast<int64_t>(burst > 0 ? burst - 1 : 0)),
      theoretical_arrival_(Clock::now()) {
    if (burst_ == 0) {
        throw core::InvalidArgumentError("Rate limiter burst must be at least 1");
    }
}

bool RateLimiter::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cancelled_) {
        return false;
    }

    const auto now = Clock::now();
    const auto arrival = std::max(theoretical_arrival_, now);
    const auto slot = std::max(now, arrival - tolerance_);
    theoretical_arrival_ = arrival + interval_;

    if (slot <= now) {
        return true;
    }
    // The slot stays reserved even if we are cancelled; nobody waits after that.
    return !cancel_cv_.wait_until(lock, slot, [this] { return cancelled_; });
}

void RateLimiter::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cancel_cv_.notify_all();
}

} // namespace schedule
} // namespace querygen
