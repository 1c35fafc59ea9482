#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace querygen {
namespace schedule {

/**
 * @brief Shared pacing primitive for all workers of one executor
 *
 * Virtual-scheduling token bucket (GCRA). Each Wait() reserves the next
 * emission slot under the lock and sleeps until it, so the aggregate rate
 * holds no matter how many threads wait or how they are scheduled. A
 * fresh limiter grants `burst` permits immediately.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @throws core::InvalidArgumentError if rate is not positive or burst is 0
     */
    explicit RateLimiter(double permits_per_second, size_t burst = 1);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * @brief Block until a permit is available
     * @return false if the limiter was cancelled before or during the wait
     */
    bool Wait();

    /**
     * @brief Wake every waiter; all later Wait() calls return false
     */
    void Cancel();

    double rate() const { return rate_; }
    size_t burst() const { return burst_; }

private:
    const double rate_;
    const size_t burst_;
    const Clock::duration interval_;
    const Clock::duration tolerance_;   // (burst - 1) * interval

    mutable std::mutex mutex_;
    std::condition_variable cancel_cv_;
    Clock::time_point theoretical_arrival_;
    bool cancelled_ = false;
};

} // namespace schedule
} // namespace querygen
