#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "querygen/core/types.h"

namespace querygen {
namespace schedule {

/**
 * @brief Immutable set of named relative time windows
 *
 * Answers whether a bucket could hold data produced by this run and turns a
 * bucket into an absolute [start, end] window at dispatch time. The
 * "immediate" pseudo-bucket is not stored; it is always eligible and
 * resolves to no time restriction.
 */
class TimeBucketRegistry {
public:
    /**
     * @throws core::InvalidArgumentError on duplicate or reserved names,
     *         negative ages, or age_min > age_max
     */
    explicit TimeBucketRegistry(std::vector<core::TimeBucket> buckets);

    const core::TimeBucket* Find(const std::string& name) const;

    /**
     * @brief True for a registered bucket or the "immediate" sentinel
     */
    bool Contains(const std::string& name) const;

    static bool IsImmediate(const std::string& name);

    /**
     * @brief A bucket is eligible once the run is at least age_max old
     */
    static bool IsEligible(const core::TimeBucket& bucket, core::Duration elapsed) {
        return bucket.age_max <= elapsed;
    }

    /**
     * @brief Absolute window for a bucket
     *
     * start = now - age_max, end = now - age_min - jitter with
     * jitter = jitter_fraction * (age_max - age_min). The fraction is
     * clamped to [0, 1]; the window never leaves [age_min, age_max].
     */
    static core::TimeRange ResolveWindow(const core::TimeBucket& bucket,
                                         core::TimePoint now,
                                         double jitter_fraction = 0.0);

    const std::vector<core::TimeBucket>& buckets() const { return buckets_; }
    size_t size() const { return buckets_.size(); }

private:
    std::vector<core::TimeBucket> buckets_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace schedule
} // namespace querygen
