#include "querygen/schedule/time_bucket_registry.h"
#include "querygen/core/error.h"
#include <algorithm>

namespace querygen {
namespace schedule {

TimeBucketRegistry::TimeBucketRegistry(std::vector<core::TimeBucket> buckets)
    : buckets_(std::move(buckets)) {
    for (size_t i = 0; i < buckets_.size(); ++i) {
        const auto& bucket = buckets_[i];
        if (bucket.name.empty()) {
            throw core::InvalidArgumentError("Time bucket name must not be empty");
        }
        if (IsImmediate(bucket.name)) {
            throw core::InvalidArgumentError(
                "Time bucket name '" + bucket.name + "' is reserved");
        }
        if (bucket.age_min < core::Duration(0) || bucket.age_max < core::Duration(0)) {
            throw core::InvalidArgumentError(
                "Time bucket '" + bucket.name + "' has a negative age");
        }
        if (bucket.age_min > bucket.age_max) {
            throw core::InvalidArgumentError(
                "Time bucket '" + bucket.name + "': ageStart must not exceed ageEnd");
        }
        if (!index_.emplace(bucket.name, i).second) {
            throw core::InvalidArgumentError(
                "Duplicate time bucket name '" + bucket.name + "'");
        }
    }
}

const core::TimeBucket* TimeBucketRegistry::Find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &buckets_[it->second];
}

bool TimeBucketRegistry::Contains(const std::string& name) const {
    return IsImmediate(name) || index_.count(name) > 0;
}

bool TimeBucketRegistry::IsImmediate(const std::string& name) {
    return name == core::kImmediateBucket;
}

core::TimeRange TimeBucketRegistry::ResolveWindow(const core::TimeBucket& bucket,
                                                  core::TimePoint now,
                                                  double jitter_fraction) {
    jitter_fraction = std::clamp(jitter_fraction, 0.0, 1.0);
    const auto width = bucket.age_max - bucket.age_min;
    const auto jitter = std::chrono::duration_cast<core::Duration>(
        std::chrono::duration<double, std::milli>(width.count() * jitter_fraction));

    core::TimeRange range;
    range.start = now - bucket.age_max;
    range.end = now - bucket.age_min - std::min(jitter, width);
    return range;
}

} // namespace schedule
} // namespace querygen
