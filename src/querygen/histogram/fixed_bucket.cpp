#include "querygen/histogram/internal/fixed_bucket_impl.h"
#include "querygen/core/error.h"
#include <algorithm>
#include <limits>

namespace querygen {
namespace histogram {

std::unique_ptr<FixedBucketHistogram> FixedBucketHistogram::create(
    const std::vector<core::Value>& bounds) {
    return std::make_unique<internal::FixedBucketHistogramImpl>(bounds);
}

const std::vector<core::Value>& FixedBucketHistogram::DefaultBounds() {
    static const std::vector<core::Value> bounds = {
        0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0
    };
    return bounds;
}

namespace internal {

FixedBucketHistogramImpl::FixedBucketHistogramImpl(const std::vector<core::Value>& bounds)
    : bounds_(bounds), total_count_(0), sum_(0.0) {
    if (bounds_.empty()) {
        throw core::InvalidArgumentError("Bucket boundaries cannot be empty");
    }
    if (!std::is_sorted(bounds_.begin(), bounds_.end()) ||
        std::adjacent_find(bounds_.begin(), bounds_.end()) != bounds_.end()) {
        throw core::InvalidArgumentError("Bucket boundaries must be strictly increasing");
    }
    counts_.assign(bounds_.size() + 1, 0);
}

// Upper bounds are inclusive: value == bounds_[i] lands in bucket i.
size_t FixedBucketHistogramImpl::find_bucket_index(core::Value value) const {
    auto it = std::lower_bound(bounds_.begin(), bounds_.end(), value);
    return static_cast<size_t>(std::distance(bounds_.begin(), it));
}

void FixedBucketHistogramImpl::add(core::Value value) {
    std::lock_guard<std::mutex> lock(mutex_);

    counts_[find_bucket_index(value)]++;
    total_count_++;
    sum_ += value;

    if (!min_ || value < *min_) min_ = value;
    if (!max_ || value > *max_) max_ = value;
}

uint64_t FixedBucketHistogramImpl::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_count_;
}

core::Value FixedBucketHistogramImpl::sum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
}

std::optional<core::Value> FixedBucketHistogramImpl::min() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_;
}

std::optional<core::Value> FixedBucketHistogramImpl::max() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_;
}

core::Value FixedBucketHistogramImpl::quantile(double q) const {
    if (q < 0.0 || q > 1.0) {
        throw core::InvalidArgumentError("Quantile must be between 0 and 1");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (total_count_ == 0) {
        return 0.0;
    }

    uint64_t rank = static_cast<uint64_t>(q * total_count_);
    uint64_t cumulative = 0;

    for (size_t i = 0; i < counts_.size(); ++i) {
        cumulative += counts_[i];
        if (cumulative > rank) {
            // Interpolate within the bucket, clamped to the observed range
            core::Value lower = i == 0 ? std::min(*min_, bounds_[0]) : bounds_[i - 1];
            core::Value upper = i < bounds_.size() ? bounds_[i] : *max_;
            uint64_t position = rank - (cumulative - counts_[i]);
            double fraction = static_cast<double>(position) / counts_[i];
            core::Value estimate = lower + fraction * (upper - lower);
            return std::clamp(estimate, *min_, *max_);
        }
    }

    return *max_;
}

std::vector<BucketCount> FixedBucketHistogramImpl::buckets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BucketCount> result;
    result.reserve(counts_.size());
    for (size_t i = 0; i < bounds_.size(); ++i) {
        result.push_back({bounds_[i], counts_[i]});
    }
    result.push_back({std::numeric_limits<core::Value>::infinity(), counts_.back()});
    return result;
}

} // namespace internal
} // namespace histogram
} // namespace querygen
