#pragma once

#include "querygen/histogram/histogram.h"
#include <mutex>

namespace querygen {
namespace histogram {
namespace internal {

class FixedBucketHistogramImpl : public FixedBucketHistogram {
public:
    explicit FixedBucketHistogramImpl(const std::vector<core::Value>& bounds);

    void add(core::Value value) override;
    uint64_t count() const override;
    core::Value sum() const override;
    std::optional<core::Value> min() const override;
    std::optional<core::Value> max() const override;
    core::Value quantile(double q) const override;
    std::vector<BucketCount> buckets() const override;

private:
    size_t find_bucket_index(core::Value value) const;

    const std::vector<core::Value> bounds_;
    std::vector<uint64_t> counts_;     // bounds_.size() + 1 entries
    uint64_t total_count_;
    core::Value sum_;
    std::optional<core::Value> min_;
    std::optional<core::Value> max_;
    mutable std::mutex mutex_;
};

} // namespace internal
} // namespace histogram
} // namespace querygen
