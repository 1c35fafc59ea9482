#ifndef QUERYGEN_HISTOGRAM_HISTOGRAM_H_
#define QUERYGEN_HISTOGRAM_HISTOGRAM_H_

#include <memory>
#include <vector>
#include <optional>
#include <cstdint>

#include "querygen/core/types.h"

namespace querygen {
namespace histogram {

/**
 * @brief Count of observations falling into one bucket
 */
struct BucketCount {
    core::Value upper_bound;   // inclusive ("le"); +Inf for the overflow bucket
    uint64_t count;
};

/**
 * @brief Interface for histogram implementations
 */
class Histogram {
public:
    virtual ~Histogram() = default;

    /**
     * @brief Add a single value to the histogram
     */
    virtual void add(core::Value value) = 0;

    /**
     * @brief Get the total count of values
     */
    virtual uint64_t count() const = 0;

    /**
     * @brief Get the sum of all values
     */
    virtual core::Value sum() const = 0;

    virtual std::optional<core::Value> min() const = 0;
    virtual std::optional<core::Value> max() const = 0;

    /**
     * @brief Estimate the value at quantile q in [0, 1]
     */
    virtual core::Value quantile(double q) const = 0;

    /**
     * @brief Per-bucket (non-cumulative) counts, overflow bucket last
     */
    virtual std::vector<BucketCount> buckets() const = 0;
};

/**
 * @brief Histogram with caller-supplied upper bounds
 */
class FixedBucketHistogram : public Histogram {
public:
    /**
     * @brief Create a new fixed-bucket histogram
     *
     * @param bounds Sorted, non-empty bucket upper bounds; an overflow
     *               bucket (+Inf) is appended
     * @throws core::InvalidArgumentError on empty or unsorted bounds
     */
    static std::unique_ptr<FixedBucketHistogram> create(
        const std::vector<core::Value>& bounds);

    /**
     * @brief Prometheus client default latency buckets (seconds)
     */
    static const std::vector<core::Value>& DefaultBounds();
};

} // namespace histogram
} // namespace querygen

#endif // QUERYGEN_HISTOGRAM_HISTOGRAM_H_
