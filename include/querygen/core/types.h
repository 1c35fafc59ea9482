#ifndef QUERYGEN_CORE_TYPES_H_
#define QUERYGEN_CORE_TYPES_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace querygen {
namespace core {

/**
 * @brief Wall-clock time used for query windows
 */
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Relative ages and elapsed runtimes, millisecond resolution
 */
using Duration = std::chrono::milliseconds;

/**
 * @brief Represents a metric value
 */
using Value = double;

/**
 * @brief Pseudo-bucket that places no time restriction on a query
 */
inline constexpr const char* kImmediateBucket = "immediate";

/**
 * @brief Named relative window [now - age_max, now - age_min]
 */
struct TimeBucket {
    std::string name;
    Duration age_min{0};   // youngest edge ("ageStart" in config)
    Duration age_max{0};   // oldest edge ("ageEnd" in config)
    int weight = 1;

    std::string to_string() const;
};

/**
 * @brief One (query, bucket) pairing of the execution plan
 */
struct PlanEntry {
    std::string query_name;
    std::string bucket_name;

    bool operator==(const PlanEntry& other) const {
        return query_name == other.query_name && bucket_name == other.bucket_name;
    }
};

/**
 * @brief Backend query to execute, opaque apart from the time range
 */
struct QueryTemplate {
    std::string name;
    std::string expression;
    std::optional<int> concurrency;     // overrides query.concurrentQueries
    std::optional<double> target_qps;   // overrides the even share of query.targetQPS
};

/**
 * @brief Absolute query window
 */
struct TimeRange {
    TimePoint start;
    TimePoint end;

    /**
     * @brief Unix seconds sent on the wire; start rounds up, end rounds down
     */
    int64_t start_seconds() const;
    int64_t end_seconds() const;
};

/**
 * @brief Result of one dispatch, handed to the metrics sink and discarded
 */
struct Outcome {
    std::string query_name;
    std::string bucket_name;        // bucket actually queried ("immediate" on fallback)
    std::string planned_bucket;     // bucket named by the plan entry
    std::chrono::duration<double> latency{0.0};
    bool success = false;
    bool skipped = false;           // ineligible bucket under the skip policy
    int status = 0;                 // HTTP status, 0 on transport failure
    std::optional<int64_t> result_count;
    uint64_t sequence = 0;          // plan cursor value of this dispatch

    bool responded() const { return status > 0; }
};

} // namespace core
} // namespace querygen

#endif // QUERYGEN_CORE_TYPES_H_
