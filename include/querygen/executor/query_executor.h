#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "querygen/client/backend_client.h"
#include "querygen/core/config.h"
#include "querygen/core/types.h"
#include "querygen/histogram/histogram.h"
#include "querygen/metrics/metrics_sink.h"
#include "querygen/schedule/execution_plan.h"
#include "querygen/schedule/rate_limiter.h"
#include "querygen/schedule/time_bucket_registry.h"

namespace querygen {
namespace executor {

/**
 * @brief Per-template execution settings
 */
struct ExecutorOptions {
    std::string query_name;
    std::string expression;
    int concurrency = 1;
    double target_qps = 1.0;
    size_t limit = 1000;
    core::Duration startup_stagger = std::chrono::seconds(1);
    double window_jitter = 0.5;
    core::IneligiblePolicy ineligible_policy = core::IneligiblePolicy::FALLBACK_IMMEDIATE;
};

/**
 * @brief What one plan step resolved to at dispatch time
 */
struct Dispatch {
    uint64_t sequence = 0;
    std::string planned_bucket;
    std::string bucket_name;                // "immediate" after a fallback
    std::optional<core::TimeRange> range;   // absent for "immediate"
    bool skip = false;
};

/**
 * @brief Counter snapshot
 */
struct ExecutorStats {
    uint64_t dispatched = 0;   // requests issued
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t skipped = 0;      // plan steps consumed without a request
};

/**
 * @brief Runs one query template with N workers at a shared target rate
 *
 * All workers draw permits from one RateLimiter and plan steps from one
 * PlanCycler, so the aggregate rate and the plan order do not depend on
 * the worker count. Each worker owns its BackendClient.
 */
class QueryExecutor {
public:
    /**
     * @throws core::InvalidArgumentError for a non-positive concurrency or
     *         rate, an empty plan, or an entry naming another query or an
     *         unknown bucket
     */
    QueryExecutor(ExecutorOptions options,
                  const schedule::TimeBucketRegistry& registry,
                  std::vector<core::PlanEntry> entries,
                  client::ClientFactory client_factory,
                  std::shared_ptr<metrics::MetricsSink> sink);
    ~QueryExecutor();

    QueryExecutor(const QueryExecutor&) = delete;
    QueryExecutor& operator=(const QueryExecutor&) = delete;

    /**
     * @brief Create one client per worker and start the workers
     *
     * Bucket eligibility is measured from run_start.
     *
     * @throws core::InternalError if already started
     */
    void Start(std::chrono::steady_clock::time_point run_start = std::chrono::steady_clock::now());

    /**
     * @brief Cancel waits and in-flight requests, then join every worker
     */
    void Stop();

    bool IsRunning() const;

    /**
     * @brief Consume the next plan step and resolve it against the clock
     */
    Dispatch PlanNext(core::TimePoint now, core::Duration elapsed, std::mt19937_64& rng);

    /**
     * @brief Issue one dispatch on a client and interpret the answer
     *
     * Never throws for backend problems; those become a failed Outcome.
     */
    core::Outcome Execute(client::BackendClient& client, const Dispatch& dispatch,
                          const std::string& log_prefix);

    ExecutorStats stats() const;

    /**
     * @brief Latency of every answered request, in seconds
     */
    const histogram::Histogram& latency() const { return *latency_; }

    const ExecutorOptions& options() const { return options_; }
    const schedule::PlanCycler& cycler() const { return cycler_; }
    const schedule::RateLimiter& limiter() const { return limiter_; }

private:
    void WorkerLoop(int worker_id, client::BackendClient& client);
    bool SleepFor(core::Duration duration);
    void RecordOutcome(const core::Outcome& outcome);

    const ExecutorOptions options_;
    const schedule::TimeBucketRegistry& registry_;
    schedule::PlanCycler cycler_;
    schedule::RateLimiter limiter_;
    client::ClientFactory client_factory_;
    std::shared_ptr<metrics::MetricsSink> sink_;
    std::unique_ptr<histogram::FixedBucketHistogram> latency_;

    std::vector<std::unique_ptr<client::BackendClient>> clients_;
    std::vector<std::thread> workers_;
    std::chrono::steady_clock::time_point run_start_;

    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    std::condition_variable exit_cv_;
    bool started_ = false;
    bool stopping_ = false;
    int live_workers_ = 0;

    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> skipped_{0};
};

} // namespace executor
} // namespace querygen
