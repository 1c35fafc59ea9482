#pragma once

#include <memory>
#include <string>
#include <vector>

#include "querygen/client/backend_client.h"
#include "querygen/core/config.h"
#include "querygen/executor/query_executor.h"
#include "querygen/metrics/metrics_sink.h"
#include "querygen/schedule/execution_plan.h"
#include "querygen/schedule/time_bucket_registry.h"

namespace querygen {
namespace executor {

/**
 * @brief Builds and owns every executor of a run
 *
 * All structural validation happens in the constructor; a Scheduler that
 * was constructed successfully can always be started.
 */
class Scheduler {
public:
    /**
     * @throws core::InvalidArgumentError for any invalid bucket, plan entry
     *         or query template, before any client is created
     */
    Scheduler(const core::GeneratorConfig& config,
              client::ClientFactory client_factory,
              std::shared_ptr<metrics::MetricsSink> sink);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void Start();

    /**
     * @brief Stop every executor and log the per-query summary
     */
    void Stop();

    bool IsRunning() const { return running_; }

    /**
     * @brief One line per query: dispatches, failures, skips, p50/p99
     */
    std::string Summary() const;

    const std::vector<std::unique_ptr<QueryExecutor>>& executors() const { return executors_; }
    const schedule::TimeBucketRegistry& registry() const { return registry_; }
    const schedule::ExecutionPlan& plan() const { return plan_; }

private:
    schedule::TimeBucketRegistry registry_;
    schedule::ExecutionPlan plan_;
    std::vector<std::unique_ptr<QueryExecutor>> executors_;
    bool running_ = false;
};

} // namespace executor
} // namespace querygen
