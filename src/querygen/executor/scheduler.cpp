#include "querygen/executor/scheduler.h"
#include "querygen/common/logger.h"

#include <spdlog/fmt/fmt.h>

namespace querygen {
namespace executor {

namespace {

std::vector<std::string> QueryNames(const core::GeneratorConfig& config) {
    std::vector<std::string> names;
    names.reserve(config.queries.size());
    for (const auto& query : config.queries) {
        names.push_back(query.name);
    }
    return names;
}

} // namespace

Scheduler::Scheduler(const core::GeneratorConfig& config,
                     client::ClientFactory client_factory,
                     std::shared_ptr<metrics::MetricsSink> sink)
    : registry_(config.time_buckets),
      plan_(config.execution_plan, QueryNames(config), registry_) {
    for (const auto& bucket : registry_.buckets()) {
        QUERYGEN_INFO("Time bucket {}", bucket.to_string());
    }
    QUERYGEN_INFO("Execution plan: {} entries across {} queries, ineligible buckets: {}",
                  plan_.size(), config.queries.size(),
                  core::ToString(config.query.ineligible_policy));

    for (const auto& query : config.queries) {
        ExecutorOptions options;
        options.query_name = query.name;
        options.expression = query.expression;
        options.concurrency = config.EffectiveConcurrency(query);
        options.target_qps = config.EffectiveTargetQps(query);
        options.limit = config.query.limit;
        options.startup_stagger = config.query.startup_stagger;
        options.window_jitter = config.query.window_jitter;
        options.ineligible_policy = config.query.ineligible_policy;

        executors_.push_back(std::make_unique<QueryExecutor>(
            std::move(options), registry_, plan_.EntriesFor(query.name), client_factory, sink));
    }
}

Scheduler::~Scheduler() {
    Stop();
}

void Scheduler::Start() {
    if (running_) {
        return;
    }
    const auto run_start = std::chrono::steady_clock::now();
    running_ = true;
    try {
        for (auto& executor : executors_) {
            executor->Start(run_start);
        }
    } catch (const std::exception&) {
        Stop();
        throw;
    }
    QUERYGEN_INFO("Query load generator started with {} query executors", executors_.size());
}

void Scheduler::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    for (auto& executor : executors_) {
        executor->Stop();
    }
    QUERYGEN_INFO("Run summary:\n{}", Summary());
}

std::string Scheduler::Summary() const {
    std::string summary;
    for (const auto& executor : executors_) {
        const auto stats = executor->stats();
        const auto& latency = executor->latency();
        summary += fmt::format(
            "  {}: dispatched={} succeeded={} failed={} skipped={} p50={:.3f}s p99={:.3f}s\n",
            executor->options().query_name, stats.dispatched, stats.succeeded, stats.failed,
            stats.skipped, latency.quantile(0.5), latency.quantile(0.99));
    }
    return summary;
}

} // namespace executor
} // namespace querygen
