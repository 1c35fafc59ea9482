#include "querygen/executor/query_executor.h"
#include "querygen/client/search_response.h"
#include "querygen/common/logger.h"
#include "querygen/core/duration.h"
#include "querygen/core/error.h"

namespace querygen {
namespace executor {

namespace {

constexpr auto kCancelRetryInterval = std::chrono::milliseconds(100);

ExecutorOptions Validated(ExecutorOptions options) {
    if (options.query_name.empty()) {
        throw core::InvalidArgumentError("Query name must not be empty");
    }
    if (options.concurrency < 1) {
        throw core::InvalidArgumentError(
            "Query '" + options.query_name + "': concurrency must be >= 1, got: " +
            std::to_string(options.concurrency));
    }
    if (!(options.target_qps > 0.0)) {
        throw core::InvalidArgumentError(
            "Query '" + options.query_name + "': targetQPS must be > 0, got: " +
            std::to_string(options.target_qps));
    }
    if (options.limit == 0) {
        throw core::InvalidArgumentError(
            "Query '" + options.query_name + "': limit must be >= 1");
    }
    if (options.startup_stagger < core::Duration(0)) {
        throw core::InvalidArgumentError(
            "Query '" + options.query_name + "': startup stagger must not be negative");
    }
    if (options.window_jitter < 0.0 || options.window_jitter > 1.0) {
        throw core::InvalidArgumentError(
            "Query '" + options.query_name + "': window jitter must be within [0, 1]");
    }
    return options;
}

std::string WorkerPrefix(const std::string& query_name, int worker_id) {
    return "[" + query_name + "/worker-" + std::to_string(worker_id) + "]";
}

} // namespace

QueryExecutor::QueryExecutor(ExecutorOptions options,
                             const schedule::TimeBucketRegistry& registry,
                             std::vector<core::PlanEntry> entries,
                             client::ClientFactory client_factory,
                             std::shared_ptr<metrics::MetricsSink> sink)
    : options_(Validated(std::move(options))),
      registry_(registry),
      cycler_(std::move(entries)),
      limiter_(options_.target_qps, 1),
      client_factory_(std::move(client_factory)),
      sink_(std::move(sink)),
      latency_(histogram::FixedBucketHistogram::create(
          histogram::FixedBucketHistogram::DefaultBounds())) {
    for (const auto& entry : cycler_.entries()) {
        if (entry.query_name != options_.query_name) {
            throw core::InvalidArgumentError(
                "Plan entry for query '" + entry.query_name +
                "' handed to executor of '" + options_.query_name + "'");
        }
        if (!registry_.Contains(entry.bucket_name)) {
            throw core::InvalidArgumentError(
                "Execution plan references undefined bucket: " + entry.bucket_name);
        }
    }
    if (!client_factory_) {
        throw core::InvalidArgumentError("Query '" + options_.query_name + "': no client factory");
    }
    if (!sink_) {
        throw core::InvalidArgumentError("Query '" + options_.query_name + "': no metrics sink");
    }
}

QueryExecutor::~QueryExecutor() {
    Stop();
}

void QueryExecutor::Start(std::chrono::steady_clock::time_point run_start) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            throw core::InternalError("Executor for '" + options_.query_name + "' already started");
        }
        started_ = true;
    }

    run_start_ = run_start;
    for (int i = 0; i < options_.concurrency; ++i) {
        auto client = client_factory_();
        if (!client) {
            throw core::InternalError("Client factory returned no client for '" +
                                      options_.query_name + "'");
        }
        clients_.push_back(std::move(client));
    }

    QUERYGEN_INFO("Starting {} workers for query '{}' at {:.3f} QPS ({} plan entries)",
                  options_.concurrency, options_.query_name, options_.target_qps,
                  cycler_.length());

    std::lock_guard<std::mutex> lock(mutex_);
    live_workers_ = options_.concurrency;
    for (int i = 0; i < options_.concurrency; ++i) {
        workers_.emplace_back([this, i]() { WorkerLoop(i, *clients_[i]); });
    }
}

void QueryExecutor::Stop() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!started_ || stopping_) {
        return;
    }
    stopping_ = true;
    lock.unlock();

    stop_cv_.notify_all();
    limiter_.Cancel();

    // A cancel can land between two requests and miss the next one, so keep
    // issuing it until every worker has left its loop.
    lock.lock();
    while (live_workers_ > 0) {
        lock.unlock();
        for (auto& client : clients_) {
            client->Cancel();
        }
        lock.lock();
        exit_cv_.wait_for(lock, kCancelRetryInterval, [this] { return live_workers_ == 0; });
    }
    lock.unlock();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    QUERYGEN_INFO("Stopped workers for query '{}'", options_.query_name);
}

bool QueryExecutor::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ && !stopping_;
}

Dispatch QueryExecutor::PlanNext(core::TimePoint now, core::Duration elapsed,
                                 std::mt19937_64& rng) {
    const auto step = cycler_.Next();

    Dispatch dispatch;
    dispatch.sequence = step.sequence;
    dispatch.planned_bucket = step.entry->bucket_name;
    dispatch.bucket_name = step.entry->bucket_name;

    if (schedule::TimeBucketRegistry::IsImmediate(dispatch.planned_bucket)) {
        return dispatch;
    }

    const core::TimeBucket* bucket = registry_.Find(dispatch.planned_bucket);
    if (!bucket) {
        throw core::NotFoundError("Unknown time bucket: " + dispatch.planned_bucket);
    }

    if (!schedule::TimeBucketRegistry::IsEligible(*bucket, elapsed)) {
        if (options_.ineligible_policy == core::IneligiblePolicy::SKIP) {
            dispatch.skip = true;
        } else {
            dispatch.bucket_name = core::kImmediateBucket;
        }
        return dispatch;
    }

    double fraction = 0.0;
    if (options_.window_jitter > 0.0) {
        std::uniform_real_distribution<double> jitter(0.0, options_.window_jitter);
        fraction = jitter(rng);
    }
    dispatch.range = schedule::TimeBucketRegistry::ResolveWindow(*bucket, now, fraction);
    return dispatch;
}

core::Outcome QueryExecutor::Execute(client::BackendClient& client, const Dispatch& dispatch,
                                     const std::string& log_prefix) {
    core::Outcome outcome;
    outcome.query_name = options_.query_name;
    outcome.bucket_name = dispatch.bucket_name;
    outcome.planned_bucket = dispatch.planned_bucket;
    outcome.sequence = dispatch.sequence;

    if (dispatch.skip) {
        outcome.skipped = true;
        QUERYGEN_DEBUG("{} [{}] {} skipped, bucket not yet eligible",
                       log_prefix, dispatch.planned_bucket, options_.query_name);
        return outcome;
    }

    client::SearchRequest request;
    request.expression = options_.expression;
    request.range = dispatch.range;
    request.limit = options_.limit;

    const auto started = std::chrono::steady_clock::now();
    auto result = client.Search(request);
    outcome.latency = std::chrono::steady_clock::now() - started;

    if (!result.ok()) {
        QUERYGEN_WARN("{} {}", log_prefix, result.error());
        QUERYGEN_WARN("{} Full request details:\n{}", log_prefix, client.Describe(request));
        return outcome;
    }

    const auto& response = result.value();
    outcome.status = response.status;

    if (!response.ok()) {
        QUERYGEN_WARN("{} Query failed [{}]: status: {}", log_prefix, dispatch.bucket_name,
                      response.status);
        QUERYGEN_WARN("{} Full request details:\n{}", log_prefix, client.Describe(request));
        QUERYGEN_WARN("{} Response body:\n{}", log_prefix, response.body);
        return outcome;
    }

    outcome.success = true;
    auto spans = client::CountSpans(response.body);
    if (spans.ok()) {
        outcome.result_count = spans.value();
    } else {
        QUERYGEN_WARN("{} {}", log_prefix, spans.error());
        outcome.result_count = 0;
    }

    if (dispatch.range) {
        QUERYGEN_DEBUG("{} [{}] {} took {:.3f} seconds --> status: {}, spans: {}, timeRange: {} to {}",
                       log_prefix, dispatch.bucket_name, options_.query_name,
                       outcome.latency.count(), outcome.status, *outcome.result_count,
                       dispatch.range->start_seconds(), dispatch.range->end_seconds());
    } else {
        QUERYGEN_DEBUG("{} [{}] {} took {:.3f} seconds --> status: {}, spans: {} (no time range)",
                       log_prefix, dispatch.bucket_name, options_.query_name,
                       outcome.latency.count(), outcome.status, *outcome.result_count);
    }
    return outcome;
}

ExecutorStats QueryExecutor::stats() const {
    ExecutorStats snapshot;
    snapshot.dispatched = dispatched_.load();
    snapshot.succeeded = succeeded_.load();
    snapshot.failed = failed_.load();
    snapshot.skipped = skipped_.load();
    return snapshot;
}

bool QueryExecutor::SleepFor(core::Duration duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !stop_cv_.wait_for(lock, duration, [this] { return stopping_; });
}

void QueryExecutor::RecordOutcome(const core::Outcome& outcome) {
    if (outcome.skipped) {
        skipped_++;
    } else {
        dispatched_++;
        if (outcome.success) {
            succeeded_++;
        } else {
            failed_++;
        }
        if (outcome.responded()) {
            latency_->add(outcome.latency.count());
        }
    }
    sink_->Record(outcome);
}

void QueryExecutor::WorkerLoop(int worker_id, client::BackendClient& client) {
    const std::string prefix = WorkerPrefix(options_.query_name, worker_id);
    std::mt19937_64 rng(std::random_device{}() + static_cast<uint64_t>(worker_id));

    if (options_.startup_stagger > core::Duration(0)) {
        std::uniform_int_distribution<int64_t> stagger(0, options_.startup_stagger.count() - 1);
        core::Duration delay(stagger(rng));
        QUERYGEN_DEBUG("{} starting after {}", prefix, core::FormatDuration(delay));
        SleepFor(delay);
    }

    while (limiter_.Wait()) {
        try {
            const auto elapsed = std::chrono::duration_cast<core::Duration>(
                std::chrono::steady_clock::now() - run_start_);
            Dispatch dispatch = PlanNext(core::Clock::now(), elapsed, rng);
            core::Outcome outcome = Execute(client, dispatch, prefix);

            if (!outcome.success && !outcome.responded() && !IsRunning()) {
                // Request aborted by Stop(); not a backend failure
                break;
            }
            RecordOutcome(outcome);
        } catch (const std::exception& e) {
            QUERYGEN_ERROR("{} dispatch failed: {}", prefix, e.what());
        }
    }

    QUERYGEN_DEBUG("{} exiting", prefix);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live_workers_--;
    }
    exit_cv_.notify_all();
}

} // namespace executor
} // namespace querygen
