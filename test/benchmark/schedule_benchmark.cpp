#include <benchmark/benchmark.h>
#include "querygen/executor/query_executor.h"
#include "querygen/metrics/prometheus_sink.h"
#include "querygen/schedule/execution_plan.h"
#include "querygen/schedule/rate_limiter.h"
#include "querygen/schedule/time_bucket_registry.h"
#include <memory>
#include <mutex>
#include <random>

using namespace querygen;

namespace {

std::vector<core::TimeBucket> MakeBuckets() {
    std::vector<core::TimeBucket> buckets;
    const std::pair<int, int> ages[] = {{0, 60}, {60, 300}, {300, 900}, {900, 3600}};
    int i = 0;
    for (const auto& age : ages) {
        core::TimeBucket bucket;
        bucket.name = "bucket" + std::to_string(i++);
        bucket.age_min = std::chrono::seconds(age.first);
        bucket.age_max = std::chrono::seconds(age.second);
        buckets.push_back(bucket);
    }
    return buckets;
}

std::vector<core::PlanEntry> MakeEntries(const std::string& query) {
    return {{query, "bucket0"}, {query, "bucket1"}, {query, "bucket2"},
            {query, "bucket3"}, {query, "immediate"}};
}

} // namespace

class ScheduleBenchmark : public benchmark::Fixture {
protected:
    static std::unique_ptr<schedule::TimeBucketRegistry> registry_;
    static std::unique_ptr<executor::QueryExecutor> executor_;
    static std::unique_ptr<schedule::PlanCycler> cycler_;
    static std::unique_ptr<schedule::RateLimiter> limiter_;
    static std::unique_ptr<metrics::PrometheusSink> sink_;
    static std::mutex mutex_;
    static int active_threads_;

    void SetUp(const ::benchmark::State&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_threads_ == 0) {
            registry_ = std::make_unique<schedule::TimeBucketRegistry>(MakeBuckets());
            cycler_ = std::make_unique<schedule::PlanCycler>(MakeEntries("bench"));
            limiter_ = std::make_unique<schedule::RateLimiter>(1e9, 1000);
            sink_ = std::make_unique<metrics::PrometheusSink>("bench-ns");

            executor::ExecutorOptions options;
            options.query_name = "bench";
            options.expression = "{ }";
            // Never started, so the factory is never called
            executor_ = std::make_unique<executor::QueryExecutor>(
                options, *registry_, MakeEntries("bench"),
                []() -> std::unique_ptr<client::BackendClient> { return nullptr; },
                std::make_shared<metrics::NullSink>());
        }
        active_threads_++;
    }

    void TearDown(const ::benchmark::State&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        active_threads_--;
        if (active_threads_ == 0) {
            executor_.reset();
            cycler_.reset();
            limiter_.reset();
            sink_.reset();
            registry_.reset();
        }
    }
};

std::unique_ptr<schedule::TimeBucketRegistry> ScheduleBenchmark::registry_;
std::unique_ptr<executor::QueryExecutor> ScheduleBenchmark::executor_;
std::unique_ptr<schedule::PlanCycler> ScheduleBenchmark::cycler_;
std::unique_ptr<schedule::RateLimiter> ScheduleBenchmark::limiter_;
std::unique_ptr<metrics::PrometheusSink> ScheduleBenchmark::sink_;
std::mutex ScheduleBenchmark::mutex_;
int ScheduleBenchmark::active_threads_ = 0;

BENCHMARK_DEFINE_F(ScheduleBenchmark, PlanCyclerNext)(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(cycler_->Next());
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_DEFINE_F(ScheduleBenchmark, RateLimiterWait)(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(limiter_->Wait());
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_DEFINE_F(ScheduleBenchmark, PlanNext)(benchmark::State& state) {
    std::mt19937_64 rng(state.thread_index());
    const core::Duration elapsed = std::chrono::minutes(20);
    for (auto _ : state) {
        auto dispatch = executor_->PlanNext(core::Clock::now(), elapsed, rng);
        benchmark::DoNotOptimize(dispatch);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_DEFINE_F(ScheduleBenchmark, SinkRecord)(benchmark::State& state) {
    core::Outcome outcome;
    outcome.query_name = "bench";
    outcome.bucket_name = "bucket1";
    outcome.planned_bucket = "bucket1";
    outcome.success = true;
    outcome.status = 200;
    outcome.result_count = 42;
    outcome.latency = std::chrono::duration<double>(0.125);
    for (auto _ : state) {
        sink_->Record(outcome);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_REGISTER_F(ScheduleBenchmark, PlanCyclerNext)->Threads(1)->Threads(4)->Threads(8);
BENCHMARK_REGISTER_F(ScheduleBenchmark, RateLimiterWait)->Threads(1)->Threads(4)->Threads(8);
BENCHMARK_REGISTER_F(ScheduleBenchmark, PlanNext)->Threads(1)->Threads(4)->Threads(8);
BENCHMARK_REGISTER_F(ScheduleBenchmark, SinkRecord)->Threads(1)->Threads(4)->Threads(8);

static void BM_RegistryRender(benchmark::State& state) {
    metrics::PrometheusSink sink("bench");
    core::Outcome outcome;
    outcome.success = true;
    outcome.status = 200;
    outcome.result_count = 10;
    for (int q = 0; q < state.range(0); ++q) {
        outcome.query_name = "query" + std::to_string(q);
        outcome.bucket_name = "recent";
        sink.Record(outcome);
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(sink.registry().Render());
    }
}
BENCHMARK(BM_RegistryRender)->Arg(1)->Arg(16)->Arg(128);

int main(int argc, char** argv) {
    ::benchmark::Initialize(&argc, argv);
    ::benchmark::RunSpecifiedBenchmarks();
}
