#include "querygen/metrics/prometheus_sink.h"
#include "querygen/common/logger.h"

namespace querygen {
namespace metrics {

namespace {

std::string NamespaceSuffix(const std::string& namespace_name) {
    std::string suffix = namespace_name;
    for (char& c : suffix) {
        if (c == '-') c = '_';
    }
    return SanitizeMetricName(suffix);
}

} // namespace

const std::vector<core::Value>& PrometheusSink::SpanCountBounds() {
    static const std::vector<core::Value> bounds = {0, 10, 50, 100, 250, 500, 1000, 2500, 5000};
    return bounds;
}

PrometheusSink::PrometheusSink(const std::string& namespace_name,
                               std::shared_ptr<Registry> registry)
    : registry_(std::move(registry)),
      latency_(registry_->AddHistogram(
          "query_load_test_" + NamespaceSuffix(namespace_name),
          "Query latency in seconds for " + namespace_name,
          {"name"}, histogram::FixedBucketHistogram::DefaultBounds())),
      failures_(registry_->AddCounter(
          "query_failures_count_" + NamespaceSuffix(namespace_name),
          "Failed queries for " + namespace_name, {"name"})),
      bucket_queries_(registry_->AddCounter(
          "query_load_test_time_bucket_queries_total",
          "Queries issued per time bucket", {"bucket", "query_name"})),
      bucket_duration_(registry_->AddHistogram(
          "query_load_test_time_bucket_duration_seconds",
          "Query latency in seconds per time bucket", {"bucket", "query_name"},
          histogram::FixedBucketHistogram::DefaultBounds())),
      spans_returned_(registry_->AddHistogram(
          "query_load_test_spans_returned_" + NamespaceSuffix(namespace_name),
          "Spans returned per successful query for " + namespace_name,
          {"name"}, SpanCountBounds())),
      skipped_(registry_->AddCounter(
          "query_load_test_skipped_dispatches_total",
          "Dispatches skipped because the planned bucket was not yet eligible",
          {"query_name"})) {}

void PrometheusSink::Record(const core::Outcome& outcome) {
    try {
        if (outcome.skipped) {
            skipped_.Inc({outcome.query_name});
            return;
        }

        bucket_queries_.Inc({outcome.bucket_name, outcome.query_name});

        if (outcome.responded()) {
            double seconds = outcome.latency.count();
            latency_.Observe({outcome.query_name}, seconds);
            bucket_duration_.Observe({outcome.bucket_name, outcome.query_name}, seconds);
        }

        if (!outcome.success) {
            failures_.Inc({outcome.query_name});
            return;
        }

        spans_returned_.Observe({outcome.query_name},
                                static_cast<core::Value>(outcome.result_count.value_or(0)));
    } catch (const std::exception& e) {
        QUERYGEN_ERROR("Failed to record metrics for query '{}': {}", outcome.query_name, e.what());
    }
}

} // namespace metrics
} // namespace querygen
