#pragma once

#include <memory>
#include <string>
#include <vector>

#include "querygen/metrics/metrics_sink.h"
#include "querygen/metrics/registry.h"

namespace querygen {
namespace metrics {

/**
 * @brief MetricsSink that feeds the load-test metric families
 *
 * Per-namespace families are suffixed with the namespace, '-' mapped to
 * '_', so dashboards built for one test namespace keep working.
 */
class PrometheusSink : public MetricsSink {
public:
    explicit PrometheusSink(const std::string& namespace_name,
                            std::shared_ptr<Registry> registry = std::make_shared<Registry>());

    void Record(const core::Outcome& outcome) override;

    Registry& registry() { return *registry_; }
    std::shared_ptr<Registry> shared_registry() const { return registry_; }

    const CounterFamily& failures() const { return failures_; }
    const CounterFamily& bucket_queries() const { return bucket_queries_; }
    const CounterFamily& skipped() const { return skipped_; }
    const HistogramFamily& latency() const { return latency_; }
    const HistogramFamily& bucket_duration() const { return bucket_duration_; }
    const HistogramFamily& spans_returned() const { return spans_returned_; }

    static const std::vector<core::Value>& SpanCountBounds();

private:
    std::shared_ptr<Registry> registry_;
    HistogramFamily& latency_;
    CounterFamily& failures_;
    CounterFamily& bucket_queries_;
    HistogramFamily& bucket_duration_;
    HistogramFamily& spans_returned_;
    CounterFamily& skipped_;
};

} // namespace metrics
} // namespace querygen
