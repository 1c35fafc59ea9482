#pragma once

#include "querygen/core/types.h"

namespace querygen {
namespace metrics {

/**
 * @brief Receives one Outcome per dispatch
 *
 * Called concurrently from every worker. Implementations must not throw and
 * must not block on I/O.
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void Record(const core::Outcome& outcome) = 0;
};

/**
 * @brief Sink that discards everything
 */
class NullSink : public MetricsSink {
public:
    void Record(const core::Outcome&) override {}
};

} // namespace metrics
} // namespace querygen
