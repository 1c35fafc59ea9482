#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "querygen/core/types.h"
#include "querygen/schedule/time_bucket_registry.h"

namespace querygen {
namespace schedule {

/**
 * @brief Process-wide execution plan, partitioned per query
 *
 * Immutable after construction. Every declared query owns a non-empty,
 * order-preserving sub-list of the configured entries.
 */
class ExecutionPlan {
public:
    /**
     * @throws core::InvalidArgumentError if the plan is empty, an entry names
     *         an undefined query or bucket, or a declared query has no entries
     */
    ExecutionPlan(const std::vector<core::PlanEntry>& entries,
                  const std::vector<std::string>& query_names,
                  const TimeBucketRegistry& registry);

    /**
     * @throws core::NotFoundError for an undeclared query
     */
    const std::vector<core::PlanEntry>& EntriesFor(const std::string& query_name) const;

    size_t size() const { return total_entries_; }
    const std::vector<std::string>& query_names() const { return query_names_; }

private:
    std::vector<std::string> query_names_;
    std::unordered_map<std::string, std::vector<core::PlanEntry>> by_query_;
    size_t total_entries_ = 0;
};

/**
 * @brief One step of a query's infinite plan sequence
 */
struct PlanStep {
    uint64_t sequence = 0;      // cursor value consumed by this step
    size_t index = 0;           // sequence mod plan length
    const core::PlanEntry* entry = nullptr;
};

/**
 * @brief Infinite, restartable view of one query's plan entries
 *
 * Owns the query's cursor. Next() is safe to call from any number of
 * workers; every call observes a distinct cursor value and no value is
 * skipped.
 */
class PlanCycler {
public:
    /**
     * @throws core::InvalidArgumentError if entries is empty
     */
    explicit PlanCycler(std::vector<core::PlanEntry> entries);

    PlanCycler(const PlanCycler&) = delete;
    PlanCycler& operator=(const PlanCycler&) = delete;

    PlanStep Next();

    uint64_t cursor() const { return cursor_.load(std::memory_order_relaxed); }
    size_t length() const { return entries_.size(); }
    const std::vector<core::PlanEntry>& entries() const { return entries_; }

private:
    const std::vector<core::PlanEntry> entries_;
    std::atomic<uint64_t> cursor_{0};
};

} // namespace schedule
} // namespace querygen
