#include "querygen/schedule/execution_plan.h"
#include "querygen/common/logger.h"
#include "querygen/core/error.h"

namespace querygen {
namespace schedule {

ExecutionPlan::ExecutionPlan(const std::vector<core::PlanEntry>& entries,
                             const std::vector<std::string>& query_names,
                             const TimeBucketRegistry& registry)
    : query_names_(query_names) {
    if (entries.empty()) {
        throw core::InvalidArgumentError("No executionPlan defined in configuration");
    }

    for (const auto& name : query_names_) {
        if (!by_query_.emplace(name, std::vector<core::PlanEntry>{}).second) {
            throw core::InvalidArgumentError("Duplicate query name '" + name + "'");
        }
    }

    for (const auto& entry : entries) {
        auto it = by_query_.find(entry.query_name);
        if (it == by_query_.end()) {
            throw core::InvalidArgumentError(
                "Execution plan references undefined query: " + entry.query_name);
        }
        if (!registry.Contains(entry.bucket_name)) {
            throw core::InvalidArgumentError(
                "Execution plan entry for query '" + entry.query_name +
                "' references undefined time bucket: " + entry.bucket_name);
        }
        it->second.push_back(entry);
        ++total_entries_;
    }

    for (const auto& name : query_names_) {
        if (by_query_[name].empty()) {
            throw core::InvalidArgumentError(
                "Query '" + name + "' has no entries in the execution plan");
        }
    }
}

const std::vector<core::PlanEntry>& ExecutionPlan::EntriesFor(const std::string& query_name) const {
    auto it = by_query_.find(query_name);
    if (it == by_query_.end()) {
        throw core::NotFoundError("Query '" + query_name + "' is not part of the execution plan");
    }
    return it->second;
}

PlanCycler::PlanCycler(std::vector<core::PlanEntry> entries)
    : entries_(std::move(entries)) {
    if (entries_.empty()) {
        throw core::InvalidArgumentError("Plan cycler requires at least one entry");
    }
}

PlanStep PlanCycler::Next() {
    PlanStep step;
    step.sequence = cursor_.fetch_add(1, std::memory_order_relaxed);
    step.index = static_cast<size_t>(step.sequence % entries_.size());
    step.entry = &entries_[step.index];

    if (step.sequence > 0 && step.index == 0) {
        QUERYGEN_DEBUG("Query '{}': cycled through all {} plan entries, repeating from start (cycle: {})",
                       step.entry->query_name, entries_.size(), step.sequence / entries_.size());
    }
    return step;
}

} // namespace schedule
} // namespace querygen
