/**
 * @file result_aggregator.cpp
 * @brief ResultAggregator: totals, efficiency and per-tier breakdown.
 * @author Dimitris Kafetzis
 */

#include "scheduler/result_aggregator.hpp"

#include <algorithm>

namespace tier_gate {

bool RunSummary::has_malfunction() const noexcept {
    return std::any_of(results.begin(), results.end(),
                       [](const ExecutionResult& r) { return is_malfunction(r.outcome); });
}

RunSummary aggregate(std::vector<ExecutionResult> results) {
    RunSummary summary;

    for (const auto& result : results) {
        summary.total_duration += result.duration;
        summary.max_duration = std::max(summary.max_duration, result.duration);

        // Results always come from classified descriptors, but an out-of-range
        // tier must not index past the table.
        auto& tier = summary.by_tier[is_known_tier(result.tier)
                                         ? tier_index(result.tier)
                                         : tier_index(Tier::Medium)];
        tier.total_duration += result.duration;
        tier.max_duration = std::max(tier.max_duration, result.duration);

        switch (result.outcome) {
            case Outcome::Allow:   ++tier.allow; break;
            case Outcome::Block:   ++tier.block; summary.blocked = true; break;
            case Outcome::Fail:    ++tier.fail; break;
            case Outcome::Timeout: ++tier.timeout; break;
        }
    }

    summary.success = !summary.blocked;
    summary.parallel_efficiency = summary.max_duration.count() > 0
        ? static_cast<double>(summary.total_duration.count())
              / static_cast<double>(summary.max_duration.count())
        : 1.0;
    summary.results = std::move(results);
    return summary;
}

PerformanceStats performance_stats(const RunSummary& summary) {
    PerformanceStats stats;
    stats.total_tasks = summary.results.size();

    size_t succeeded = 0;
    for (auto tier : kTierOrder) {
        const auto& source = summary.by_tier[tier_index(tier)];
        auto& perf = stats.by_tier[tier_index(tier)];
        perf.count = source.count();
        perf.duration = source.total_duration;
        perf.succeeded = source.allow;
        perf.efficiency = source.efficiency();
        succeeded += source.allow;
    }

    if (stats.total_tasks > 0) {
        auto total = static_cast<double>(stats.total_tasks);
        stats.average_duration_ms = static_cast<double>(summary.total_duration.count()) / total;
        stats.success_rate_percent = 100.0 * static_cast<double>(succeeded) / total;
    }
    return stats;
}

}  // namespace tier_gate
