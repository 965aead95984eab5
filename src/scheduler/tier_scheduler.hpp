/**
 * @file tier_scheduler.hpp
 * @brief Tiered concurrent execution with fail-fast on gating tiers.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "executor/invoker.hpp"
#include "executor/thread_pool.hpp"
#include "scheduler/result_aggregator.hpp"
#include "task/task_descriptor.hpp"
#include "telemetry/metrics_collector.hpp"

#include <array>
#include <string_view>
#include <vector>

namespace tier_gate {

/// One bucket per tier, indexed by tier_index(), intra-tier order preserved.
using TierGroups = std::array<std::vector<TaskDescriptor>, kTierCount>;

/**
 * @brief Runs tiers one after another, every task of a tier concurrently.
 *
 * Each tier ends at a settle-all barrier. A Block in a gating tier stops
 * all tiers that have not started; siblings already running in that tier
 * finish and are recorded. The scheduler keeps no state between runs, so
 * one instance may serve concurrent runs.
 *
 * Faults in the scheduler's own bookkeeping are raised as
 * OrchestrationFault, always after every in-flight task has settled.
 */
class TierScheduler {
public:
    TierScheduler(IInvoker& invoker,
                  ThreadPool& pool,
                  Logger& logger,
                  MetricsCollector& metrics);

    [[nodiscard]] RunSummary run(const std::vector<TaskDescriptor>& tasks,
                                 std::string_view input,
                                 bool verbose = false) const;

    /**
     * @brief Split tasks into tier buckets.
     * @throws OrchestrationFault for a descriptor holding no known tier.
     */
    [[nodiscard]] static TierGroups partition(const std::vector<TaskDescriptor>& tasks);

private:
    std::vector<ExecutionResult> run_tier(Tier tier,
                                          const std::vector<TaskDescriptor>& group,
                                          std::string_view input,
                                          LogLevel progress) const;

    IInvoker& invoker_;
    ThreadPool& pool_;
    Logger& logger_;
    MetricsCollector& metrics_;
};

}  // namespace tier_gate
