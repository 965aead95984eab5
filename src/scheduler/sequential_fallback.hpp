/**
 * @file sequential_fallback.hpp
 * @brief One-task-at-a-time replay used when concurrent orchestration faults.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "executor/invoker.hpp"
#include "scheduler/result_aggregator.hpp"
#include "task/task_descriptor.hpp"
#include "telemetry/metrics_collector.hpp"

#include <string_view>
#include <vector>

namespace tier_gate {

/**
 * @brief Reproduces the TierScheduler verdict without any concurrency.
 *
 * Tasks run strictly one after another in tier precedence, then input
 * order. The first Block in a gating tier ends the run; Blocks in
 * non-gating tiers are recorded and the run continues. The RunSummary has
 * the same shape as the concurrent path.
 *
 * This path does not catch: an exception escaping the invoker here is a
 * failure of the last resort and propagates to the caller.
 */
class SequentialFallback {
public:
    SequentialFallback(IInvoker& invoker, Logger& logger, MetricsCollector& metrics);

    [[nodiscard]] RunSummary run(const std::vector<TaskDescriptor>& tasks,
                                 std::string_view input,
                                 bool verbose = false) const;

    /**
     * @brief Execution order of the replay.
     *
     * Descriptors holding an unrecognized tier value are ordered, and
     * reported, as medium.
     */
    [[nodiscard]] static std::vector<TaskDescriptor> flatten(const std::vector<TaskDescriptor>& tasks);

private:
    IInvoker& invoker_;
    Logger& logger_;
    MetricsCollector& metrics_;
};

}  // namespace tier_gate
