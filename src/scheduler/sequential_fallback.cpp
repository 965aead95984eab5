/**
 * @file sequential_fallback.cpp
 * @brief SequentialFallback implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/sequential_fallback.hpp"

#include <algorithm>

namespace tier_gate {

SequentialFallback::SequentialFallback(IInvoker& invoker, Logger& logger, MetricsCollector& metrics)
    : invoker_(invoker), logger_(logger), metrics_(metrics) {}

std::vector<TaskDescriptor> SequentialFallback::flatten(const std::vector<TaskDescriptor>& tasks) {
    std::vector<TaskDescriptor> ordered = tasks;
    for (auto& task : ordered) {
        if (!is_known_tier(task.tier)) task.tier = Tier::Medium;
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const TaskDescriptor& a, const TaskDescriptor& b) {
                         return tier_index(a.tier) < tier_index(b.tier);
                     });
    return ordered;
}

RunSummary SequentialFallback::run(const std::vector<TaskDescriptor>& tasks,
                                   std::string_view input,
                                   bool verbose) const {
    const auto progress = verbose ? LogLevel::Info : LogLevel::Debug;
    auto ordered = flatten(tasks);

    logger_.log(progress, "Running " + std::to_string(ordered.size()) + " task(s) sequentially");

    std::vector<ExecutionResult> results;
    results.reserve(ordered.size());

    for (const auto& task : ordered) {
        auto result = invoker_.invoke(task, input);
        metrics_.record_task_settled(result);
        logger_.log(progress, "Task " + result.task_id + " settled: "
                    + std::string{to_string(result.outcome)} + " in "
                    + std::to_string(result.duration.count()) + "ms");

        bool halt = result.outcome == Outcome::Block && is_gating(task.tier);
        results.push_back(std::move(result));

        if (halt) {
            logger_.log(progress, std::string{to_string(task.tier)}
                        + " tier task blocked, skipping remaining tasks");
            break;
        }
    }

    return aggregate(std::move(results));
}

}  // namespace tier_gate
