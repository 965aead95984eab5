/**
 * @file tier_scheduler.cpp
 * @brief TierScheduler: partition, per-tier settle-all join, short-circuit.
 * @author Dimitris Kafetzis
 *
 * Algorithm:
 *   groups = partition(tasks)                  // stable within a tier
 *   for tier in critical, high, medium, low, background:
 *     if groups[tier] empty: continue
 *     results += settle_all(invoke each task of the tier concurrently)
 *     if gating(tier) and any Block in this tier: stop
 *   return aggregate(results)
 */

#include "scheduler/tier_scheduler.hpp"

#include "executor/settle_all.hpp"

#include <algorithm>
#include <future>

namespace tier_gate {

TierScheduler::TierScheduler(IInvoker& invoker,
                             ThreadPool& pool,
                             Logger& logger,
                             MetricsCollector& metrics)
    : invoker_(invoker), pool_(pool), logger_(logger), metrics_(metrics) {}

TierGroups TierScheduler::partition(const std::vector<TaskDescriptor>& tasks) {
    TierGroups groups;
    for (const auto& task : tasks) {
        if (!is_known_tier(task.tier)) {
            throw OrchestrationFault("Task '" + task.id + "' carries unrecognized tier value "
                                     + std::to_string(static_cast<int>(task.tier)));
        }
        groups[tier_index(task.tier)].push_back(task);
    }
    return groups;
}

RunSummary TierScheduler::run(const std::vector<TaskDescriptor>& tasks,
                              std::string_view input,
                              bool verbose) const {
    const auto progress = verbose ? LogLevel::Info : LogLevel::Debug;
    auto groups = partition(tasks);

    std::vector<ExecutionResult> results;
    results.reserve(tasks.size());

    for (auto tier : kTierOrder) {
        const auto& group = groups[tier_index(tier)];
        if (group.empty()) continue;

        logger_.log(progress, "Executing " + std::to_string(group.size()) + " "
                    + std::string{to_string(tier)} + " tier task(s) concurrently");

        auto tier_results = run_tier(tier, group, input, progress);

        bool vetoed = std::any_of(tier_results.begin(), tier_results.end(),
                                  [](const ExecutionResult& r) { return r.outcome == Outcome::Block; });
        bool halt = vetoed && is_gating(tier);

        for (auto& result : tier_results) {
            results.push_back(std::move(result));
        }
        metrics_.record_tier_settled(tier, group.size(), halt);

        if (halt) {
            logger_.log(progress, std::string{to_string(tier)}
                        + " tier task blocked, skipping remaining tiers");
            break;
        }
        if (vetoed) {
            logger_.log(progress, std::string{to_string(tier)}
                        + " tier task blocked, tier is non-gating so execution continues");
        }
    }

    return aggregate(std::move(results));
}

std::vector<ExecutionResult> TierScheduler::run_tier(Tier tier,
                                                     const std::vector<TaskDescriptor>& group,
                                                     std::string_view input,
                                                     LogLevel progress) const {
    std::vector<std::future<ExecutionResult>> futures;
    futures.reserve(group.size());
    std::string fault;
    try {
        for (const auto& task : group) {
            futures.push_back(pool_.submit([this, &task, input] {
                return invoker_.invoke(task, input);
            }));
        }
    } catch (const std::exception& ex) {
        fault = std::string{"Could not schedule invocation: "} + ex.what();
    }

    // Every submitted future is joined before anything is raised: the
    // lambdas above reference this frame.
    auto settled = settle_all(futures);

    std::vector<ExecutionResult> results;
    results.reserve(settled.size());
    for (size_t i = 0; i < settled.size(); ++i) {
        if (settled[i].fulfilled()) {
            auto& result = *settled[i].value;
            logger_.log(progress, "Task " + result.task_id + " settled: "
                        + std::string{to_string(result.outcome)} + " in "
                        + std::to_string(result.duration.count()) + "ms");
            metrics_.record_task_settled(result);
            results.push_back(std::move(result));
            continue;
        }
        if (!fault.empty()) continue;
        try {
            std::rethrow_exception(settled[i].error);
        } catch (const std::exception& ex) {
            fault = "Invocation of '" + group[i].id + "' raised: " + ex.what();
        } catch (...) {
            fault = "Invocation of '" + group[i].id + "' raised a non-standard exception";
        }
    }

    if (!fault.empty()) {
        throw OrchestrationFault(std::string{to_string(tier)} + " tier: " + fault);
    }
    return results;
}

}  // namespace tier_gate
