/**
 * @file result_aggregator.hpp
 * @brief Folds per-task results into a RunSummary.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "executor/invoker.hpp"

#include <array>
#include <vector>

namespace tier_gate {

/**
 * @brief Outcome counts and timing for one tier of a run.
 */
struct TierStats {
    size_t allow = 0;
    size_t block = 0;
    size_t fail = 0;
    size_t timeout = 0;
    Millis total_duration{0};
    Millis max_duration{0};

    [[nodiscard]] size_t count() const noexcept { return allow + block + fail + timeout; }

    /// Summed duration over the longest one; 1 when nothing ran or took time.
    [[nodiscard]] double efficiency() const noexcept {
        if (max_duration.count() <= 0) return 1.0;
        return static_cast<double>(total_duration.count())
             / static_cast<double>(max_duration.count());
    }
};

/**
 * @brief The engine's sole return value. Created fresh per run.
 *
 * success and blocked are complementary: any Block, gating or not, marks
 * the run blocked. Fail/Timeout results never affect either flag.
 */
struct RunSummary {
    bool success = true;
    bool blocked = false;
    std::vector<ExecutionResult> results;
    Millis total_duration{0};
    Millis max_duration{0};
    double parallel_efficiency = 1.0;
    std::array<TierStats, kTierCount> by_tier{};

    [[nodiscard]] bool has_malfunction() const noexcept;
};

/**
 * @brief Pure fold over a list of results. No side effects, no I/O.
 */
[[nodiscard]] RunSummary aggregate(std::vector<ExecutionResult> results);

// ─────────────────────────────────────────────
// Performance statistics
// ─────────────────────────────────────────────

struct TierPerformance {
    size_t count = 0;
    Millis duration{0};
    size_t succeeded = 0;               ///< Allow outcomes
    double efficiency = 1.0;
};

struct PerformanceStats {
    size_t total_tasks = 0;
    double average_duration_ms = 0.0;
    double success_rate_percent = 0.0;
    std::array<TierPerformance, kTierCount> by_tier{};
};

/**
 * @brief Derived diagnostics for operators; empty runs report zeros.
 */
[[nodiscard]] PerformanceStats performance_stats(const RunSummary& summary);

}  // namespace tier_gate
