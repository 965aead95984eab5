/**
 * @file engine.hpp
 * @brief Engine facade: ties classification, tiered execution and fallback together.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Running a set of classified validator tasks against one input document
 *   2. Falling back to sequential replay when concurrent orchestration faults
 *   3. Mapping a RunSummary to a process exit code
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/invoker.hpp"
#include "executor/thread_pool.hpp"
#include "scheduler/result_aggregator.hpp"
#include "scheduler/sequential_fallback.hpp"
#include "scheduler/tier_scheduler.hpp"
#include "task/task_descriptor.hpp"
#include "telemetry/metrics_collector.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace tier_gate {

/**
 * @brief Per-run options. Nothing here outlives the call.
 */
struct RunOptions {
    std::optional<Millis> timeout;      ///< Caps every task's timeout for this run
    bool fallback_to_sequential = true;
    bool verbose = false;
};

/**
 * @brief Long-lived engine owning the worker pool, invoker and telemetry.
 *
 * execute() keeps all run state on its own stack, so several threads may
 * call it on one Engine at the same time.
 */
class Engine {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<IInvoker> invoker;        ///< null = ProcessInvoker
        std::unique_ptr<ILogSink> metrics_sink;   ///< null = NullSink
    };

    explicit Engine(Options opts);

    // Non-copyable, non-movable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Run every task and return the aggregated verdict.
     *
     * @throws OrchestrationFault when the concurrent path faults and
     *         options.fallback_to_sequential is false.
     * @throws whatever the sequential fallback raises, if it fails too.
     */
    [[nodiscard]] RunSummary execute(const std::vector<TaskDescriptor>& tasks,
                                     const nlohmann::json& input,
                                     const RunOptions& options = {});

    /// Run options derived from the [engine] section of the configuration.
    [[nodiscard]] RunOptions default_run_options() const;

    /**
     * @brief One-shot run with a temporary engine, default configuration and
     *        the production invoker.
     */
    [[nodiscard]] static RunSummary run_once(const std::vector<TaskDescriptor>& tasks,
                                             const nlohmann::json& input,
                                             const RunOptions& options = {});

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }
    ThreadPool& pool() { return thread_pool_; }

private:
    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    std::unique_ptr<IInvoker> invoker_;
    ThreadPool thread_pool_;
    TierScheduler scheduler_;
    SequentialFallback fallback_;
};

/**
 * @brief Apply a per-run cap to every descriptor's timeout.
 */
[[nodiscard]] std::vector<TaskDescriptor> apply_timeout_cap(const std::vector<TaskDescriptor>& tasks,
                                                            std::optional<Millis> cap);

/**
 * @brief CLI exit status: 2 when blocked, 1 when any task failed or timed
 *        out, 0 otherwise.
 */
[[nodiscard]] int exit_code_for(const RunSummary& summary) noexcept;

}  // namespace tier_gate
