/**
 * @file engine.cpp
 * @brief Engine implementation.
 * @author Dimitris Kafetzis
 */

#include "engine/engine.hpp"

#include "core/result.hpp"
#include "executor/process_invoker.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace tier_gate {

namespace {

std::unique_ptr<IInvoker> make_invoker(std::unique_ptr<IInvoker> supplied,
                                       const ExecutorConfig& config) {
    if (supplied) return supplied;
    return std::make_unique<ProcessInvoker>(config);
}

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

}  // anonymous namespace

Engine::Engine(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_null_sink(std::move(opts.log_sink)), opts.log_level)
    , metrics_(or_null_sink(std::move(opts.metrics_sink)))
    , invoker_(make_invoker(std::move(opts.invoker), config_.executor))
    , thread_pool_(config_.executor.thread_count)
    , scheduler_(*invoker_, thread_pool_, logger_, metrics_)
    , fallback_(*invoker_, logger_, metrics_) {
    logger_.debug("Engine ready: " + std::to_string(thread_pool_.thread_count())
                  + " worker threads");
}

RunOptions Engine::default_run_options() const {
    RunOptions options;
    options.fallback_to_sequential = config_.engine.fallback_to_sequential;
    options.verbose = config_.engine.verbose;
    if (config_.engine.timeout_ms > 0) {
        options.timeout = Millis{config_.engine.timeout_ms};
    }
    return options;
}

RunSummary Engine::execute(const std::vector<TaskDescriptor>& tasks,
                           const nlohmann::json& input,
                           const RunOptions& options) {
    // Serialized once; every validator of the run reads the same bytes.
    const std::string document =
        input.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const auto run_tasks = apply_timeout_cap(tasks, options.timeout);

    RunSummary summary;
    try {
        summary = scheduler_.run(run_tasks, document, options.verbose);
    } catch (const std::exception& ex) {
        if (!options.fallback_to_sequential) {
            logger_.error(std::string{"Concurrent execution failed: "} + ex.what());
            throw;
        }
        logger_.warn(std::string{"Concurrent execution failed, falling back to sequential: "}
                     + ex.what());
        metrics_.record_fallback(ex.what());
        summary = fallback_.run(run_tasks, document, options.verbose);
    }

    metrics_.record_run(summary);
    logger_.log(options.verbose ? LogLevel::Info : LogLevel::Debug,
                "Run complete: " + std::to_string(summary.results.size()) + " result(s), "
                + (summary.blocked ? "blocked" : "allowed") + ", "
                + std::to_string(summary.max_duration.count()) + "ms max");
    return summary;
}

RunSummary Engine::run_once(const std::vector<TaskDescriptor>& tasks,
                            const nlohmann::json& input,
                            const RunOptions& options) {
    Engine engine(Options{
        .config = default_config(),
        .log_sink = std::make_unique<StderrSink>(),
        .log_level = LogLevel::Warn,
        .invoker = nullptr,
        .metrics_sink = nullptr,
    });
    return engine.execute(tasks, input, options);
}

std::vector<TaskDescriptor> apply_timeout_cap(const std::vector<TaskDescriptor>& tasks,
                                              std::optional<Millis> cap) {
    std::vector<TaskDescriptor> capped = tasks;
    if (!cap || cap->count() <= 0) return capped;
    for (auto& task : capped) {
        task.timeout = task.timeout.count() > 0 ? std::min(task.timeout, *cap) : *cap;
    }
    return capped;
}

int exit_code_for(const RunSummary& summary) noexcept {
    if (summary.blocked) return 2;
    if (summary.has_malfunction()) return 1;
    return 0;
}

}  // namespace tier_gate
