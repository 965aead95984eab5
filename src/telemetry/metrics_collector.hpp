/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/invoker.hpp"
#include "scheduler/result_aggregator.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace tier_gate {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Safe to share between concurrent runs; each event is one line.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_task_settled(const ExecutionResult& result);
    void record_tier_settled(Tier tier, size_t task_count, bool halted);
    void record_fallback(std::string_view reason);
    void record_run(const RunSummary& summary);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace tier_gate
