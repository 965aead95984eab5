/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <nlohmann/json.hpp>

namespace tier_gate {

namespace {

std::string dump(const nlohmann::json& event) {
    return event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_task_settled(const ExecutionResult& result) {
    emit(dump({
        {"event", "task_settled"},
        {"task", result.task_id},
        {"tier", std::string{to_string(result.tier)}},
        {"outcome", std::string{to_string(result.outcome)}},
        {"duration_ms", result.duration.count()},
    }));
}

void MetricsCollector::record_tier_settled(Tier tier, size_t task_count, bool halted) {
    emit(dump({
        {"event", "tier_settled"},
        {"tier", std::string{to_string(tier)}},
        {"tasks", task_count},
        {"halted", halted},
    }));
}

void MetricsCollector::record_fallback(std::string_view reason) {
    emit(dump({
        {"event", "fallback_engaged"},
        {"reason", std::string{reason}},
    }));
}

void MetricsCollector::record_run(const RunSummary& summary) {
    emit(dump({
        {"event", "run_completed"},
        {"success", summary.success},
        {"blocked", summary.blocked},
        {"tasks", summary.results.size()},
        {"total_duration_ms", summary.total_duration.count()},
        {"max_duration_ms", summary.max_duration.count()},
        {"parallel_efficiency", summary.parallel_efficiency},
    }));
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace tier_gate
