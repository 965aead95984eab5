/**
 * @file json_codec.hpp
 * @brief JSON wire format for run requests, summaries and validation reports.
 * @author Dimitris Kafetzis
 *
 * Request:  {"hooks": [ {id, description, tier|priority, family,
 *                         command|invocation, timeoutMs | timeout(s)} ... ],
 *            "data": { ...event being checked... }}
 * Response: the RunSummary, camelCase keys, plus derived stats.
 *
 * Classification and task statistics are encoded for inspecting a request
 * without running it.
 */

#pragma once

#include "core/result.hpp"
#include "scheduler/result_aggregator.hpp"
#include "task/task_descriptor.hpp"

#include <nlohmann/json.hpp>

#include <string_view>
#include <vector>

namespace tier_gate {

/**
 * @brief A decoded CLI request: raw hook entries plus the event payload.
 */
struct RunRequest {
    std::vector<RawTask> hooks;
    nlohmann::json data = nlohmann::json::object();
};

/**
 * @brief Decode a request document. A missing or null "hooks" means no hooks.
 */
[[nodiscard]] Result<RunRequest> decode_request(std::string_view text);

/**
 * @brief Decode one hook entry.
 *
 * Fields of the wrong JSON type are treated as absent so that
 * classification can apply its defaults; only a non-object entry fails.
 */
[[nodiscard]] Result<RawTask> decode_raw_task(const nlohmann::json& entry);

[[nodiscard]] nlohmann::ordered_json encode_result(const ExecutionResult& result);
[[nodiscard]] nlohmann::ordered_json encode_summary(const RunSummary& summary);
[[nodiscard]] nlohmann::ordered_json encode_report(const ValidationReport& report);

/**
 * @brief Resolved descriptors grouped by tier, in execution order.
 *
 * Every tier key is present, empty tiers as empty arrays. Each entry
 * carries the family's catalog blocking behaviour and whether its tier gates.
 */
[[nodiscard]] nlohmann::ordered_json encode_classification(const std::vector<TaskDescriptor>& tasks);

[[nodiscard]] nlohmann::ordered_json encode_task_stats(const TaskStats& stats);

}  // namespace tier_gate
