/**
 * @file json_codec.cpp
 * @brief JSON codec implementation using nlohmann/json.
 * @author Dimitris Kafetzis
 */

#include "codec/json_codec.hpp"

#include <algorithm>
#include <cmath>

namespace tier_gate {

namespace {

using ordered_json = nlohmann::ordered_json;

std::optional<std::string> string_field(const nlohmann::json& entry,
                                        std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = entry.find(key);
        if (it != entry.end() && it->is_string()) return it->get<std::string>();
    }
    return std::nullopt;
}

/// NaN counts as absent. Everything else is clamped into [0, kMaxTaskTimeout]
/// before rounding, since llround is unspecified outside the long long range.
std::optional<int64_t> clamp_millis(double ms) {
    if (std::isnan(ms)) return std::nullopt;
    ms = std::clamp(ms, 0.0, static_cast<double>(kMaxTaskTimeout.count()));
    return static_cast<int64_t>(std::llround(ms));
}

std::optional<int64_t> timeout_field(const nlohmann::json& entry) {
    if (auto it = entry.find("timeoutMs"); it != entry.end() && it->is_number()) {
        return clamp_millis(it->get<double>());
    }
    // Host settings express hook timeouts in seconds.
    if (auto it = entry.find("timeout"); it != entry.end() && it->is_number()) {
        return clamp_millis(it->get<double>() * 1000.0);
    }
    return std::nullopt;
}

}  // anonymous namespace

Result<RawTask> decode_raw_task(const nlohmann::json& entry) {
    if (!entry.is_object()) {
        return Error{"Hook entry must be an object, got " + std::string{entry.type_name()}};
    }

    RawTask raw;
    raw.id = string_field(entry, {"id"});
    raw.description = string_field(entry, {"description"});
    raw.tier = string_field(entry, {"tier", "priority"});
    raw.family = string_field(entry, {"family"});
    raw.invocation = string_field(entry, {"command", "invocation"});
    raw.timeout_ms = timeout_field(entry);
    return raw;
}

Result<RunRequest> decode_request(std::string_view text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& err) {
        return Error{std::string{"JSON parse error: "} + err.what()};
    }

    if (!doc.is_object()) {
        return Error{"Request must be a JSON object"};
    }

    RunRequest request;

    if (auto hooks = doc.find("hooks"); hooks != doc.end() && !hooks->is_null()) {
        if (!hooks->is_array()) {
            return Error{"\"hooks\" must be an array"};
        }
        for (size_t i = 0; i < hooks->size(); ++i) {
            auto raw = decode_raw_task((*hooks)[i]);
            if (!raw) {
                return Error{"hooks[" + std::to_string(i) + "]: " + raw.error().message};
            }
            request.hooks.push_back(std::move(raw).value());
        }
    }

    if (auto data = doc.find("data"); data != doc.end() && !data->is_null()) {
        request.data = *data;
    }

    return request;
}

ordered_json encode_result(const ExecutionResult& result) {
    ordered_json out = {
        {"taskId", result.task_id},
        {"tier", std::string{to_string(result.tier)}},
        {"family", result.family},
        {"durationMs", result.duration.count()},
        {"outcome", std::string{to_string(result.outcome)}},
        {"exitCode", nullptr},
        {"output", result.output},
        {"error", result.error},
    };
    if (result.exit_code) out["exitCode"] = *result.exit_code;
    return out;
}

ordered_json encode_summary(const RunSummary& summary) {
    ordered_json results = ordered_json::array();
    for (const auto& result : summary.results) {
        results.push_back(encode_result(result));
    }

    ordered_json by_tier = ordered_json::object();
    for (auto tier : kTierOrder) {
        const auto& stats = summary.by_tier[tier_index(tier)];
        by_tier[std::string{to_string(tier)}] = {
            {"allow", stats.allow},
            {"block", stats.block},
            {"fail", stats.fail},
            {"timeout", stats.timeout},
            {"durationMs", stats.total_duration.count()},
        };
    }

    auto perf = performance_stats(summary);
    ordered_json perf_by_tier = ordered_json::object();
    for (auto tier : kTierOrder) {
        const auto& p = perf.by_tier[tier_index(tier)];
        if (p.count == 0) continue;
        perf_by_tier[std::string{to_string(tier)}] = {
            {"count", p.count},
            {"durationMs", p.duration.count()},
            {"succeeded", p.succeeded},
            {"efficiency", p.efficiency},
        };
    }

    return {
        {"success", summary.success},
        {"blocked", summary.blocked},
        {"results", std::move(results)},
        {"totalDurationMs", summary.total_duration.count()},
        {"maxDurationMs", summary.max_duration.count()},
        {"parallelEfficiency", summary.parallel_efficiency},
        {"byTier", std::move(by_tier)},
        {"stats", {
            {"totalTasks", perf.total_tasks},
            {"averageDurationMs", perf.average_duration_ms},
            {"successRatePercent", perf.success_rate_percent},
            {"byTier", std::move(perf_by_tier)},
        }},
    };
}

ordered_json encode_report(const ValidationReport& report) {
    return {
        {"taskId", report.task_id},
        {"valid", report.valid()},
        {"errors", report.errors},
        {"warnings", report.warnings},
    };
}

ordered_json encode_classification(const std::vector<TaskDescriptor>& tasks) {
    ordered_json groups = ordered_json::object();
    for (auto tier : kTierOrder) {
        groups[std::string{to_string(tier)}] = ordered_json::array();
    }
    for (const auto& task : tasks) {
        ordered_json entry = {
            {"id", task.id},
            {"family", task.family},
            {"command", task.invocation},
            {"timeoutMs", task.timeout.count()},
            {"blocking", std::string{to_string(blocking_behavior(task.family))}},
            {"gating", is_gating(task.tier)},
        };
        groups[std::string{to_string(task.tier)}].push_back(std::move(entry));
    }
    return groups;
}

ordered_json encode_task_stats(const TaskStats& stats) {
    ordered_json by_tier = ordered_json::object();
    for (auto tier : kTierOrder) {
        by_tier[std::string{to_string(tier)}] = stats.by_tier[tier_index(tier)];
    }
    ordered_json by_family = ordered_json::object();
    for (const auto& [family, count] : stats.by_family) {
        by_family[family] = count;
    }
    return {
        {"total", stats.total},
        {"byTier", std::move(by_tier)},
        {"byFamily", std::move(by_family)},
        {"totalTimeoutMs", stats.total_timeout.count()},
        {"averageTimeoutMs", stats.average_timeout.count()},
    };
}

}  // namespace tier_gate
