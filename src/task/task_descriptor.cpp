/**
 * @file task_descriptor.cpp
 * @brief Priority classification and validation of validator tasks.
 * @author Dimitris Kafetzis
 */

#include "task/task_descriptor.hpp"

#include <algorithm>

namespace tier_gate {

namespace {

bool present(const std::optional<std::string>& field) {
    return field.has_value() && !field->empty();
}

TaskId resolve_id(const RawTask& raw) {
    if (present(raw.id)) return *raw.id;
    if (present(raw.description)) return *raw.description;
    if (present(raw.invocation)) return *raw.invocation;
    return "unknown";
}

}  // anonymous namespace

const std::vector<FamilyInfo>& family_catalog() {
    static const std::vector<FamilyInfo> catalog = {
        {"file_hygiene", Tier::Critical, BlockingBehavior::HardBlock,
         "Prevents file system pollution"},
        {"infrastructure_protection", Tier::Critical, BlockingBehavior::HardBlock,
         "Protects project infrastructure"},
        {"security", Tier::High, BlockingBehavior::SoftBlock,
         "Security and vulnerability scanning"},
        {"validation", Tier::High, BlockingBehavior::SoftBlock,
         "Data and context validation"},
        {"architecture", Tier::High, BlockingBehavior::SoftBlock,
         "Architectural pattern enforcement"},
        {"pattern_enforcement", Tier::Medium, BlockingBehavior::Warning,
         "Development pattern enforcement"},
        {"performance", Tier::Medium, BlockingBehavior::Warning,
         "Performance monitoring and optimization"},
        {"testing", Tier::Medium, BlockingBehavior::Warning,
         "Test-related validations"},
        {"data_hygiene", Tier::Medium, BlockingBehavior::Warning,
         "Database and data structure validation"},
        {"code_cleanup", Tier::Low, BlockingBehavior::None,
         "Code cleanup and formatting"},
        {"documentation", Tier::Low, BlockingBehavior::None,
         "Documentation enforcement"},
    };
    return catalog;
}

const FamilyInfo* find_family(std::string_view name) noexcept {
    const auto& catalog = family_catalog();
    auto it = std::find_if(catalog.begin(), catalog.end(),
                           [name](const FamilyInfo& f) { return f.name == name; });
    return it == catalog.end() ? nullptr : &*it;
}

BlockingBehavior blocking_behavior(std::string_view family) noexcept {
    const auto* info = find_family(family);
    return info ? info->blocking : BlockingBehavior::Warning;
}

TaskDescriptor classify(const RawTask& raw, const TierTimeouts& defaults) {
    TaskDescriptor task;
    task.id = resolve_id(raw);

    if (raw.tier) {
        task.tier = parse_tier(*raw.tier).value_or(Tier::Medium);
    }

    if (raw.family && find_family(*raw.family) != nullptr) {
        task.family = *raw.family;
    }

    task.invocation = raw.invocation.value_or(std::string{});

    task.timeout = (raw.timeout_ms && *raw.timeout_ms > 0)
        ? std::min(Millis{*raw.timeout_ms}, kMaxTaskTimeout)
        : defaults.for_tier(task.tier);

    return task;
}

std::vector<TaskDescriptor> classify_all(const std::vector<RawTask>& raws,
                                         const TierTimeouts& defaults) {
    std::vector<TaskDescriptor> tasks;
    tasks.reserve(raws.size());
    for (const auto& raw : raws) {
        tasks.push_back(classify(raw, defaults));
    }
    return tasks;
}

TaskStats task_stats(const std::vector<TaskDescriptor>& tasks) {
    TaskStats stats;
    stats.total = tasks.size();
    for (const auto& task : tasks) {
        ++stats.by_tier[is_known_tier(task.tier) ? tier_index(task.tier)
                                                 : tier_index(Tier::Medium)];
        ++stats.by_family[task.family];
        stats.total_timeout += task.timeout;
    }
    if (stats.total > 0) {
        auto n = static_cast<Millis::rep>(stats.total);
        stats.average_timeout = Millis{(stats.total_timeout.count() + n / 2) / n};
    }
    return stats;
}

ValidationReport validate(const RawTask& raw) {
    ValidationReport report;
    report.task_id = resolve_id(raw);

    if (!present(raw.invocation)) {
        report.errors.emplace_back("Task command is required");
    }

    if (!present(raw.tier)) {
        report.warnings.emplace_back("Task tier not specified, defaulting to medium");
    } else if (!parse_tier(*raw.tier)) {
        report.errors.push_back("Invalid tier: " + *raw.tier);
    }

    if (!present(raw.family)) {
        report.warnings.push_back("Task family not specified, defaulting to "
                                  + std::string{kUnclassifiedFamily});
    } else if (find_family(*raw.family) == nullptr) {
        report.warnings.push_back("Unknown family: " + *raw.family);
    }

    if (raw.timeout_ms && *raw.timeout_ms > 0 && Millis{*raw.timeout_ms} < kLowTimeoutWarning) {
        report.warnings.emplace_back("Task timeout is very low, may cause premature failures");
    }
    if (raw.timeout_ms && Millis{*raw.timeout_ms} > kMaxTaskTimeout) {
        report.warnings.push_back("Task timeout exceeds the limit of "
                                  + std::to_string(kMaxTaskTimeout.count())
                                  + "ms and will be clamped");
    }

    return report;
}

}  // namespace tier_gate
