/**
 * @file task_descriptor.hpp
 * @brief Validator task descriptors and priority classification.
 * @author Dimitris Kafetzis
 *
 * classify() turns loosely-typed caller input (RawTask) into the immutable
 * TaskDescriptor the schedulers trust for ordering. It is total: nothing is
 * rejected, unrecognized values fall back to defaults. validate() reports
 * what classify() had to paper over.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tier_gate {

/// Family assigned to tasks whose family is missing or not in the catalog.
inline constexpr std::string_view kUnclassifiedFamily = "unclassified";

// ─────────────────────────────────────────────
// Raw input / descriptor
// ─────────────────────────────────────────────

/**
 * @brief Validator entry as supplied by the caller, before classification.
 */
struct RawTask {
    std::optional<std::string> id;
    std::optional<std::string> description;
    std::optional<std::string> tier;
    std::optional<std::string> family;
    std::optional<std::string> invocation;
    std::optional<int64_t> timeout_ms;
};

/**
 * @brief Immutable specification of one validator for the lifetime of a run.
 */
struct TaskDescriptor {
    TaskId id;
    Tier tier = Tier::Medium;
    std::string family{kUnclassifiedFamily};
    std::string invocation;             ///< Command line, tokenized by the invoker
    Millis timeout{0};
};

// ─────────────────────────────────────────────
// Family catalog
// ─────────────────────────────────────────────

enum class BlockingBehavior : uint8_t {
    HardBlock,
    SoftBlock,
    Warning,
    None
};

[[nodiscard]] constexpr std::string_view to_string(BlockingBehavior behavior) noexcept {
    switch (behavior) {
        case BlockingBehavior::HardBlock: return "hard-block";
        case BlockingBehavior::SoftBlock: return "soft-block";
        case BlockingBehavior::Warning:   return "warning";
        case BlockingBehavior::None:      return "none";
    }
    return "unknown";
}

struct FamilyInfo {
    std::string_view name;
    Tier nominal_tier;
    BlockingBehavior blocking;
    std::string_view description;
};

/// Every recognized validator family.
[[nodiscard]] const std::vector<FamilyInfo>& family_catalog();

/// Catalog entry for a family name, nullptr when unknown.
[[nodiscard]] const FamilyInfo* find_family(std::string_view name) noexcept;

/// Catalog blocking behaviour; families outside the catalog only warn.
[[nodiscard]] BlockingBehavior blocking_behavior(std::string_view family) noexcept;

// ─────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────

/**
 * @brief Build a TaskDescriptor from caller input.
 *
 * Missing or unknown tier → medium. Missing or unknown family →
 * "unclassified". Missing or non-positive timeout → the tier default.
 * Timeouts above kMaxTaskTimeout are clamped to it.
 * Missing id → description, then invocation, then "unknown".
 */
[[nodiscard]] TaskDescriptor classify(const RawTask& raw,
                                      const TierTimeouts& defaults = TierTimeouts{});

[[nodiscard]] std::vector<TaskDescriptor> classify_all(const std::vector<RawTask>& raws,
                                                       const TierTimeouts& defaults = TierTimeouts{});

// ─────────────────────────────────────────────
// Statistics
// ─────────────────────────────────────────────

/**
 * @brief Shape of a classified task set, for inspecting a configuration
 *        without running it.
 */
struct TaskStats {
    size_t total = 0;
    std::array<size_t, kTierCount> by_tier{};
    std::map<std::string, size_t> by_family;
    Millis total_timeout{0};
    Millis average_timeout{0};          ///< Rounded to the nearest ms, 0 when empty
};

[[nodiscard]] TaskStats task_stats(const std::vector<TaskDescriptor>& tasks);

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

struct ValidationReport {
    TaskId task_id;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool valid() const noexcept { return errors.empty(); }
};

/// Timeouts below this are likely to cut validators off mid-check.
inline constexpr Millis kLowTimeoutWarning{1000};

[[nodiscard]] ValidationReport validate(const RawTask& raw);

}  // namespace tier_gate
