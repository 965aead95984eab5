/**
 * @file types.hpp
 * @brief Fundamental types used throughout TierGate.
 * @author Dimitris Kafetzis
 *
 * Defines TaskId, Tier, Outcome and the fixed tier precedence shared by the
 * classifier, the schedulers and the aggregator. All types are plain values.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tier_gate {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using Millis = std::chrono::milliseconds;
using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

/// Longest timeout a task may carry; larger requests are clamped to it.
inline constexpr Millis kMaxTaskTimeout = std::chrono::hours{24};

// ─────────────────────────────────────────────
// Tier
// ─────────────────────────────────────────────

/**
 * @brief Priority bucket of a validator.
 *
 * Enumerator order is the execution precedence: lower values run first.
 */
enum class Tier : uint8_t {
    Critical,
    High,
    Medium,
    Low,
    Background
};

inline constexpr size_t kTierCount = 5;

inline constexpr std::array<Tier, kTierCount> kTierOrder = {
    Tier::Critical, Tier::High, Tier::Medium, Tier::Low, Tier::Background
};

/// True for a value that names one of the five tiers.
[[nodiscard]] constexpr bool is_known_tier(Tier tier) noexcept {
    return static_cast<size_t>(tier) < kTierCount;
}

/// Position of the tier in kTierOrder. Only valid for known tiers.
[[nodiscard]] constexpr size_t tier_index(Tier tier) noexcept {
    return static_cast<size_t>(tier);
}

/// A Block in a gating tier halts every tier that has not started.
[[nodiscard]] constexpr bool is_gating(Tier tier) noexcept {
    return tier == Tier::Critical || tier == Tier::High;
}

[[nodiscard]] constexpr std::string_view to_string(Tier tier) noexcept {
    switch (tier) {
        case Tier::Critical:   return "critical";
        case Tier::High:       return "high";
        case Tier::Medium:     return "medium";
        case Tier::Low:        return "low";
        case Tier::Background: return "background";
    }
    return "unknown";
}

/**
 * @brief Parse a tier name. Returns nullopt for anything unrecognized.
 */
[[nodiscard]] constexpr std::optional<Tier> parse_tier(std::string_view name) noexcept {
    for (auto tier : kTierOrder) {
        if (to_string(tier) == name) return tier;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Outcome
// ─────────────────────────────────────────────

/**
 * @brief Verdict of one validator invocation.
 *
 * Decoded from the process exit status at the invoker boundary:
 * 0 → Allow, 2 → Block, anything else → Fail. Timeout is assigned when the
 * deadline expires before the process exits.
 */
enum class Outcome : uint8_t {
    Allow,
    Block,
    Fail,
    Timeout
};

[[nodiscard]] constexpr std::string_view to_string(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Allow:   return "allow";
        case Outcome::Block:   return "block";
        case Outcome::Fail:    return "fail";
        case Outcome::Timeout: return "timeout";
    }
    return "unknown";
}

/// Exit code a validator uses to veto the change.
inline constexpr int kBlockExitCode = 2;

[[nodiscard]] constexpr Outcome outcome_from_exit_code(int exit_code) noexcept {
    if (exit_code == 0) return Outcome::Allow;
    if (exit_code == kBlockExitCode) return Outcome::Block;
    return Outcome::Fail;
}

/// Fail and Timeout both mean the validator produced no clean verdict.
[[nodiscard]] constexpr bool is_malfunction(Outcome outcome) noexcept {
    return outcome == Outcome::Fail || outcome == Outcome::Timeout;
}

}  // namespace tier_gate
