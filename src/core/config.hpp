/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace tier_gate {

struct EngineConfig {
    bool fallback_to_sequential = true;
    bool verbose = false;
    uint32_t timeout_ms = 0;            ///< Per-run timeout cap, 0 = none
};

struct ExecutorConfig {
    uint32_t thread_count = 8;          ///< Workers started up front, 0 = hardware_concurrency.
                                        ///< The pool grows when a tier is wider.
    uint32_t kill_grace_ms = 500;       ///< SIGTERM → SIGKILL grace period
    uint64_t max_output_kb = 1024;      ///< Capture cap per output stream
};

/**
 * @brief Default timeout applied to tasks that do not carry their own.
 */
struct TierTimeouts {
    std::array<uint32_t, kTierCount> timeout_ms = {2000, 4000, 3000, 2000, 5000};

    [[nodiscard]] Millis for_tier(Tier tier) const noexcept {
        return Millis{timeout_ms[is_known_tier(tier) ? tier_index(tier) : tier_index(Tier::Medium)]};
    }
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< Empty = log to stderr
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    EngineConfig engine;
    ExecutorConfig executor;
    TierTimeouts tiers;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace tier_gate
