/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace tier_gate {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.fallback_to_sequential =
                engine["fallback_to_sequential"].value_or(true);
            config.engine.verbose = engine["verbose"].value_or(false);
            config.engine.timeout_ms = static_cast<uint32_t>(
                engine["timeout_ms"].value_or(int64_t{0}));
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.thread_count = static_cast<uint32_t>(
                executor["thread_count"].value_or(int64_t{8}));
            config.executor.kill_grace_ms = static_cast<uint32_t>(
                executor["kill_grace_ms"].value_or(int64_t{500}));
            config.executor.max_output_kb = static_cast<uint64_t>(
                executor["max_output_kb"].value_or(int64_t{1024}));
        }

        // [tiers]
        if (auto tiers = tbl["tiers"]; tiers.is_table()) {
            for (auto tier : kTierOrder) {
                auto key = std::string{to_string(tier)} + "_timeout_ms";
                auto& slot = config.tiers.timeout_ms[tier_index(tier)];
                slot = static_cast<uint32_t>(tiers[key].value_or(int64_t{slot}));
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace tier_gate
