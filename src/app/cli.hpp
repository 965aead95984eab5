/**
 * @file cli.hpp
 * @brief tier_gate command line: argument parsing and the run-to-exit-code path.
 * @author Dimitris Kafetzis
 *
 * Kept apart from main() so the whole command line, streams included, can
 * be driven in-process.
 */

#pragma once

#include "core/result.hpp"
#include "executor/invoker.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tier_gate {

/// Exit status for malformed input, bad arguments and fatal errors.
inline constexpr int kExitError = 1;

enum class CliMode : uint8_t {
    Run,        ///< Execute the hooks and print the RunSummary
    Validate,   ///< Print a validation report per hook
    Classify,   ///< Print the resolved descriptors grouped by tier
    Stats       ///< Print counts and timeout totals of the classified hooks
};

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> input_path;    ///< Absent = stdin
    std::optional<uint32_t> timeout_ms;
    CliMode mode = CliMode::Run;
    bool verbose = false;
    bool no_fallback = false;
    bool help = false;
};

struct CliStreams {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

void print_usage(std::ostream& out);

/**
 * @brief Parse the command line, program name excluded.
 */
[[nodiscard]] Result<CLIArgs> parse_args(const std::vector<std::string>& words);

/**
 * @brief Carry out a parsed command line.
 *
 * @param invoker Validator runner for Run mode; null = ProcessInvoker.
 * @return 0 allowed, 2 blocked, 1 when a hook failed or timed out, the
 *         input was malformed, --validate found an invalid hook, or an
 *         error occurred.
 */
[[nodiscard]] int run_cli(const CLIArgs& args, CliStreams io,
                          std::unique_ptr<IInvoker> invoker = nullptr);

/// parse_args() then run_cli(); argument errors print usage to io.err.
[[nodiscard]] int cli_main(const std::vector<std::string>& words, CliStreams io,
                           std::unique_ptr<IInvoker> invoker = nullptr);

}  // namespace tier_gate
