/**
 * @file process_invoker.hpp
 * @brief Runs a validator as an isolated child process.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "executor/invoker.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tier_gate {

/**
 * @brief Split a command line into argv words.
 *
 * Follows POSIX shell quoting without expansion. Words are separated by
 * unquoted whitespace. Single quotes preserve everything literally. Inside
 * double quotes a backslash escapes only $ ` " \ and newline and is kept
 * literally before anything else. An unquoted backslash escapes the next
 * character. Backslash-newline is a line continuation in both places.
 * An unterminated quote is an error.
 */
[[nodiscard]] Result<std::vector<std::string>> split_command(std::string_view command);

/**
 * @brief Production invoker: fork/exec with pipes, poll() and a deadline.
 *
 * The child runs in its own process group so that a timeout can terminate
 * everything it started. On timeout the group receives SIGTERM, then
 * SIGKILL after the grace period, and the child is always reaped.
 */
class ProcessInvoker : public IInvoker {
public:
    explicit ProcessInvoker(const ExecutorConfig& config = ExecutorConfig{});

    ExecutionResult invoke(const TaskDescriptor& task, std::string_view input) noexcept override;

private:
    ExecutionResult run_child(const TaskDescriptor& task, std::string_view input);

    Millis kill_grace_;
    size_t max_output_bytes_;
};

}  // namespace tier_gate
