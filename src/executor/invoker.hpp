/**
 * @file invoker.hpp
 * @brief Validator invocation interface and its result type.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "task/task_descriptor.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tier_gate {

/**
 * @brief Outcome of one validator invocation. Read-only once produced.
 */
struct ExecutionResult {
    TaskId task_id;
    Tier tier = Tier::Medium;
    std::string family;
    Millis duration{0};
    Outcome outcome = Outcome::Fail;
    std::optional<int> exit_code;       ///< Set only when the process exited normally
    std::string output;                 ///< Captured stdout
    std::string error;                  ///< Captured stderr or the failure reason
};

/**
 * @brief Runs one validator against a serialized input document.
 *
 * Implementations must not throw: every failure mode is reported as a
 * Fail or Timeout result, because the settle-all join relies on each
 * invocation completing normally. A throw that happens anyway is treated
 * by the scheduler as an orchestration fault. Implementations must be safe
 * to call from several threads at once.
 */
class IInvoker {
public:
    virtual ~IInvoker() = default;

    virtual ExecutionResult invoke(const TaskDescriptor& task, std::string_view input) = 0;
};

}  // namespace tier_gate
