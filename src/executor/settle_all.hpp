/**
 * @file settle_all.hpp
 * @brief Settle-all join over a batch of futures.
 * @author Dimitris Kafetzis
 *
 * Waits for every future regardless of how the others ended. There is no
 * early return: a failing unit never hides or cancels its siblings' verdicts.
 */

#pragma once

#include <exception>
#include <future>
#include <optional>
#include <vector>

namespace tier_gate {

/**
 * @brief Final state of one joined future: a value or the exception it raised.
 */
template <typename T>
struct Settled {
    std::optional<T> value;
    std::exception_ptr error;

    [[nodiscard]] bool fulfilled() const noexcept { return value.has_value(); }
};

/**
 * @brief Block until every future is ready; results keep submission order.
 */
template <typename T>
std::vector<Settled<T>> settle_all(std::vector<std::future<T>>& futures) {
    std::vector<Settled<T>> settled;
    settled.reserve(futures.size());

    for (auto& future : futures) {
        Settled<T> entry;
        try {
            entry.value.emplace(future.get());
        } catch (...) {
            entry.error = std::current_exception();
        }
        settled.push_back(std::move(entry));
    }
    return settled;
}

}  // namespace tier_gate
