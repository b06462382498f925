// modules/executor/retry_policy.h
#ifndef RESEARCHFLOW_MODULES_EXECUTOR_RETRY_POLICY_H
#define RESEARCHFLOW_MODULES_EXECUTOR_RETRY_POLICY_H

#include "core/types/errors.h"
#include "modules/budget/budget_controller.h"
#include "modules/executor/error_classifier.h"
#include "common/utils/logging.h"
#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <utility>

namespace researchflow {

struct RetryPolicy {
    int max_attempts = 3; // total attempts, including the first
    std::chrono::milliseconds base_delay{1000};

    // Delay before retry number attempt+1; attempt counts from 0.
    std::chrono::milliseconds backoff_delay(int attempt) const;
};

// Calls `fn` until it returns, retrying transient failures with exponential
// backoff. Permanent failures and the last transient one are rethrown.
// Throws CancelledError when the run stops before or during a backoff sleep.
// `attempts_out`, if given, always holds the number of calls made.
template <typename Fn>
auto retry_call(const RetryPolicy& policy, BudgetController& budget, Fn&& fn,
                int* attempts_out = nullptr, const std::string& label = "call") -> decltype(fn()) {
    const int max_attempts = std::max(1, policy.max_attempts);
    for (int attempt = 0;; ++attempt) {
        if (budget.stop_requested()) {
            throw CancelledError("run cancelled before " + label + ": " + budget.stop_reason());
        }
        if (attempts_out) *attempts_out = attempt + 1;
        try {
            return fn();
        } catch (const std::exception& e) {
            if (classify_error(e) == ErrorClass::PERMANENT || attempt + 1 >= max_attempts) {
                throw;
            }
            auto delay = policy.backoff_delay(attempt);
            logging::get()->warn("{} failed (attempt {}/{}): {}; retrying in {} ms",
                                 label, attempt + 1, max_attempts, e.what(), delay.count());
            if (!budget.wait_for(delay)) {
                throw CancelledError("run cancelled during backoff of " + label + ": " + budget.stop_reason());
            }
        }
    }
}

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_EXECUTOR_RETRY_POLICY_H
