// modules/budget/budget_controller.cpp
#include "modules/budget/budget_controller.h"
#include "common/utils/logging.h"
#include <algorithm>
#include <condition_variable>

namespace researchflow {

BudgetController::BudgetController(ExecutionBudget budget, std::stop_token external)
    : budget_(budget), start_time_(std::chrono::steady_clock::now()) {
    if (budget_.timeout.count() > 0) {
        deadline_ = start_time_ + budget_.timeout;
    }
    if (external.stop_possible()) {
        external_link_.emplace(std::move(external), std::function<void()>([this] {
            request_stop("run cancelled by caller");
        }));
    }
}

bool BudgetController::try_consume_node() {
    if (stop_requested()) return false;
    if (budget_.max_node_executions < 0) {
        nodes_used_.fetch_add(1);
        return true;
    }
    int used = nodes_used_.fetch_add(1);
    if (used >= budget_.max_node_executions) {
        nodes_used_.fetch_sub(1);
        request_stop("node execution budget exhausted (" + std::to_string(budget_.max_node_executions) + ")");
        return false;
    }
    return true;
}

bool BudgetController::exceeded() const {
    if (stop_requested()) return true;
    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
        request_stop("run deadline exceeded (" + std::to_string(budget_.timeout.count()) + " ms)");
        return true;
    }
    return false;
}

void BudgetController::cancel(const std::string& reason) {
    request_stop(reason);
}

bool BudgetController::wait_for(std::chrono::milliseconds delay) {
    if (exceeded()) return false;
    auto effective = delay;
    bool clipped = false;
    if (deadline_) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline_ - std::chrono::steady_clock::now());
        if (remaining < effective) {
            effective = std::max(remaining, std::chrono::milliseconds{0});
            clipped = true;
        }
    }
    bool completed = sleep_(effective, token());
    if (!completed || stop_requested()) return false;
    if (clipped) {
        request_stop("run deadline exceeded during backoff");
        return false;
    }
    return true;
}

std::string BudgetController::stop_reason() const {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    return stop_reason_;
}

bool BudgetController::default_sleep(std::chrono::milliseconds delay, std::stop_token token) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    cv.wait_for(lock, token, delay, [] { return false; });
    return !token.stop_requested();
}

void BudgetController::request_stop(const std::string& reason) const {
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        if (stop_reason_.empty()) stop_reason_ = reason;
    }
    if (stop_source_.request_stop()) {
        logging::get()->warn("Stopping run: {}", reason);
    }
}

} // namespace researchflow
