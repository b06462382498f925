// modules/budget/budget_controller.h
#ifndef RESEARCHFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H
#define RESEARCHFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H

#include "core/types/budget.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace researchflow {

// BudgetController 封装一次运行的预算、截止时间与取消信号
class BudgetController {
public:
    // Sleeps for `delay` unless `token` is stopped first. Returns true when the
    // full delay elapsed.
    using SleepFunction = std::function<bool(std::chrono::milliseconds delay, std::stop_token token)>;

    // `external` is linked to the run's own stop source: stopping it cancels the run.
    explicit BudgetController(ExecutionBudget budget = {}, std::stop_token external = {});

    BudgetController(const BudgetController&) = delete;
    BudgetController& operator=(const BudgetController&) = delete;

    // 尝试消耗一个节点预算；超限时返回 false 并触发取消
    bool try_consume_node();

    // Deadline passed, node limit used up, or cancelled. Raises the stop
    // signal when a limit is found breached.
    bool exceeded() const;

    void cancel(const std::string& reason = "run cancelled");
    bool stop_requested() const { return stop_source_.stop_requested(); }
    std::stop_token token() const { return stop_source_.get_token(); }

    // Interruptible backoff sleep, clipped to the deadline.
    // Returns false if the run was stopped (or the deadline hit) before `delay` elapsed.
    bool wait_for(std::chrono::milliseconds delay);

    void set_sleep_function(SleepFunction fn) { sleep_ = std::move(fn); }

    int nodes_used() const { return nodes_used_.load(); }
    const ExecutionBudget& budget() const { return budget_; }
    std::string stop_reason() const;

    static bool default_sleep(std::chrono::milliseconds delay, std::stop_token token);

private:
    ExecutionBudget budget_;
    std::chrono::steady_clock::time_point start_time_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    std::atomic<int> nodes_used_{0};

    mutable std::stop_source stop_source_;
    mutable std::mutex reason_mutex_;
    mutable std::string stop_reason_;
    SleepFunction sleep_ = &BudgetController::default_sleep;
    // last member: deregisters before anything its callback touches is destroyed
    std::optional<std::stop_callback<std::function<void()>>> external_link_;

    void request_stop(const std::string& reason) const;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H
