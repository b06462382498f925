#ifndef RESEARCHFLOW_TYPES_BUDGET_H
#define RESEARCHFLOW_TYPES_BUDGET_H

#include "context.h"
#include "trace.h"
#include <chrono>
#include <string>
#include <vector>

namespace researchflow {

// 执行预算结构
struct ExecutionBudget {
    int max_node_executions = -1;          // -1 表示无限制
    std::chrono::milliseconds timeout{0};  // 0 表示无截止时间
};

// Outcome of one scheduler run.
struct ExecutionResult {
    bool success = false;
    std::string message;    // 错误信息或成功信息
    Context final_state;    // 执行结束时的状态
    std::vector<TraceRecord> traces;
};

} // namespace researchflow

#endif // RESEARCHFLOW_TYPES_BUDGET_H
