#ifndef RESEARCHFLOW_TYPES_CONTEXT_H
#define RESEARCHFLOW_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>

namespace researchflow {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;
using Context = nlohmann::json;

// A node returns only the fields it produced; the scheduler merges it.
using PartialUpdate = nlohmann::json;

} // namespace researchflow

#endif // RESEARCHFLOW_TYPES_CONTEXT_H
