// common/tools/registry.cpp
#include "common/tools/registry.h"
#include "core/types/errors.h"
#include <algorithm>

namespace researchflow {

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.count(name) > 0;
}

nlohmann::json ToolRegistry::call_tool(const std::string& name, const nlohmann::json& args) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        throw InvalidInputError("Tool not found: " + name);
    }
    return it->second(args);
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace researchflow
