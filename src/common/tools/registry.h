// common/tools/registry.h
#ifndef RESEARCHFLOW_COMMON_TOOLS_REGISTRY_H
#define RESEARCHFLOW_COMMON_TOOLS_REGISTRY_H

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace researchflow {

// Named data tools. Register everything before the first run; lookups are
// then read-only and safe from concurrent branches.
class ToolRegistry {
public:
    using Tool = std::function<nlohmann::json(const nlohmann::json& args)>;

    ToolRegistry() = default;

    template<typename Func>
    void register_tool(std::string name, Func&& func) {
        tools_[std::move(name)] = Tool(std::forward<Func>(func));
    }

    bool has_tool(const std::string& name) const;

    // Tool exceptions propagate unchanged. Unknown tool: InvalidInputError.
    nlohmann::json call_tool(const std::string& name, const nlohmann::json& args) const;

    std::vector<std::string> list_tools() const;

private:
    std::unordered_map<std::string, Tool> tools_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_TOOLS_REGISTRY_H
