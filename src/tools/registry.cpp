#include "weathermcp/tools/registry.hpp"

namespace weathermcp::tools
{

void ToolRegistry::register_tool(Tool tool)
{
    if (frozen_.load())
        throw Error("tool registry is frozen; cannot register: " + tool.name());
    if (tool.name().empty())
        throw Error("tool name must not be empty");
    if (!tool.handler())
        throw Error("tool has no handler: " + tool.name());
    if (tools_.count(tool.name()))
        throw DuplicateNameError("tool already registered: " + tool.name());

    std::string name = tool.name();
    tools_.emplace(name, std::move(tool));
    order_.push_back(std::move(name));
    count_.store(tools_.size());
}

const Tool* ToolRegistry::lookup(const std::string& name) const
{
    auto it = tools_.find(name);
    if (it == tools_.end())
        return nullptr;
    return &it->second;
}

const Tool& ToolRegistry::get(const std::string& name) const
{
    if (const Tool* tool = lookup(name))
        return *tool;
    throw ToolNotFoundError(name);
}

} // namespace weathermcp::tools
