#pragma once
#include "weathermcp/exceptions.hpp"
#include "weathermcp/tools/tool.hpp"

#include <atomic>
#include <string>
#include <unordered_map>
#include <vector>

namespace weathermcp::tools
{

/// Set of available tools, keyed by unique name.
///
/// Populated once at startup, then frozen. After freeze() the registry is
/// never mutated again, so lookups from concurrent sessions take no locks.
/// Tool addresses stay stable for the registry's lifetime.
class ToolRegistry
{
  public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// Throws DuplicateNameError if the name is taken (existing entry is kept),
    /// Error if the registry is frozen or the name is empty.
    void register_tool(Tool tool);

    /// nullptr when no tool has that name.
    const Tool* lookup(const std::string& name) const;

    /// Throws ToolNotFoundError when absent.
    const Tool& get(const std::string& name) const;

    void freeze()
    {
        frozen_.store(true);
    }
    bool frozen() const
    {
        return frozen_.load();
    }

    size_t size() const
    {
        return count_.load();
    }

    /// Names in registration order.
    const std::vector<std::string>& list_names() const
    {
        return order_;
    }

  private:
    std::unordered_map<std::string, Tool> tools_;
    std::vector<std::string> order_;
    std::atomic<bool> frozen_{false};
    std::atomic<size_t> count_{0};
};

} // namespace weathermcp::tools
