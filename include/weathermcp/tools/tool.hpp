#pragma once
#include "weathermcp/tools/arguments.hpp"
#include "weathermcp/types.hpp"
#include "weathermcp/util/json_schema.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace weathermcp::tools
{

/// Per-call context handed to a tool handler alongside its arguments.
///
/// The dispatcher raises the cancellation flag when the call's time budget
/// runs out; long-running handlers should poll `cancelled()` and give up.
class ToolContext
{
  public:
    ToolContext() : cancel_requested_(std::make_shared<std::atomic_bool>(false)) {}
    ToolContext(std::string tool_name, std::shared_ptr<std::atomic_bool> cancel_requested,
                std::chrono::steady_clock::time_point deadline)
        : tool_name_(std::move(tool_name)), cancel_requested_(std::move(cancel_requested)),
          deadline_(deadline)
    {
    }

    const std::string& tool_name() const
    {
        return tool_name_;
    }
    bool cancelled() const
    {
        return cancel_requested_ && cancel_requested_->load();
    }
    std::chrono::steady_clock::time_point deadline() const
    {
        return deadline_;
    }
    std::chrono::milliseconds remaining() const
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline_ - std::chrono::steady_clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

  private:
    std::string tool_name_;
    std::shared_ptr<std::atomic_bool> cancel_requested_;
    std::chrono::steady_clock::time_point deadline_{std::chrono::steady_clock::time_point::max()};
};

class Tool
{
  public:
    /// Handler capability: returns the result value, or throws ToolError for
    /// a declared business failure. Any other exception is an internal fault.
    using Fn = std::function<Json(const Arguments&, const ToolContext&)>;

    Tool() = default;

    Tool(std::string name, std::string description, util::schema::Schema input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const std::optional<std::string>& title() const
    {
        return title_;
    }
    const util::schema::Schema& input_schema() const
    {
        return input_schema_;
    }
    const Fn& handler() const
    {
        return fn_;
    }
    bool idempotent() const
    {
        return idempotent_;
    }

    Json invoke(const Arguments& args, const ToolContext& ctx) const
    {
        return fn_(args, ctx);
    }

    Tool& set_title(std::string title)
    {
        title_ = std::move(title);
        return *this;
    }
    Tool& set_idempotent(bool idempotent)
    {
        idempotent_ = idempotent;
        return *this;
    }

    /// Entry for a tools/list response.
    Json to_listing() const
    {
        Json entry = {{"name", name_}, {"inputSchema", util::schema::to_json_schema(input_schema_)}};
        if (title_)
            entry["title"] = *title_;
        if (!description_.empty())
            entry["description"] = description_;
        entry["annotations"] = Json{{"idempotentHint", idempotent_}};
        return entry;
    }

  private:
    std::string name_;
    std::string description_;
    std::optional<std::string> title_;
    util::schema::Schema input_schema_;
    Fn fn_;
    bool idempotent_{false};
};

} // namespace weathermcp::tools
