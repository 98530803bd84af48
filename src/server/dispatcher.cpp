#include "weathermcp/server/dispatcher.hpp"

#include "weathermcp/exceptions.hpp"
#include "weathermcp/logging.hpp"

#include <atomic>
#include <exception>
#include <future>
#include <memory>

namespace weathermcp::server
{

Dispatcher::Dispatcher(Options options)
    : options_(options), pool_(options.worker_threads, options.queue_capacity)
{
}

protocol::Outcome Dispatcher::dispatch(const tools::Tool& tool, tools::Arguments args,
                                       std::chrono::milliseconds budget)
{
    auto cancel_requested = std::make_shared<std::atomic_bool>(false);
    auto promise = std::make_shared<std::promise<Json>>();
    std::future<Json> future = promise->get_future();

    tools::ToolContext ctx(tool.name(), cancel_requested,
                           std::chrono::steady_clock::now() + budget);

    // The job owns copies of everything it touches: once the budget elapses the
    // caller walks away and the job may outlive this frame.
    auto fn = tool.handler();
    auto shared_args = std::make_shared<tools::Arguments>(std::move(args));
    bool queued = pool_.try_submit(
        [fn, shared_args, ctx, promise]()
        {
            // Budget already spent while queued: the caller has its Timeout.
            if (ctx.cancelled())
            {
                logging::debug("skipping tool '" + ctx.tool_name() +
                               "': cancelled before it started");
                promise->set_exception(
                    std::make_exception_ptr(Error("cancelled before start: " + ctx.tool_name())));
                return;
            }
            try
            {
                promise->set_value(fn(*shared_args, ctx));
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            }
        });

    if (!queued)
    {
        logging::warn("dispatch refused for tool '" + tool.name() + "': worker queue full");
        return protocol::ToolFailure{protocol::kToolOverloaded,
                                     "Server is at capacity, try again later"};
    }

    if (future.wait_for(budget) != std::future_status::ready)
    {
        cancel_requested->store(true);
        logging::warn("tool '" + tool.name() + "' exceeded its time budget of " +
                      std::to_string(budget.count()) + " ms");
        return protocol::Timeout{budget};
    }

    Json value;
    try
    {
        value = future.get();
    }
    catch (const ToolError& e)
    {
        return protocol::ToolFailure{e.code, e.what()};
    }
    catch (const std::exception& e)
    {
        logging::error("tool '" + tool.name() + "' failed: " + e.what());
        return protocol::ToolFailure{protocol::kToolInternalError,
                                     "Internal error while running tool '" + tool.name() + "'"};
    }
    catch (...)
    {
        logging::error("tool '" + tool.name() + "' failed with a non-standard exception");
        return protocol::ToolFailure{protocol::kToolInternalError,
                                     "Internal error while running tool '" + tool.name() + "'"};
    }

    size_t size = value.dump(-1, ' ', false, Json::error_handler_t::replace).size();
    if (size > options_.max_result_bytes)
    {
        logging::warn("tool '" + tool.name() + "' result of " + std::to_string(size) +
                      " bytes exceeds cap of " + std::to_string(options_.max_result_bytes));
        return protocol::ToolFailure{protocol::kToolResultTooLarge,
                                     "Tool result of " + std::to_string(size) +
                                         " bytes exceeds the limit of " +
                                         std::to_string(options_.max_result_bytes) + " bytes"};
    }

    return protocol::Success{std::move(value)};
}

} // namespace weathermcp::server
