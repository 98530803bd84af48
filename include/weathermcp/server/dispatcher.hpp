#pragma once
#include "weathermcp/protocol/outcome.hpp"
#include "weathermcp/server/worker_pool.hpp"
#include "weathermcp/tools/tool.hpp"

#include <chrono>
#include <cstddef>

namespace weathermcp::server
{

/// Runs tool handlers on a bounded worker pool under a time budget and turns
/// whatever happens into an Outcome.
///
/// - handler returns            -> Success (or result_too_large past the cap)
/// - handler throws ToolError   -> ToolFailure with the handler's code/message
/// - handler throws anything else -> ToolFailure "internal_error"
/// - budget elapses             -> Timeout; the handler's cancellation flag is
///                                 raised and the dispatcher stops waiting
/// - pool queue full            -> ToolFailure "overloaded"
class Dispatcher
{
  public:
    struct Options
    {
        size_t worker_threads{8};
        size_t queue_capacity{64};
        size_t max_result_bytes{1024 * 1024};
    };

    explicit Dispatcher(Options options);

    protocol::Outcome dispatch(const tools::Tool& tool, tools::Arguments args,
                               std::chrono::milliseconds budget);

    const Options& options() const
    {
        return options_;
    }

  private:
    Options options_;
    WorkerPool pool_;
};

} // namespace weathermcp::server
