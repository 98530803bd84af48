#pragma once
#include "weathermcp/tools/registry.hpp"
#include "weathermcp/types.hpp"

#include <chrono>
#include <cstddef>

namespace weathermcp::server
{

/// Snapshot answered by the health endpoint. Built fresh for every probe.
struct HealthStatus
{
    bool alive{true};
    bool ready{false};
    size_t registry_size{0};
    double uptime_seconds{0.0};

    Json to_json() const
    {
        return Json{{"alive", alive},
                    {"ready", ready},
                    {"registrySize", registry_size},
                    {"uptimeSeconds", uptime_seconds}};
    }
};

/// Liveness/readiness probe. Reads only the registry's atomic size and frozen
/// flag, never a tool handler, so it answers the same way under any tool load.
class HealthProbe
{
  public:
    explicit HealthProbe(const tools::ToolRegistry& registry)
        : registry_(registry), started_(std::chrono::steady_clock::now())
    {
    }

    HealthStatus check() const
    {
        HealthStatus status;
        status.alive = true;
        status.registry_size = registry_.size();
        status.ready = registry_.frozen() && status.registry_size > 0;
        status.uptime_seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
        return status;
    }

  private:
    const tools::ToolRegistry& registry_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace weathermcp::server
