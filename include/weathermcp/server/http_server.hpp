#pragma once
#include "weathermcp/server/dispatcher.hpp"
#include "weathermcp/server/health.hpp"
#include "weathermcp/server/session.hpp"
#include "weathermcp/tools/registry.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib
{
class Server;
}

namespace weathermcp::server
{

/**
 * HTTP transport: JSON-RPC over `POST <mcp_path>` plus `GET <health_path>`.
 *
 * Every POST is its own session (one request per connection-level session).
 * JSON-RPC errors are HTTP 200; notifications answer 202 with no body;
 * messages with no recoverable correlation id answer 400; bodies over the
 * message limit answer 413; requests beyond `max_sessions` answer 503.
 *
 * The listener's thread pool is sized above `max_sessions`, so tool calls can
 * never occupy every thread and health probes are always served.
 */
class HttpServer
{
  public:
    struct Options
    {
        std::string host{"127.0.0.1"};
        /// 0 binds an ephemeral port; see port() after start().
        int port{3000};
        std::string mcp_path{"/mcp"};
        std::string health_path{"/health"};
        int max_sessions{64};
    };

    HttpServer(const tools::ToolRegistry& registry, Dispatcher& dispatcher, ServerInfo info,
               SessionConfig session_config, Options options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and start serving on a background thread. Returns false if the
    /// address cannot be bound or the server is already running.
    bool start();

    /// Graceful shutdown; safe to call multiple times.
    void stop();

    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return bound_port_;
    }
    const std::string& host() const
    {
        return options_.host;
    }
    int active_sessions() const
    {
        return active_sessions_.load();
    }

  private:
    // Threads kept free of tool traffic for health probes and refusals.
    static constexpr int kReservedThreads = 4;

    const tools::ToolRegistry& registry_;
    Dispatcher& dispatcher_;
    ServerInfo info_;
    SessionConfig session_config_;
    Options options_;
    HealthProbe health_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<int> active_sessions_{0};
    int bound_port_{0};
};

} // namespace weathermcp::server
