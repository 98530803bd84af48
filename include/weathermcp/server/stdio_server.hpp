#pragma once
#include "weathermcp/server/dispatcher.hpp"
#include "weathermcp/server/session.hpp"
#include "weathermcp/tools/registry.hpp"

#include <atomic>
#include <iostream>
#include <thread>

namespace weathermcp::server
{

/**
 * STDIO transport: newline-delimited JSON-RPC on a stream pair.
 *
 * The whole stream is one session. Each line is one message; responses are
 * written one per line in request order. Lines longer than the configured
 * maximum message size are discarded without being buffered in full.
 *
 * Usage:
 *   StdioServer server(registry, dispatcher, info, config);
 *   server.run();  // Blocking - runs until EOF or stop() is called
 */
class StdioServer
{
  public:
    StdioServer(const tools::ToolRegistry& registry, Dispatcher& dispatcher, ServerInfo info,
                SessionConfig config, std::istream& in = std::cin,
                std::ostream& out = std::cout);

    ~StdioServer();

    /**
     * Serve until EOF on the input stream or stop().
     *
     * @return false if the server was already running
     */
    bool run();

    /// Launch run() on a background thread.
    bool start_async();

    /// Stop after the message in progress. Joins the background thread if any.
    void stop();

    bool running() const
    {
        return running_.load();
    }

    size_t messages_handled() const
    {
        return messages_handled_.load();
    }

  private:
    void run_loop();

    const tools::ToolRegistry& registry_;
    Dispatcher& dispatcher_;
    ServerInfo info_;
    SessionConfig config_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<size_t> messages_handled_{0};
    std::thread thread_;
};

} // namespace weathermcp::server
