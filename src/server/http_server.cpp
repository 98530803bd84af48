#include "weathermcp/server/http_server.hpp"

#include "weathermcp/logging.hpp"

#include <httplib.h>

namespace weathermcp::server
{

namespace
{
/// Counts one in-flight session against the cap for as long as it lives.
class SessionSlot
{
  public:
    SessionSlot(std::atomic<int>& active, int limit) : active_(active)
    {
        acquired_ = active_.fetch_add(1) < limit;
        if (!acquired_)
            active_.fetch_sub(1);
    }
    ~SessionSlot()
    {
        if (acquired_)
            active_.fetch_sub(1);
    }
    SessionSlot(const SessionSlot&) = delete;
    SessionSlot& operator=(const SessionSlot&) = delete;

    bool acquired() const
    {
        return acquired_;
    }

  private:
    std::atomic<int>& active_;
    bool acquired_{false};
};

std::string error_body(const std::string& message)
{
    return Json{{"error", message}}.dump();
}
} // namespace

HttpServer::HttpServer(const tools::ToolRegistry& registry, Dispatcher& dispatcher,
                       ServerInfo info, SessionConfig session_config, Options options)
    : registry_(registry), dispatcher_(dispatcher), info_(std::move(info)),
      session_config_(std::move(session_config)), options_(std::move(options)),
      health_(registry)
{
    session_config_.one_shot = true;
}

HttpServer::~HttpServer()
{
    stop();
}

bool HttpServer::start()
{
    // Idempotent start: return false if already running
    if (running_)
        return false;
    svr_ = std::make_unique<httplib::Server>();

    const size_t threads = static_cast<size_t>(options_.max_sessions + kReservedThreads);
    const size_t max_queued = static_cast<size_t>(options_.max_sessions);
    svr_->new_task_queue = [threads, max_queued]
    { return new httplib::ThreadPool(threads, max_queued); };

    svr_->set_payload_max_length(session_config_.max_message_bytes);
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);
    svr_->set_keep_alive_timeout(5);
    // One request per connection: an idle keep-alive client would otherwise
    // pin a pool thread and starve /health.
    svr_->set_keep_alive_max_count(1);

    svr_->Post(options_.mcp_path,
               [this](const httplib::Request& req, httplib::Response& res)
               {
                   SessionSlot slot(active_sessions_, options_.max_sessions);
                   if (!slot.acquired())
                   {
                       res.status = 503; // Service Unavailable
                       res.set_content(error_body("Maximum sessions reached"),
                                       "application/json");
                       return;
                   }

                   SessionConfig config = session_config_;
                   config.label = "http " + req.remote_addr + ":" + std::to_string(req.remote_port);
                   Session session(registry_, dispatcher_, info_, config);
                   session.begin_read();

                   auto response = session.handle_message(req.body);
                   if (!response)
                   {
                       if (session.last_dropped())
                       {
                           res.status = 400;
                           res.set_content(error_body("Request could not be decoded"),
                                           "application/json");
                       }
                       else
                       {
                           res.status = 202; // notification accepted
                       }
                       session.close();
                       return;
                   }

                   // JSON-RPC errors are still 200 OK at HTTP level
                   res.status = 200;
                   res.set_content(*response, "application/json");
                   session.finish_write(true);
               });

    svr_->Get(options_.mcp_path,
              [](const httplib::Request&, httplib::Response& res)
              {
                  res.status = 405;
                  res.set_header("Allow", "POST");
                  Json body = {{"error", "Method Not Allowed"},
                               {"message", "The MCP endpoint only supports POST requests."}};
                  res.set_content(body.dump(), "application/json");
              });

    svr_->Get(options_.health_path,
              [this](const httplib::Request&, httplib::Response& res)
              {
                  HealthStatus status = health_.check();
                  res.status = status.ready ? 200 : 503;
                  res.set_content(status.to_json().dump(), "application/json");
              });

    if (options_.port == 0)
    {
        bound_port_ = svr_->bind_to_any_port(options_.host);
        if (bound_port_ <= 0)
        {
            logging::error("cannot bind " + options_.host + " to an ephemeral port");
            svr_.reset();
            return false;
        }
    }
    else
    {
        if (!svr_->bind_to_port(options_.host, options_.port))
        {
            logging::error("cannot bind " + options_.host + ":" + std::to_string(options_.port));
            svr_.reset();
            return false;
        }
        bound_port_ = options_.port;
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });
    svr_->wait_until_ready();

    logging::info("serving MCP on http://" + options_.host + ":" + std::to_string(bound_port_) +
                  options_.mcp_path + " (health: " + options_.health_path + ")");
    return true;
}

void HttpServer::stop()
{
    // Always attempt a graceful shutdown; safe to call multiple times
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
    svr_.reset();
}

} // namespace weathermcp::server
