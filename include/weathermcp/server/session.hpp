#pragma once
#include "weathermcp/protocol/message.hpp"
#include "weathermcp/protocol/outcome.hpp"
#include "weathermcp/server/dispatcher.hpp"
#include "weathermcp/tools/registry.hpp"
#include "weathermcp/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace weathermcp::server
{

enum class SessionState
{
    Idle,
    Reading,
    Decoding,
    Validating,
    Dispatching,
    Encoding,
    Writing,
    Closed
};

std::string to_string(SessionState state);

/// Server metadata returned from initialize.
struct ServerInfo
{
    std::string name{"weathermcp"};
    std::string version{"1.0.0"};
    std::optional<std::string> instructions;
};

struct SessionConfig
{
    std::chrono::milliseconds tool_timeout{10000};
    size_t max_message_bytes{1024 * 1024};
    /// One request per connection (HTTP): Writing is followed by Closed.
    bool one_shot{false};
    /// Prefix for log lines ("stdio", "http 10.0.0.4:5121", ...).
    std::string label{"session"};
};

/// Owns one client connection (or one HTTP request) and drives each message
/// through decode, validate, dispatch and encode.
///
/// A Session is used by exactly one thread. It only reads the registry and
/// shares nothing mutable with other sessions. Any failure up to dispatch
/// becomes an error response; the session itself keeps going until the
/// transport closes it.
class Session
{
  public:
    Session(const tools::ToolRegistry& registry, Dispatcher& dispatcher, ServerInfo info,
            SessionConfig config);

    SessionState state() const
    {
        return state_;
    }
    bool closed() const
    {
        return state_ == SessionState::Closed;
    }

    /// Transport is waiting for the next message.
    void begin_read();

    /// Process one raw message. Returns the encoded response, or nullopt when
    /// none is due (notification, or a message dropped because no correlation
    /// id could be recovered). Leaves the session in Writing when a response
    /// is returned, Idle otherwise.
    std::optional<std::string> handle_message(const std::string& raw);

    /// Transport finished writing. An undelivered write (peer gone) closes the
    /// session silently.
    void finish_write(bool delivered);

    void close();

    /// True when the last message was discarded without a response because it
    /// was unusable (as opposed to a notification).
    bool last_dropped() const
    {
        return last_dropped_;
    }
    size_t messages_handled() const
    {
        return messages_handled_;
    }

  private:
    void transition(SessionState next);
    std::optional<std::string> route(const protocol::Request& request, std::string& detail);
    protocol::Outcome call_tool(const protocol::Request& request, std::string& detail);
    Json initialize_result(const Json& params) const;
    Json tools_list_result() const;
    std::string respond(const protocol::Outcome& outcome, const CorrelationId& id,
                        std::string& detail);

    const tools::ToolRegistry& registry_;
    Dispatcher& dispatcher_;
    ServerInfo info_;
    SessionConfig config_;
    protocol::RequestDecoder decoder_;
    SessionState state_{SessionState::Idle};
    bool last_dropped_{false};
    size_t messages_handled_{0};
};

} // namespace weathermcp::server
