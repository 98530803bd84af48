#pragma once
#include "weathermcp/exceptions.hpp"
#include "weathermcp/types.hpp"

#include <cstddef>
#include <string>

namespace weathermcp::protocol
{

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

/// One decoded JSON-RPC message. `id` is null for notifications.
struct Request
{
    CorrelationId id;
    std::string method;
    Json params = Json::object();

    bool is_notification() const
    {
        return id.is_null();
    }
};

/// A tools/call request reduced to what the dispatch pipeline needs.
struct Invocation
{
    std::string tool;
    Json arguments = Json::object();
    CorrelationId id;
};

/// Turns raw inbound messages into requests and invocations.
///
/// All failures are reported as DecodeError; the error carries the
/// correlation id whenever it could be read from the envelope.
class RequestDecoder
{
  public:
    explicit RequestDecoder(size_t max_message_bytes) : max_message_bytes_(max_message_bytes) {}

    Request decode(const std::string& raw) const;

    /// Extract the tool name and arguments from a tools/call request.
    Invocation to_invocation(const Request& request) const;

    size_t max_message_bytes() const
    {
        return max_message_bytes_;
    }

  private:
    size_t max_message_bytes_;
};

} // namespace weathermcp::protocol
