#pragma once
#include "weathermcp/exceptions.hpp"
#include "weathermcp/protocol/message.hpp"
#include "weathermcp/types.hpp"

#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace weathermcp::protocol
{

// Tool error codes produced by the server itself (handlers supply their own).
constexpr const char* kToolInternalError = "internal_error";
constexpr const char* kToolResultTooLarge = "result_too_large";
constexpr const char* kToolOverloaded = "overloaded";

struct Success
{
    Json value;
};

/// Handler-reported failure, or an internal fault caught at the dispatch boundary.
struct ToolFailure
{
    std::string code;
    std::string message;
};

enum class ProtocolErrorKind
{
    Decode,
    MethodNotFound,
    ToolNotFound,
    Validation,
    Internal
};

std::string to_string(ProtocolErrorKind kind);

/// Failure before the handler ran (or outside it): carried as a JSON-RPC error.
struct ProtocolFailure
{
    ProtocolErrorKind kind{ProtocolErrorKind::Internal};
    int code{kInternalError};
    std::string message;
    std::vector<std::string> violations;
};

struct Timeout
{
    std::chrono::milliseconds budget{0};
};

/// Uniform result of one invocation: exactly one alternative is ever held.
using Outcome = std::variant<Success, ToolFailure, ProtocolFailure, Timeout>;

/// Discriminant reported to callers: "success", "tool_error", "timeout",
/// or the protocol error kind ("decode_error", "tool_not_found", ...).
std::string outcome_name(const Outcome& outcome);

Outcome decode_failed(const DecodeError& e);
Outcome method_not_found(const std::string& method);
Outcome tool_not_found(const std::string& tool);
Outcome validation_failed(std::vector<std::string> violations);
Outcome internal_error(const std::string& message);

} // namespace weathermcp::protocol
