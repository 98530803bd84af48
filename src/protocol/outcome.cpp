#include "weathermcp/protocol/outcome.hpp"

namespace weathermcp::protocol
{

std::string to_string(ProtocolErrorKind kind)
{
    switch (kind)
    {
    case ProtocolErrorKind::Decode:
        return "decode_error";
    case ProtocolErrorKind::MethodNotFound:
        return "method_not_found";
    case ProtocolErrorKind::ToolNotFound:
        return "tool_not_found";
    case ProtocolErrorKind::Validation:
        return "validation_error";
    case ProtocolErrorKind::Internal:
        return "internal_error";
    }
    return "internal_error";
}

namespace
{
struct NameVisitor
{
    std::string operator()(const Success&) const
    {
        return "success";
    }
    std::string operator()(const ToolFailure&) const
    {
        return "tool_error";
    }
    std::string operator()(const ProtocolFailure& f) const
    {
        return to_string(f.kind);
    }
    std::string operator()(const Timeout&) const
    {
        return "timeout";
    }
};
} // namespace

std::string outcome_name(const Outcome& outcome)
{
    return std::visit(NameVisitor{}, outcome);
}

Outcome decode_failed(const DecodeError& e)
{
    return ProtocolFailure{ProtocolErrorKind::Decode, e.code, e.what(), {}};
}

Outcome method_not_found(const std::string& method)
{
    return ProtocolFailure{ProtocolErrorKind::MethodNotFound, kMethodNotFound,
                           "Method '" + method + "' not found", {}};
}

Outcome tool_not_found(const std::string& tool)
{
    return ProtocolFailure{ProtocolErrorKind::ToolNotFound, kInvalidParams,
                           "Unknown tool: " + tool, {}};
}

Outcome validation_failed(std::vector<std::string> violations)
{
    std::string message = "Invalid arguments";
    if (violations.size() == 1)
        message += ": " + violations.front();
    else if (!violations.empty())
        message += " (" + std::to_string(violations.size()) + " violations)";
    return ProtocolFailure{ProtocolErrorKind::Validation, kInvalidParams, message,
                           std::move(violations)};
}

Outcome internal_error(const std::string& message)
{
    return ProtocolFailure{ProtocolErrorKind::Internal, kInternalError, message, {}};
}

} // namespace weathermcp::protocol
