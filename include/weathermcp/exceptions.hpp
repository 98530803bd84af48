#pragma once
#include "weathermcp/types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace weathermcp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

/// Invocation named a tool that is not registered.
struct ToolNotFoundError : public NotFoundError
{
    explicit ToolNotFoundError(std::string tool_name)
        : NotFoundError("tool not found: " + tool_name), tool(std::move(tool_name))
    {
    }

    std::string tool;
};

struct DuplicateNameError : public Error
{
    using Error::Error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// Inbound message could not be turned into a request.
/// `id` holds the correlation id when it was recoverable, null otherwise.
struct DecodeError : public Error
{
    DecodeError(int code, const std::string& message, CorrelationId id = nullptr)
        : Error(message), code(code), id(std::move(id))
    {
    }

    int code;
    CorrelationId id;
};

/// Arguments did not match the tool's schema. Carries every violation found.
struct ValidationError : public Error
{
    explicit ValidationError(std::vector<std::string> violations)
        : Error(join(violations)), violations(std::move(violations))
    {
    }

    std::vector<std::string> violations;

  private:
    static std::string join(const std::vector<std::string>& items)
    {
        std::string out;
        for (const auto& item : items)
        {
            if (!out.empty())
                out += "; ";
            out += item;
        }
        return out.empty() ? std::string("invalid arguments") : out;
    }
};

/// Business-logic failure declared by a tool handler. Code and message are
/// passed to the caller verbatim.
struct ToolError : public Error
{
    ToolError(std::string code, const std::string& message)
        : Error(message), code(std::move(code))
    {
    }

    std::string code;
};

} // namespace weathermcp
