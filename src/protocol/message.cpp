#include "weathermcp/protocol/message.hpp"

#include "weathermcp/util/json.hpp"

namespace weathermcp::protocol
{

Request RequestDecoder::decode(const std::string& raw) const
{
    // Oversized input is rejected before parsing so it never costs more memory
    // than the line already read.
    if (raw.size() > max_message_bytes_)
        throw DecodeError(kInvalidRequest, "message exceeds maximum size of " +
                                               std::to_string(max_message_bytes_) + " bytes");

    Json message;
    try
    {
        message = util::json::parse(raw);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw DecodeError(kParseError, std::string("parse error: ") + e.what());
    }

    if (!message.is_object())
        throw DecodeError(kInvalidRequest, "request must be a JSON object");

    CorrelationId id = nullptr;
    auto id_it = message.find("id");
    if (id_it != message.end() && !id_it->is_null())
    {
        if (!is_valid_correlation_id(*id_it))
            throw DecodeError(kInvalidRequest, "id must be a string or an integer");
        id = *id_it;
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() || version->get<std::string>() != "2.0")
        throw DecodeError(kInvalidRequest, "jsonrpc must be \"2.0\"", id);

    auto method = message.find("method");
    if (method == message.end() || !method->is_string() || method->get<std::string>().empty())
        throw DecodeError(kInvalidRequest, "method must be a non-empty string", id);

    Request request;
    request.id = std::move(id);
    request.method = method->get<std::string>();

    auto params = message.find("params");
    if (params != message.end() && !params->is_null())
    {
        if (!params->is_object())
            throw DecodeError(kInvalidParams, "params must be an object", request.id);
        request.params = *params;
    }
    return request;
}

Invocation RequestDecoder::to_invocation(const Request& request) const
{
    if (request.id.is_null())
        throw DecodeError(kInvalidRequest, "tools/call requires a correlation id");

    auto name = request.params.find("name");
    if (name == request.params.end() || !name->is_string() || name->get<std::string>().empty())
        throw DecodeError(kInvalidParams, "missing tool name", request.id);

    Invocation invocation;
    invocation.tool = name->get<std::string>();
    invocation.id = request.id;

    auto args = request.params.find("arguments");
    if (args != request.params.end() && !args->is_null())
    {
        if (!args->is_object())
            throw DecodeError(kInvalidParams, "arguments must be an object", request.id);
        invocation.arguments = *args;
    }
    return invocation;
}

} // namespace weathermcp::protocol
