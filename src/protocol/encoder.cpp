#include "weathermcp/protocol/encoder.hpp"

#include "weathermcp/logging.hpp"

namespace weathermcp::protocol
{

namespace
{
constexpr const char* kFallbackResponse =
    R"({"jsonrpc":"2.0","id":null,"error":{"code":-32603,"message":"Internal error","data":{"outcome":"internal_error"}}})";

Json text_content(const std::string& text)
{
    return Json::array({Json{{"type", "text"}, {"text", text}}});
}

Json envelope(const CorrelationId& id)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}};
}

struct EncodeVisitor
{
    const CorrelationId& id;

    Json operator()(const Success& s) const
    {
        Json result = Json::object();
        result["content"] =
            text_content(s.value.is_string() ? s.value.get<std::string>() : s.value.dump());
        Json meta = {{"outcome", "success"}};
        if (s.value.is_object())
        {
            result["structuredContent"] = s.value;
        }
        else
        {
            // structuredContent must be an object; scalars and arrays are wrapped.
            result["structuredContent"] = Json{{"result", s.value}};
            meta["wrappedResult"] = true;
        }
        result["isError"] = false;
        result["_meta"] = meta;

        Json out = envelope(id);
        out["result"] = std::move(result);
        return out;
    }

    Json operator()(const ToolFailure& f) const
    {
        Json out = envelope(id);
        out["result"] = Json{{"content", text_content(f.message)},
                             {"isError", true},
                             {"_meta", Json{{"outcome", "tool_error"}, {"code", f.code}}}};
        return out;
    }

    Json operator()(const Timeout& t) const
    {
        Json out = envelope(id);
        out["result"] = Json{
            {"content", text_content("Tool call exceeded its time budget of " +
                                     std::to_string(t.budget.count()) + " ms")},
            {"isError", true},
            {"_meta", Json{{"outcome", "timeout"}, {"timeoutMs", t.budget.count()}}}};
        return out;
    }

    Json operator()(const ProtocolFailure& f) const
    {
        Json data = {{"outcome", to_string(f.kind)}};
        if (f.kind == ProtocolErrorKind::Validation)
            data["violations"] = f.violations;

        Json out = envelope(id);
        out["error"] = Json{{"code", f.code}, {"message", f.message}, {"data", data}};
        return out;
    }
};
} // namespace

Json encode_json(const Outcome& outcome, const CorrelationId& id)
{
    return std::visit(EncodeVisitor{id}, outcome);
}

std::string minimal_internal_error(const CorrelationId& id) noexcept
{
    try
    {
        Json out = envelope(id);
        out["error"] = Json{{"code", kInternalError},
                            {"message", "Internal error"},
                            {"data", Json{{"outcome", "internal_error"}}}};
        return out.dump();
    }
    catch (const std::exception&)
    {
        return kFallbackResponse;
    }
}

std::string encode(const Outcome& outcome, const CorrelationId& id) noexcept
{
    try
    {
        return encode_json(outcome, id).dump();
    }
    catch (const std::exception& e)
    {
        try
        {
            logging::error(std::string("response encoding failed (") + outcome_name(outcome) +
                           "): " + e.what());
        }
        catch (const std::exception&)
        {
            // logging must not prevent the fallback response
        }
        return minimal_internal_error(id);
    }
}

std::string encode_result(const Json& result, const CorrelationId& id) noexcept
{
    try
    {
        Json out = envelope(id);
        out["result"] = result;
        return out.dump();
    }
    catch (const std::exception& e)
    {
        try
        {
            logging::error(std::string("result encoding failed: ") + e.what());
        }
        catch (const std::exception&)
        {
            // logging must not prevent the fallback response
        }
        return minimal_internal_error(id);
    }
}

} // namespace weathermcp::protocol
