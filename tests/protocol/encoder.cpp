/// @file encoder.cpp
/// @brief Outcome -> JSON-RPC response framing

#include "weathermcp/exceptions.hpp"
#include "weathermcp/protocol/encoder.hpp"
#include "weathermcp/protocol/outcome.hpp"
#include "weathermcp/util/json.hpp"

#include <cassert>
#include <iostream>

using namespace weathermcp;
using namespace weathermcp::protocol;

static Json wire(const Outcome& outcome, const CorrelationId& id)
{
    return util::json::parse(encode(outcome, id));
}

int main()
{
    // Object result passes through as structured content
    {
        Json r = wire(Success{Json{{"tempC", 18}}}, "abc123");
        assert(r["jsonrpc"] == "2.0");
        assert(r["id"] == "abc123");
        assert(r["result"]["isError"] == false);
        assert(r["result"]["structuredContent"] == Json({{"tempC", 18}}));
        assert(r["result"]["_meta"]["outcome"] == "success");
        assert(!r["result"]["_meta"].contains("wrappedResult"));
        assert(r["result"]["content"][0]["type"] == "text");
        assert(util::json::parse(r["result"]["content"][0]["text"].get<std::string>())["tempC"] == 18);
        std::cout << "[PASS] success object\n";
    }

    // Strings and scalars are wrapped
    {
        Json r = wire(Success{Json("No forecast data available.")}, 5);
        assert(r["id"] == 5);
        assert(r["result"]["content"][0]["text"] == "No forecast data available.");
        assert(r["result"]["structuredContent"]["result"] == "No forecast data available.");
        assert(r["result"]["_meta"]["wrappedResult"] == true);

        r = wire(Success{Json(42)}, 6);
        assert(r["result"]["content"][0]["text"] == "42");
        assert(r["result"]["structuredContent"]["result"] == 42);
        std::cout << "[PASS] success scalar\n";
    }

    // Tool errors keep the handler's code and message
    {
        Json r = wire(ToolFailure{"upstream_unavailable", "weather service down"}, "t1");
        assert(r["result"]["isError"] == true);
        assert(r["result"]["content"][0]["text"] == "weather service down");
        assert(r["result"]["_meta"]["outcome"] == "tool_error");
        assert(r["result"]["_meta"]["code"] == "upstream_unavailable");
        assert(!r.contains("error"));
        std::cout << "[PASS] tool error\n";
    }

    // Timeout
    {
        Json r = wire(Timeout{std::chrono::milliseconds(250)}, "t2");
        assert(r["result"]["isError"] == true);
        assert(r["result"]["_meta"]["outcome"] == "timeout");
        assert(r["result"]["_meta"]["timeoutMs"] == 250);
        std::cout << "[PASS] timeout\n";
    }

    // Protocol failures become JSON-RPC errors
    {
        Json r = wire(validation_failed({"missing required argument: location"}), "abc124");
        assert(r["id"] == "abc124");
        assert(!r.contains("result"));
        assert(r["error"]["code"] == kInvalidParams);
        assert(r["error"]["data"]["outcome"] == "validation_error");
        assert(r["error"]["data"]["violations"] ==
               Json::array({"missing required argument: location"}));

        r = wire(tool_not_found("unknown_tool"), "abc125");
        assert(r["error"]["code"] == kInvalidParams);
        assert(r["error"]["data"]["outcome"] == "tool_not_found");
        assert(r["error"]["message"] == "Unknown tool: unknown_tool");

        r = wire(method_not_found("resources/list"), 1);
        assert(r["error"]["code"] == kMethodNotFound);
        assert(r["error"]["data"]["outcome"] == "method_not_found");

        r = wire(decode_failed(DecodeError(kInvalidRequest, "bad", "d1")), "d1");
        assert(r["error"]["code"] == kInvalidRequest);
        assert(r["error"]["data"]["outcome"] == "decode_error");

        r = wire(internal_error("boom"), 2);
        assert(r["error"]["code"] == kInternalError);
        std::cout << "[PASS] protocol errors\n";
    }

    // Unencodable values fall back to a minimal internal error with the same id
    {
        std::string bad_utf8 = "\xff\xfe";
        std::string out = encode(Success{Json(bad_utf8)}, "u1");
        Json r = util::json::parse(out);
        assert(r["id"] == "u1");
        assert(r["error"]["code"] == kInternalError);
        assert(r["error"]["data"]["outcome"] == "internal_error");

        out = encode_result(Json{{"text", bad_utf8}}, 9);
        r = util::json::parse(out);
        assert(r["id"] == 9);
        assert(r["error"]["code"] == kInternalError);
        std::cout << "[PASS] fallback on encode failure\n";
    }

    // Outcome names
    {
        assert(outcome_name(Success{}) == "success");
        assert(outcome_name(ToolFailure{}) == "tool_error");
        assert(outcome_name(Timeout{}) == "timeout");
        assert(outcome_name(tool_not_found("x")) == "tool_not_found");
        std::cout << "[PASS] outcome names\n";
    }

    return 0;
}
