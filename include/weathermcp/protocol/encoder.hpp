#pragma once
#include "weathermcp/protocol/outcome.hpp"
#include "weathermcp/types.hpp"

#include <string>

namespace weathermcp::protocol
{

/// Build the JSON-RPC response object for an outcome. May throw on
/// pathological values; use encode() on the wire.
Json encode_json(const Outcome& outcome, const CorrelationId& id);

/// Serialize an outcome as a JSON-RPC response line. Never throws: if
/// encoding fails, a minimal internal_error response is returned instead.
std::string encode(const Outcome& outcome, const CorrelationId& id) noexcept;

/// Serialize a plain JSON-RPC result (initialize, ping, tools/list).
std::string encode_result(const Json& result, const CorrelationId& id) noexcept;

/// The guaranteed-encodable fallback response.
std::string minimal_internal_error(const CorrelationId& id) noexcept;

} // namespace weathermcp::protocol
