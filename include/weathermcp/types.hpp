#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace weathermcp
{

using Json = nlohmann::json;

/// Correlation identifier supplied by the caller (JSON-RPC "id").
/// A null Json is the sentinel for "could not be recovered".
using CorrelationId = Json;

inline bool is_valid_correlation_id(const Json& id)
{
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

} // namespace weathermcp
