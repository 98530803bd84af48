#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace weathermcp::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
inline std::string dump(const json& j)
{
    return j.dump();
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent);
}

/// Human-readable name of a value's JSON type, as used in violation messages.
inline std::string type_name(const json& j)
{
    if (j.is_number_integer() || j.is_number_unsigned())
        return "integer";
    if (j.is_number_float())
        return "number";
    return j.type_name();
}

} // namespace weathermcp::util::json
