#include "weathermcp/util/json_schema.hpp"

#include "weathermcp/util/json.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace weathermcp::util::schema
{

std::string to_string(Kind kind)
{
    switch (kind)
    {
    case Kind::Any:
        return "any";
    case Kind::String:
        return "string";
    case Kind::Number:
        return "number";
    case Kind::Integer:
        return "integer";
    case Kind::Boolean:
        return "boolean";
    case Kind::Object:
        return "object";
    case Kind::Array:
        return "array";
    }
    return "any";
}

static Schema make(Kind kind, std::string description)
{
    Schema s;
    s.kind = kind;
    s.description = std::move(description);
    return s;
}

Schema Schema::any(std::string description)
{
    return make(Kind::Any, std::move(description));
}
Schema Schema::string(std::string description)
{
    return make(Kind::String, std::move(description));
}
Schema Schema::number(std::string description)
{
    return make(Kind::Number, std::move(description));
}
Schema Schema::integer(std::string description)
{
    return make(Kind::Integer, std::move(description));
}
Schema Schema::boolean(std::string description)
{
    return make(Kind::Boolean, std::move(description));
}
Schema Schema::object(std::string description)
{
    return make(Kind::Object, std::move(description));
}
Schema Schema::array(Schema item, std::string description)
{
    Schema s = make(Kind::Array, std::move(description));
    s.items = std::make_shared<const Schema>(std::move(item));
    return s;
}

Schema& Schema::required(std::string name, Schema schema)
{
    properties.push_back(Property{std::move(name), std::move(schema), true});
    return *this;
}

Schema& Schema::optional(std::string name, Schema schema)
{
    properties.push_back(Property{std::move(name), std::move(schema), false});
    return *this;
}

Schema& Schema::extras(bool allow)
{
    allow_extra = allow;
    return *this;
}

Schema& Schema::one_of(std::vector<Json> values)
{
    enum_values = std::move(values);
    return *this;
}

Schema& Schema::with_default(Json value)
{
    default_value = std::move(value);
    return *this;
}

const Property* Schema::find(const std::string& name) const
{
    for (const auto& p : properties)
        if (p.name == name)
            return &p;
    return nullptr;
}

// ---------------------------------------------------------------------------
// JSON Schema rendering
// ---------------------------------------------------------------------------

Json to_json_schema(const Schema& schema)
{
    Json out = Json::object();
    if (schema.kind != Kind::Any)
        out["type"] = to_string(schema.kind);
    if (!schema.description.empty())
        out["description"] = schema.description;
    if (!schema.enum_values.empty())
        out["enum"] = schema.enum_values;
    if (schema.default_value)
        out["default"] = *schema.default_value;

    if (schema.kind == Kind::Object)
    {
        Json props = Json::object();
        Json required = Json::array();
        for (const auto& p : schema.properties)
        {
            props[p.name] = to_json_schema(p.schema);
            if (p.required)
                required.push_back(p.name);
        }
        out["properties"] = props;
        if (!required.empty())
            out["required"] = required;
        out["additionalProperties"] = schema.allow_extra;
    }
    else if (schema.kind == Kind::Array && schema.items)
    {
        out["items"] = to_json_schema(*schema.items);
    }
    return out;
}

static Kind kind_from_string(const std::string& type)
{
    if (type == "string")
        return Kind::String;
    if (type == "number")
        return Kind::Number;
    if (type == "integer")
        return Kind::Integer;
    if (type == "boolean")
        return Kind::Boolean;
    if (type == "object")
        return Kind::Object;
    if (type == "array")
        return Kind::Array;
    throw Error("unsupported schema type: " + type);
}

Schema from_json_schema(const Json& document)
{
    if (!document.is_object())
        throw Error("schema must be a JSON object");

    Schema s;
    if (document.contains("type"))
    {
        if (!document["type"].is_string())
            throw Error("schema 'type' must be a string");
        s.kind = kind_from_string(document["type"].get<std::string>());
    }
    else if (document.contains("properties"))
    {
        s.kind = Kind::Object;
    }

    if (document.contains("description") && document["description"].is_string())
        s.description = document["description"].get<std::string>();
    if (document.contains("enum"))
    {
        if (!document["enum"].is_array())
            throw Error("schema 'enum' must be an array");
        s.enum_values = document["enum"].get<std::vector<Json>>();
    }
    if (document.contains("default"))
        s.default_value = document["default"];

    if (s.kind == Kind::Object)
    {
        std::vector<std::string> required;
        if (document.contains("required"))
        {
            if (!document["required"].is_array())
                throw Error("schema 'required' must be an array");
            for (const auto& r : document["required"])
            {
                if (!r.is_string())
                    throw Error("schema 'required' entries must be strings");
                required.push_back(r.get<std::string>());
            }
        }
        if (document.contains("properties"))
        {
            if (!document["properties"].is_object())
                throw Error("schema 'properties' must be an object");
            for (const auto& [name, sub] : document["properties"].items())
            {
                bool is_required =
                    std::find(required.begin(), required.end(), name) != required.end();
                s.properties.push_back(Property{name, from_json_schema(sub), is_required});
            }
        }
        for (const auto& r : required)
            if (!s.find(r))
                s.properties.push_back(Property{r, Schema::any(), true});

        if (document.contains("additionalProperties"))
        {
            const auto& ap = document["additionalProperties"];
            // A schema-valued additionalProperties is treated as "allowed, untyped".
            s.allow_extra = ap.is_boolean() ? ap.get<bool>() : ap.is_object();
        }
        else
        {
            // JSON Schema default: additional properties are permitted.
            s.allow_extra = true;
        }
    }
    else if (s.kind == Kind::Array && document.contains("items"))
    {
        s.items = std::make_shared<const Schema>(from_json_schema(document["items"]));
    }
    return s;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

namespace
{

bool parse_full_double(const std::string& s, double& out)
{
    if (s.empty() || std::isspace(static_cast<unsigned char>(s.front())))
        return false;
    try
    {
        size_t idx = 0;
        out = std::stod(s, &idx);
        return idx == s.size() && std::isfinite(out);
    }
    catch (const std::logic_error&)
    {
        return false;
    }
}

bool integral_value(double d, int64_t& out)
{
    if (!std::isfinite(d) || std::floor(d) != d)
        return false;
    if (d < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
        d >= static_cast<double>(std::numeric_limits<int64_t>::max()))
        return false;
    out = static_cast<int64_t>(d);
    return true;
}

std::string child_path(const std::string& parent, const std::string& name)
{
    return parent.empty() ? name : parent + "." + name;
}

std::string describe_path(const std::string& path)
{
    return path.empty() ? std::string("arguments") : path;
}

class Checker
{
  public:
    Json check(const Schema& schema, const Json& instance, const std::string& path)
    {
        std::optional<Json> converted = convert(schema, instance, path);
        if (!converted)
            return instance;

        if (!schema.enum_values.empty())
        {
            bool ok = false;
            for (const auto& v : schema.enum_values)
                if (v == *converted)
                {
                    ok = true;
                    break;
                }
            if (!ok)
                violations_.push_back("invalid value for argument " + describe_path(path) +
                                      ": must be one of " + Json(schema.enum_values).dump());
        }
        return *converted;
    }

    std::vector<std::string>& violations()
    {
        return violations_;
    }

  private:
    void type_violation(const Schema& schema, const Json& instance, const std::string& path)
    {
        violations_.push_back("invalid type for argument " + describe_path(path) +
                              ": expected " + to_string(schema.kind) + ", got " +
                              util::json::type_name(instance));
    }

    std::optional<Json> convert(const Schema& schema, const Json& instance,
                                const std::string& path)
    {
        switch (schema.kind)
        {
        case Kind::Any:
            return instance;

        case Kind::String:
            if (instance.is_string())
                return instance;
            break;

        case Kind::Number:
            if (instance.is_number())
                return instance;
            if (instance.is_string())
            {
                double d = 0;
                if (parse_full_double(instance.get<std::string>(), d))
                    return Json(d);
            }
            break;

        case Kind::Integer:
        {
            if (instance.is_number_unsigned() &&
                instance.get<uint64_t>() >
                    static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            {
                violations_.push_back("invalid value for argument " + describe_path(path) +
                                      ": integer out of range");
                return std::nullopt;
            }
            if (instance.is_number_integer())
                return instance;
            int64_t i = 0;
            if (instance.is_number_float() && integral_value(instance.get<double>(), i))
                return Json(i);
            double d = 0;
            if (instance.is_string() && parse_full_double(instance.get<std::string>(), d) &&
                integral_value(d, i))
                return Json(i);
            break;
        }

        case Kind::Boolean:
            if (instance.is_boolean())
                return instance;
            if (instance.is_string())
            {
                const auto& s = instance.get_ref<const std::string&>();
                if (s == "true")
                    return Json(true);
                if (s == "false")
                    return Json(false);
            }
            break;

        case Kind::Object:
            if (instance.is_object())
                return convert_object(schema, instance, path);
            break;

        case Kind::Array:
            if (instance.is_array())
            {
                if (!schema.items)
                    return instance;
                Json out = Json::array();
                for (size_t i = 0; i < instance.size(); ++i)
                    out.push_back(
                        check(*schema.items, instance[i], path + "[" + std::to_string(i) + "]"));
                return out;
            }
            break;
        }

        type_violation(schema, instance, path);
        return std::nullopt;
    }

    Json convert_object(const Schema& schema, const Json& instance, const std::string& path)
    {
        Json out = Json::object();
        for (const auto& prop : schema.properties)
        {
            auto it = instance.find(prop.name);
            std::string p = child_path(path, prop.name);
            if (it == instance.end() || (it->is_null() && !prop.required))
            {
                if (prop.required)
                    violations_.push_back("missing required argument: " + p);
                else if (prop.schema.default_value)
                    out[prop.name] = *prop.schema.default_value;
                continue;
            }
            out[prop.name] = check(prop.schema, *it, p);
        }

        for (const auto& [name, value] : instance.items())
        {
            if (schema.find(name))
                continue;
            if (schema.allow_extra)
                out[name] = value;
            else
                violations_.push_back("unknown argument: " + child_path(path, name));
        }
        return out;
    }

    std::vector<std::string> violations_;
};

} // namespace

Json validate(const Schema& schema, const Json& instance)
{
    Checker checker;
    Json out = checker.check(schema, instance, "");
    if (!checker.violations().empty())
        throw ValidationError(std::move(checker.violations()));
    return out;
}

} // namespace weathermcp::util::schema
