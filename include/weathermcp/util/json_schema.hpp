#pragma once
#include "weathermcp/exceptions.hpp"
#include "weathermcp/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weathermcp::util::schema
{

enum class Kind
{
    Any,
    String,
    Number,
    Integer,
    Boolean,
    Object,
    Array
};

std::string to_string(Kind kind);

struct Property;

/// Structural description of a tool argument (or of a whole argument bundle).
///
/// A small tagged-variant language: `kind` selects which of the other fields
/// apply. Objects carry named properties (each required or optional), arrays
/// carry an item schema. Rendered as JSON Schema for tools/list.
struct Schema
{
    Kind kind{Kind::Any};
    std::string description;
    std::vector<Property> properties;     // Object
    bool allow_extra{false};              // Object: accept unknown properties
    std::shared_ptr<const Schema> items;  // Array
    std::vector<Json> enum_values;        // empty = unrestricted
    std::optional<Json> default_value;    // filled in when an optional property is absent

    static Schema any(std::string description = {});
    static Schema string(std::string description = {});
    static Schema number(std::string description = {});
    static Schema integer(std::string description = {});
    static Schema boolean(std::string description = {});
    static Schema object(std::string description = {});
    static Schema array(Schema item, std::string description = {});

    /// Builder helpers for object schemas.
    Schema& required(std::string name, Schema schema);
    Schema& optional(std::string name, Schema schema);
    Schema& extras(bool allow = true);
    Schema& one_of(std::vector<Json> values);
    Schema& with_default(Json value);

    const Property* find(const std::string& name) const;
};

struct Property
{
    std::string name;
    Schema schema;
    bool required{true};
};

/// Render as a JSON Schema (draft-07 subset) document.
Json to_json_schema(const Schema& schema);

/// Build a Schema from a JSON Schema document using the same subset
/// (type, properties, required, items, enum, default, additionalProperties).
/// Throws Error on constructs outside that subset.
Schema from_json_schema(const Json& document);

/// Check `instance` against `schema` and return the converted value.
///
/// Collects every violation before failing; throws ValidationError carrying
/// the full list. Values are converted where lossless (integer -> number,
/// integral number -> integer, numeric/boolean strings -> number/integer/boolean)
/// and declared defaults are filled in for absent optional properties.
Json validate(const Schema& schema, const Json& instance);

} // namespace weathermcp::util::schema
