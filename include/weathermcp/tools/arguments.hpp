#pragma once
#include "weathermcp/exceptions.hpp"
#include "weathermcp/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace weathermcp::tools
{

/// Validated, type-converted argument bundle handed to a tool handler.
///
/// Only produced by the validator, so every value already has the kind its
/// schema declares; accessors throw Error when a handler asks for an argument
/// the schema does not guarantee.
class Arguments
{
  public:
    Arguments() : values_(Json::object()) {}
    explicit Arguments(Json values) : values_(std::move(values)) {}

    bool has(const std::string& name) const
    {
        return values_.is_object() && values_.contains(name);
    }

    const Json& at(const std::string& name) const
    {
        auto it = values_.find(name);
        if (it == values_.end())
            throw Error("argument not present: " + name);
        return *it;
    }

    template <typename T>
    T get(const std::string& name) const
    {
        try
        {
            return at(name).get<T>();
        }
        catch (const nlohmann::json::exception& e)
        {
            throw Error("argument '" + name + "' has unexpected type: " + e.what());
        }
    }

    template <typename T>
    T value_or(const std::string& name, T fallback) const
    {
        if (!has(name) || values_.at(name).is_null())
            return fallback;
        return get<T>(name);
    }

    std::string get_string(const std::string& name) const
    {
        return get<std::string>(name);
    }
    double get_number(const std::string& name) const
    {
        return get<double>(name);
    }
    int64_t get_integer(const std::string& name) const
    {
        return get<int64_t>(name);
    }
    bool get_bool(const std::string& name) const
    {
        return get<bool>(name);
    }

    std::vector<std::string> names() const
    {
        std::vector<std::string> out;
        for (const auto& item : values_.items())
            out.push_back(item.key());
        return out;
    }

    size_t size() const
    {
        return values_.size();
    }

    const Json& json() const
    {
        return values_;
    }

  private:
    Json values_;
};

} // namespace weathermcp::tools
