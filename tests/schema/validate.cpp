/// @file validate.cpp
/// @brief Argument validation against tool input schemas

#include "weathermcp/exceptions.hpp"
#include "weathermcp/util/json_schema.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace weathermcp;
using weathermcp::util::schema::Schema;
using weathermcp::util::schema::validate;

static std::vector<std::string> violations_of(const Schema& schema, const Json& args)
{
    try
    {
        validate(schema, args);
    }
    catch (const ValidationError& e)
    {
        return e.violations;
    }
    return {};
}

static bool contains(const std::vector<std::string>& v, const std::string& s)
{
    return std::find(v.begin(), v.end(), s) != v.end();
}

void test_missing_required()
{
    std::cout << "  test_missing_required... " << std::flush;
    auto schema = Schema::object().required("location", Schema::string());
    auto v = violations_of(schema, Json::object());
    assert(v.size() == 1);
    assert(v[0] == "missing required argument: location");
    std::cout << "PASSED\n";
}

void test_collects_every_violation()
{
    std::cout << "  test_collects_every_violation... " << std::flush;
    auto schema = Schema::object()
                      .required("location", Schema::string())
                      .required("days", Schema::integer())
                      .optional("units", Schema::string().one_of({"metric", "imperial"}));
    auto v = violations_of(schema, Json{{"days", "three"}, {"units", "kelvin"}, {"x", 1}});
    assert(v.size() == 4);
    assert(contains(v, "missing required argument: location"));
    assert(contains(v, "invalid type for argument days: expected integer, got string"));
    assert(contains(v, "invalid value for argument units: must be one of [\"metric\",\"imperial\"]"));
    assert(contains(v, "unknown argument: x"));
    std::cout << "PASSED\n";
}

void test_conversions()
{
    std::cout << "  test_conversions... " << std::flush;
    auto schema = Schema::object()
                      .required("n", Schema::number())
                      .required("i", Schema::integer())
                      .required("b", Schema::boolean())
                      .required("f", Schema::number());
    auto out = validate(schema, Json{{"n", "2.5"}, {"i", 4.0}, {"b", "true"}, {"f", 3}});
    assert(out["n"].get<double>() == 2.5);
    assert(out["i"].is_number_integer() && out["i"].get<int>() == 4);
    assert(out["b"].get<bool>() == true);
    assert(out["f"].get<double>() == 3.0);

    // Lossy conversions are refused
    auto v = violations_of(schema, Json{{"n", "2.5x"}, {"i", 4.5}, {"b", "yes"}, {"f", 1}});
    assert(v.size() == 3);
    std::cout << "PASSED\n";
}

void test_integer_range()
{
    std::cout << "  test_integer_range... " << std::flush;
    auto schema = Schema::object().required("i", Schema::integer());
    auto v = violations_of(schema, Json{{"i", 18446744073709551615ULL}});
    assert(v.size() == 1);
    assert(v[0] == "invalid value for argument i: integer out of range");

    v = violations_of(schema, Json{{"i", 9223372036854775808ULL}});
    assert(v.size() == 1);

    auto out = validate(schema, Json{{"i", 9223372036854775807ULL}});
    assert(out["i"].get<int64_t>() == std::numeric_limits<int64_t>::max());
    std::cout << "PASSED\n";
}

void test_defaults_and_null_optional()
{
    std::cout << "  test_defaults_and_null_optional... " << std::flush;
    auto schema = Schema::object()
                      .required("city", Schema::string())
                      .optional("days", Schema::integer().with_default(3))
                      .optional("note", Schema::string());
    auto out = validate(schema, Json{{"city", "110000"}, {"note", nullptr}});
    assert(out["days"] == 3);
    assert(!out.contains("note"));

    // A null required argument is a type error, not a missing one
    auto v = violations_of(schema, Json{{"city", nullptr}});
    assert(v.size() == 1);
    assert(v[0] == "invalid type for argument city: expected string, got null");
    std::cout << "PASSED\n";
}

void test_nested_paths()
{
    std::cout << "  test_nested_paths... " << std::flush;
    auto point = Schema::object().required("lat", Schema::number()).required("lon", Schema::number());
    auto schema = Schema::object().required("points", Schema::array(point));
    auto v = violations_of(schema, Json{{"points", Json::array({Json{{"lat", 1}, {"lon", 2}},
                                                                Json{{"lat", "north"}}})}});
    assert(v.size() == 2);
    assert(contains(v, "invalid type for argument points[1].lat: expected number, got string"));
    assert(contains(v, "missing required argument: points[1].lon"));
    std::cout << "PASSED\n";
}

void test_extras_allowed()
{
    std::cout << "  test_extras_allowed... " << std::flush;
    auto schema = Schema::object().required("a", Schema::string()).extras();
    auto out = validate(schema, Json{{"a", "x"}, {"b", 1}});
    assert(out["b"] == 1);
    std::cout << "PASSED\n";
}

void test_top_level_type()
{
    std::cout << "  test_top_level_type... " << std::flush;
    auto schema = Schema::object();
    auto v = violations_of(schema, Json::array());
    assert(v.size() == 1);
    assert(v[0] == "invalid type for argument arguments: expected object, got array");

    bool threw = false;
    try
    {
        validate(Schema::object().required("a", Schema::string()), Json::object());
    }
    catch (const ValidationError& e)
    {
        threw = true;
        assert(std::string(e.what()) == "missing required argument: a");
    }
    assert(threw);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Schema validation tests:\n";
    test_missing_required();
    test_collects_every_violation();
    test_conversions();
    test_integer_range();
    test_defaults_and_null_optional();
    test_nested_paths();
    test_extras_allowed();
    test_top_level_type();
    std::cout << "All validation tests passed!\n";
    return 0;
}
