#include "xdmcp/protocol/dynamic_value.h"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

using namespace xdmcp::protocol;
using json = nlohmann::json;

namespace {

DynamicValue round_trip(const DynamicValue& value) {
  const std::string text = dynamic_value_to_json(value).dump();
  return dynamic_value_from_json(json::parse(text));
}

}  // namespace

TEST_CASE("DynamicValue round-trips every scalar kind through JSON text", "[protocol][dynamic_value]") {
  CHECK(round_trip(DynamicValue{nullptr}) == DynamicValue{nullptr});
  CHECK(round_trip(DynamicValue{true}) == DynamicValue{true});
  CHECK(round_trip(DynamicValue{false}) == DynamicValue{false});
  CHECK(round_trip(DynamicValue{42}) == DynamicValue{42});
  CHECK(round_trip(DynamicValue{std::int64_t{-9007199254740993}}) ==
        DynamicValue{std::int64_t{-9007199254740993}});
  CHECK(round_trip(DynamicValue{2.5}) == DynamicValue{2.5});
  CHECK(round_trip(DynamicValue{"hello \"world\"\n"}) == DynamicValue{"hello \"world\"\n"});
}

TEST_CASE("DynamicValue round-trips nested arrays and objects", "[protocol][dynamic_value]") {
  const DynamicValue value = DynamicValue::Object{
      {"name", "search_documentation"},
      {"arguments",
       DynamicValue::Object{
           {"query", "NSWindow"},
           {"limit", 5},
           {"ratio", 0.25},
           {"tags", DynamicValue::Array{"a", 1, false, nullptr, DynamicValue::Array{}}},
       }},
      {"empty", DynamicValue::Object{}},
  };

  CHECK(round_trip(value) == value);
}

TEST_CASE("DynamicValue keeps integers and floats apart", "[protocol][dynamic_value]") {
  const auto integer = dynamic_value_from_json(json::parse("1"));
  const auto floating = dynamic_value_from_json(json::parse("1.0"));

  CHECK(integer.is_integer());
  CHECK(floating.is_float());
  CHECK(integer != floating);
  CHECK(dynamic_value_to_json(floating).dump() == "1.0");
}

TEST_CASE("DynamicValue decodes unsigned integers beyond int64 as floats", "[protocol][dynamic_value]") {
  const auto value = dynamic_value_from_json(json::parse("18446744073709551615"));
  REQUIRE(value.is_float());
  CHECK(*value.as_float() > static_cast<double>(std::numeric_limits<std::int64_t>::max()));

  const auto small = dynamic_value_from_json(json(std::uint64_t{7}));
  REQUIRE(small.is_integer());
  CHECK(*small.as_integer() == 7);
}

TEST_CASE("DynamicValue accessors return nullptr for other kinds", "[protocol][dynamic_value]") {
  const DynamicValue text{"x"};
  CHECK(text.as_integer() == nullptr);
  CHECK(text.as_object() == nullptr);
  CHECK(text.find("x") == nullptr);
  REQUIRE(text.as_string() != nullptr);
  CHECK(*text.as_string() == "x");
}

TEST_CASE("DynamicValue::find looks up object members", "[protocol][dynamic_value]") {
  const DynamicValue object = DynamicValue::Object{{"limit", 3}};
  REQUIRE(object.find("limit") != nullptr);
  CHECK(*object.find("limit")->as_integer() == 3);
  CHECK(object.find("missing") == nullptr);
}

TEST_CASE("DynamicValue equality is structural", "[protocol][dynamic_value]") {
  const DynamicValue a = DynamicValue::Object{{"x", DynamicValue::Array{1, 2}}};
  const DynamicValue b = DynamicValue::Object{{"x", DynamicValue::Array{1, 2}}};
  const DynamicValue c = DynamicValue::Object{{"x", DynamicValue::Array{2, 1}}};

  CHECK(a == b);
  CHECK(a != c);
  CHECK(DynamicValue{} == DynamicValue{nullptr});
}
