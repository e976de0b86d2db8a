#include "xdmcp/protocol/request_id.h"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

using namespace xdmcp::protocol;
using json = nlohmann::json;

TEST_CASE("RequestId round-trips each variant", "[protocol][request_id]") {
  const RequestId ids[] = {RequestId::from_string("abc-1"), RequestId::from_integer(17),
                           RequestId::from_integer(-3), RequestId::null()};

  for (const auto& id : ids) {
    const auto decoded = request_id_from_json(json::parse(request_id_to_json(id).dump()));
    REQUIRE(decoded.has_value());
    CHECK(decoded.value() == id);
  }
}

TEST_CASE("RequestId keeps string and integer ids distinct", "[protocol][request_id]") {
  CHECK(RequestId::from_string("1") != RequestId::from_integer(1));
  CHECK(RequestId::null() != RequestId::from_string(""));

  const auto from_text = request_id_from_json(json::parse(R"("1")"));
  REQUIRE(from_text.has_value());
  REQUIRE(from_text->as_string() != nullptr);
  CHECK(*from_text->as_string() == "1");
}

TEST_CASE("RequestId decoding rejects non-id kinds", "[protocol][request_id]") {
  CHECK_FALSE(request_id_from_json(json::parse("[1]")).has_value());
  CHECK_FALSE(request_id_from_json(json::parse(R"({"id": 1})")).has_value());
  CHECK_FALSE(request_id_from_json(json::parse("true")).has_value());
  CHECK_FALSE(request_id_from_json(json::parse("1.5")).has_value());
}

TEST_CASE("RequestId null encodes as JSON null", "[protocol][request_id]") {
  CHECK(request_id_to_json(RequestId::null()).is_null());
  CHECK(RequestId{}.is_null());
}
