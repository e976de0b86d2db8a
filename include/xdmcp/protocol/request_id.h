#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace xdmcp::protocol {

// RequestId correlates a request with its response. It is an opaque token: integer ids are
// never interpreted numerically.
class RequestId {
 public:
  // Default-constructed ids are the null id.
  RequestId() = default;

  static RequestId from_string(std::string value) { return RequestId(Storage{std::move(value)}); }
  static RequestId from_integer(std::int64_t value) { return RequestId(Storage{value}); }
  static RequestId null() { return RequestId{}; }

  [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(value_); }
  [[nodiscard]] const std::string* as_string() const { return std::get_if<std::string>(&value_); }
  [[nodiscard]] const std::int64_t* as_integer() const {
    return std::get_if<std::int64_t>(&value_);
  }

  friend bool operator==(const RequestId& a, const RequestId& b) { return a.value_ == b.value_; }
  friend bool operator!=(const RequestId& a, const RequestId& b) { return !(a == b); }

 private:
  using Storage = std::variant<std::monostate, std::string, std::int64_t>;

  explicit RequestId(Storage value) : value_(std::move(value)) {}

  Storage value_;
};

// Decode an id from parsed JSON. Accepts strings, integers, and null; every other kind
// (bool, float, array, object) returns nullopt.
[[nodiscard]] std::optional<RequestId> request_id_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json request_id_to_json(const RequestId& id);

}  // namespace xdmcp::protocol
