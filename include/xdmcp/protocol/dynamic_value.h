#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace xdmcp::protocol {

// DynamicValue is a tagged union over every JSON value kind.
// Integers and floats are kept apart so that a round trip through JSON text never turns
// 1 into 1.0 (or the reverse). Object keys are held in a sorted map; key order carries no
// meaning.
class DynamicValue {
 public:
  using Array = std::vector<DynamicValue>;
  using Object = std::map<std::string, DynamicValue>;
  using Storage =
      std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object>;

  DynamicValue() = default;
  DynamicValue(std::nullptr_t) {}                        // NOLINT(google-explicit-constructor)
  DynamicValue(bool value) : storage_(value) {}          // NOLINT(google-explicit-constructor)
  DynamicValue(int value) : storage_(std::int64_t{value}) {}  // NOLINT(google-explicit-constructor)
  DynamicValue(std::int64_t value) : storage_(value) {}  // NOLINT(google-explicit-constructor)
  DynamicValue(double value) : storage_(value) {}        // NOLINT(google-explicit-constructor)
  DynamicValue(const char* value) : storage_(std::string{value}) {}  // NOLINT(google-explicit-constructor)
  DynamicValue(std::string value) : storage_(std::move(value)) {}  // NOLINT(google-explicit-constructor)
  DynamicValue(Array value) : storage_(std::move(value)) {}  // NOLINT(google-explicit-constructor)
  DynamicValue(Object value) : storage_(std::move(value)) {}  // NOLINT(google-explicit-constructor)

  [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(storage_); }
  [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(storage_); }
  [[nodiscard]] bool is_integer() const { return std::holds_alternative<std::int64_t>(storage_); }
  [[nodiscard]] bool is_float() const { return std::holds_alternative<double>(storage_); }
  [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(storage_); }
  [[nodiscard]] bool is_array() const { return std::holds_alternative<Array>(storage_); }
  [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(storage_); }

  // Typed accessors return nullptr when the value holds a different kind.
  [[nodiscard]] const bool* as_bool() const { return std::get_if<bool>(&storage_); }
  [[nodiscard]] const std::int64_t* as_integer() const {
    return std::get_if<std::int64_t>(&storage_);
  }
  [[nodiscard]] const double* as_float() const { return std::get_if<double>(&storage_); }
  [[nodiscard]] const std::string* as_string() const {
    return std::get_if<std::string>(&storage_);
  }
  [[nodiscard]] const Array* as_array() const { return std::get_if<Array>(&storage_); }
  [[nodiscard]] const Object* as_object() const { return std::get_if<Object>(&storage_); }

  // find returns the member named key, or nullptr when this is not an object or the key is
  // absent.
  [[nodiscard]] const DynamicValue* find(const std::string& key) const;

  [[nodiscard]] const Storage& storage() const { return storage_; }

  friend bool operator==(const DynamicValue& a, const DynamicValue& b) {
    return a.storage_ == b.storage_;
  }
  friend bool operator!=(const DynamicValue& a, const DynamicValue& b) { return !(a == b); }

 private:
  Storage storage_{nullptr};
};

// Convert parsed JSON into a DynamicValue. Kinds are tried in a fixed order: null, bool,
// integer, float, string, array, object. Unsigned integers beyond the int64 range decode
// as float.
[[nodiscard]] DynamicValue dynamic_value_from_json(const nlohmann::json& j);

// Convert a DynamicValue back into a JSON tree.
[[nodiscard]] nlohmann::json dynamic_value_to_json(const DynamicValue& value);

}  // namespace xdmcp::protocol
